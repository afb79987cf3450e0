#include "session_orchestrator.hpp"

#include <format>
#include <print>
#include <type_traits>
#include <utility>

namespace {

constexpr auto pump_wait = std::chrono::milliseconds(50);
constexpr auto pause_poll = std::chrono::milliseconds(5);

DeviceChangeCoordinator::Options coordinator_options(const Config& config) {
    const auto& d = config.devices;
    DeviceChangeCoordinator::Options opts;
    opts.debounce = std::chrono::milliseconds(d.debounce_ms);
    opts.settle = std::chrono::milliseconds(d.settle_ms);
    opts.first_frame_timeout = std::chrono::milliseconds(d.first_frame_timeout_ms);
    opts.max_attempts = d.max_restart_attempts;
    opts.backoff = to_durations(d.restart_backoff_ms);
    return opts;
}

} // namespace

SessionOrchestrator::SessionOrchestrator(Config config, AudioBackend& backend,
                                         PermissionService& permissions,
                                         TransportFactory transport_factory, NotifyCallback notify)
    : config_(std::move(config)), backend_(backend), permissions_(permissions),
      transport_factory_(std::move(transport_factory)), notify_(std::move(notify)) {}

SessionOrchestrator::~SessionOrchestrator() {
    stop();
}

std::expected<void, Error> SessionOrchestrator::start() {
    std::lock_guard lock(control_mu_);
    return start_locked();
}

void SessionOrchestrator::stop() {
    std::lock_guard lock(control_mu_);
    stop_locked();
}

std::expected<void, Error> SessionOrchestrator::reconfigure(Config config) {
    std::lock_guard lock(control_mu_);

    if (!running_) {
        config_ = std::move(config);
        return {};
    }

    if (config_.capture_differs(config)) {
        std::println(stderr, "session: capture settings changed, restarting session");
        stop_locked();
        config_ = std::move(config);
        return start_locked();
    }

    if (config_.transport_differs(config)) {
        std::println(stderr, "session: transport settings changed, replacing transports");
        config_ = std::move(config);
        for (auto& p : pipelines_) {
            if (p) swap_transport(*p);
        }
        return {};
    }

    config_ = std::move(config);
    return {};
}

SessionOrchestrator::Status SessionOrchestrator::status() const {
    std::lock_guard lock(control_mu_);
    Status st;
    st.running = running_;
    {
        std::lock_guard clock(coordinator_mu_);
        if (coordinator_) st.devices = coordinator_->metrics();
    }

    for (const auto& p : pipelines_) {
        if (!p) continue;
        SourceStatus s;
        s.source = p->id;
        s.capture = p->capture->state();
        s.device = p->capture->device();
        s.capture_stats = p->capture->stats();
        s.channel_dropped = p->channel->dropped();
        std::shared_ptr<StreamTransport> t;
        {
            std::lock_guard tlock(p->transport_mu);
            t = p->transport;
        }
        if (t) {
            s.transport = t->state();
            s.transport_stats = t->stats();
        }
        st.sources.push_back(std::move(s));
    }
    return st;
}

std::vector<SessionEvent> SessionOrchestrator::drain_events() {
    std::lock_guard lock(events_mu_);
    return std::exchange(events_, {});
}

bool SessionOrchestrator::running() const {
    std::lock_guard lock(control_mu_);
    return running_;
}

Config SessionOrchestrator::config() const {
    std::lock_guard lock(control_mu_);
    return config_;
}

std::expected<void, Error> SessionOrchestrator::start_locked() {
    if (running_) return {};

    DeviceChangeCoordinator::Listener listener{
        .on_restarted = [](SourceId id, const DeviceIdentity& dev) {
            std::println(stderr, "session: {} capturing from {}", source_name(id), dev.id);
        },
        .on_degraded = [this](SourceId id, const DeviceIdentity& dev) {
            push_event(session_event::SourceDegraded{id, dev});
        },
        .on_failed = [this](SourceId id, const Error& err) {
            push_event(session_event::CaptureFailed{id, err});
        },
    };
    {
        std::lock_guard lock(coordinator_mu_);
        coordinator_ = std::make_unique<DeviceChangeCoordinator>(coordinator_options(config_),
                                                                 std::move(listener));
    }

    std::optional<Error> first_error;
    size_t started = 0;
    for (auto id : all_sources) {
        if (!enabled(config_, id)) continue;
        auto res = start_pipeline(id);
        if (res) {
            ++started;
        } else {
            std::println(stderr, "session: {} not started: {}", source_name(id), res.error().message);
            push_event(session_event::CaptureFailed{id, res.error()});
            if (!first_error) first_error = res.error();
        }
    }

    if (started == 0) {
        std::unique_ptr<DeviceChangeCoordinator> unused;
        {
            std::lock_guard lock(coordinator_mu_);
            unused = std::move(coordinator_);
        }
        unused.reset();
        return std::unexpected(first_error.value_or(
            Error{ErrorCode::CaptureUnavailable, "no capture source enabled"}));
    }

    backend_.set_topology_listener([this](const TopologyChange& c) { on_topology_change(c); });
    running_ = true;
    std::println(stderr, "session: started with {} source(s)", started);
    return {};
}

void SessionOrchestrator::stop_locked() {
    if (!running_) return;
    running_ = false;

    backend_.set_topology_listener(nullptr);
    // coordinator_ is only replaced on this thread. Platform callbacks take
    // coordinator_mu_ with the loop lock held, so stop without it.
    DeviceChangeCoordinator* coordinator = nullptr;
    {
        std::lock_guard lock(coordinator_mu_);
        coordinator = coordinator_.get();
    }
    if (coordinator) coordinator->stop();

    for (auto& p : pipelines_) {
        if (p) stop_pipeline(*p);
    }

    // Sources are stopped; nothing can reach the gate any more.
    std::unique_ptr<DeviceChangeCoordinator> stopped;
    {
        std::lock_guard lock(coordinator_mu_);
        stopped = std::move(coordinator_);
    }
    stopped.reset();
    for (auto& p : pipelines_) p.reset();

    std::println(stderr, "session: stopped");
}

std::expected<void, Error> SessionOrchestrator::start_pipeline(SourceId id) {
    auto p = std::make_unique<Pipeline>();
    p->id = id;
    p->channel = std::make_unique<FrameChannel>(config_.audio.frame_channel_depth);
    p->capture = std::make_unique<CaptureSource>(
        id, backend_, permissions_, coordinator_->gate(),
        CaptureSource::Options{
            .target_rate = config_.audio.target_sample_rate,
            .warmup_frames = config_.audio.warmup_frames,
            .device_id = id == SourceId::Microphone ? config_.capture.microphone_device
                                                    : config_.capture.system_device,
        });

    auto transport = make_transport(*p);
    p->transport = transport;
    transport->connect();

    Pipeline* raw = p.get();
    p->pump = std::jthread([this, raw](std::stop_token st) { pump(*raw, st); });

    FrameChannel* channel = p->channel.get();
    auto started = p->capture->start([channel](AudioFrame&& frame) {
        channel->try_push(std::move(frame));
    });
    if (!started) {
        stop_pipeline(*p);
        return std::unexpected(started.error());
    }

    p->capture->set_device_lost_callback([this](SourceId src, const std::string& reason) {
        request_restart(src, reason);
    });
    coordinator_->attach(*p->capture);
    pipelines_[static_cast<size_t>(id)] = std::move(p);
    return {};
}

void SessionOrchestrator::stop_pipeline(Pipeline& p) {
    p.capture->stop();

    p.pump.request_stop();
    p.channel->wake();
    if (p.pump.joinable()) p.pump.join();

    std::shared_ptr<StreamTransport> t;
    {
        std::lock_guard lock(p.transport_mu);
        t = std::move(p.transport);
    }
    if (!t) return;

    // Audio captured before stop still goes out ahead of Finalize.
    while (auto frame = p.channel->try_pop()) {
        t->send_pcm(std::move(*frame));
    }
    t->close();
}

void SessionOrchestrator::swap_transport(Pipeline& p) {
    auto fresh = make_transport(p);
    fresh->connect();

    std::shared_ptr<StreamTransport> old;
    {
        std::lock_guard lock(p.transport_mu);
        old = std::exchange(p.transport, std::move(fresh));
    }
    if (old) old->close();
}

std::shared_ptr<StreamTransport> SessionOrchestrator::make_transport(Pipeline& p) {
    uint64_t gen = p.transport_generation.fetch_add(1, std::memory_order_acq_rel) + 1;
    return transport_factory_(make_transport_config(config_, p.id),
                              [this, gen, &p](SourceId src, TransportEvent ev) {
                                  // Transcripts from a transport being replaced are still real.
                                  if (!std::holds_alternative<TranscriptEvent>(ev) &&
                                      p.transport_generation.load(std::memory_order_acquire) != gen) {
                                      return;
                                  }
                                  on_transport_event(src, std::move(ev));
                              });
}

void SessionOrchestrator::pump(Pipeline& p, std::stop_token st) {
    while (!st.stop_requested()) {
        bool paused = false;
        {
            std::lock_guard lock(coordinator_mu_);
            paused = coordinator_ && coordinator_->gate().paused();
        }
        // Hold delivery while a device restart is in progress.
        if (paused) {
            std::this_thread::sleep_for(pause_poll);
            continue;
        }

        auto frame = p.channel->pop_for(pump_wait);
        if (!frame) continue;

        std::shared_ptr<StreamTransport> t;
        {
            std::lock_guard lock(p.transport_mu);
            t = p.transport;
        }
        if (t) t->send_pcm(std::move(*frame));
    }
}

void SessionOrchestrator::on_transport_event(SourceId id, TransportEvent event) {
    std::visit(
        [this, id](auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TransportStateChanged>) {
                if (e.state == TransportState::Connected) {
                    push_event(session_event::SourceConnected{id});
                } else if (e.state == TransportState::Disconnected) {
                    push_event(session_event::SourceDisconnected{id});
                }
            } else if constexpr (std::is_same_v<T, TranscriptEvent>) {
                push_event(session_event::Transcript{std::move(e)});
            } else {
                push_event(session_event::TransportError{id, std::move(e)});
            }
        },
        event);
}

void SessionOrchestrator::on_topology_change(const TopologyChange& change) {
    SourceId id = change.direction == Direction::Input ? SourceId::Microphone
                                                       : SourceId::SystemOutput;
    request_restart(id, change.reason);
}

void SessionOrchestrator::request_restart(SourceId id, const std::string& reason) {
    std::lock_guard lock(coordinator_mu_);
    if (coordinator_) coordinator_->request_restart(id, reason);
}

void SessionOrchestrator::push_event(SessionEvent event) {
    {
        std::lock_guard lock(events_mu_);
        events_.push_back(std::move(event));
    }
    if (notify_) notify_();
}

bool SessionOrchestrator::enabled(const Config& config, SourceId id) {
    return id == SourceId::Microphone ? config.capture.microphone : config.capture.system;
}
