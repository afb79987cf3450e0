#include "device_change_coordinator.hpp"

#include <format>
#include <print>

DeviceChangeCoordinator::DeviceChangeCoordinator(Options options, Listener listener)
    : options_(std::move(options)), listener_(std::move(listener)) {
    if (options_.max_attempts == 0) options_.max_attempts = 1;
    gate_.set_first_frame_callback([this](SourceId id) {
        queue_.post([this, id] { on_first_frame(id); });
    });
}

DeviceChangeCoordinator::~DeviceChangeCoordinator() {
    stop();
}

void DeviceChangeCoordinator::attach(CaptureSource& source) {
    auto* src = &source;
    queue_.invoke([this, src] { sources_[index(src->id())] = src; });
}

void DeviceChangeCoordinator::detach(SourceId id) {
    queue_.invoke([this, id] {
        sources_[index(id)] = nullptr;
        pending_ &= ~bit(id);
    });
}

void DeviceChangeCoordinator::request_restart(SourceId id, std::string reason) {
    queue_.post([this, id, reason = std::move(reason)] {
        std::println(stderr, "coordinator: restart requested for {} ({})", source_name(id), reason);
        {
            std::lock_guard lock(metrics_mu_);
            ++metrics_.requests;
        }
        pending_ |= bit(id);
        // A request during a restart waits for it to finish.
        if (in_flight_) return;
        schedule_debounce();
    });
}

void DeviceChangeCoordinator::stop() {
    queue_.stop();
    gate_.resume();
    std::lock_guard lock(metrics_mu_);
    metrics_.restart_in_flight = false;
}

DeviceChangeCoordinator::Metrics DeviceChangeCoordinator::metrics() const {
    std::lock_guard lock(metrics_mu_);
    Metrics m = metrics_;
    m.paused = gate_.paused();
    return m;
}

void DeviceChangeCoordinator::schedule_debounce() {
    if (debounce_task_ != 0) return;
    debounce_task_ = queue_.post_after(options_.debounce, [this] {
        debounce_task_ = 0;
        execute();
    });
}

void DeviceChangeCoordinator::execute() {
    uint32_t requested = pending_;
    pending_ = 0;
    if (requested == 0) return;

    in_flight_ = true;
    restart_started_ = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(metrics_mu_);
        ++metrics_.device_changes;
        metrics_.restart_in_flight = true;
    }

    gate_.pause();

    std::vector<SourceId> restarting;
    for (auto id : all_sources) {
        if (!(requested & bit(id))) continue;
        auto* src = sources_[index(id)];
        if (!src || !src->begin_restart()) continue;

        auto& r = restarts_[index(id)];
        r = Restart{};
        r.active = true;
        r.generation = next_generation_++;
        r.backoff = Backoff(options_.backoff);
        gate_.await(id);
        restarting.push_back(id);
    }

    if (restarting.empty()) {
        finish_restart();
        return;
    }

    for (auto id : restarting) {
        uint64_t gen = restarts_[index(id)].generation;
        restarts_[index(id)].timer = queue_.post_after(options_.settle, [this, id, gen] {
            attempt(id, gen);
        });
    }
}

void DeviceChangeCoordinator::attempt(SourceId id, uint64_t generation) {
    auto& r = restarts_[index(id)];
    if (!r.active || r.generation != generation) return;
    auto* src = sources_[index(id)];
    if (!src) {
        finish_source(id);
        return;
    }

    ++r.attempts;
    std::println(stderr, "coordinator: reopening {} (attempt {}{})", source_name(id), r.attempts,
                 r.fallback ? ", default device" : "");

    auto opened = src->reopen(r.fallback);
    if (!opened) {
        fail_attempt(id, std::move(opened.error()));
        return;
    }

    r.timer = queue_.post_after(options_.first_frame_timeout, [this, id, generation] {
        on_first_frame_timeout(id, generation);
    });
}

void DeviceChangeCoordinator::on_first_frame(SourceId id) {
    auto& r = restarts_[index(id)];
    if (!r.active) return;

    queue_.cancel(r.timer);
    auto* src = sources_[index(id)];
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - restart_started_);
    {
        std::lock_guard lock(metrics_mu_);
        auto& m = metrics_.sources[index(id)];
        ++m.restarts;
        m.last_restart_duration = elapsed;
    }

    DeviceIdentity dev;
    if (src) {
        if (auto d = src->device()) dev = *d;
    }
    std::println(stderr, "coordinator: {} restarted on {} in {}ms", source_name(id),
                 dev.id.empty() ? "default" : dev.id, elapsed.count());

    bool degraded = r.fallback;
    finish_source(id);

    if (degraded) {
        if (listener_.on_degraded) listener_.on_degraded(id, dev);
    } else {
        if (listener_.on_restarted) listener_.on_restarted(id, dev);
    }
}

void DeviceChangeCoordinator::on_first_frame_timeout(SourceId id, uint64_t generation) {
    auto& r = restarts_[index(id)];
    if (!r.active || r.generation != generation) return;
    // The first frame made it through the gate; its notification is queued.
    if (!gate_.awaiting(id)) return;

    fail_attempt(id, Error{ErrorCode::DeviceChangeTimeout,
                           std::format("{}: no audio within {}ms of reopening", source_name(id),
                                       options_.first_frame_timeout.count())});
}

void DeviceChangeCoordinator::fail_attempt(SourceId id, Error err) {
    auto& r = restarts_[index(id)];
    auto* src = sources_[index(id)];
    std::println(stderr, "coordinator: {} attempt {} failed: {}", source_name(id), r.attempts,
                 err.message);

    if (r.fallback || !src) {
        if (src) src->abandon_restart();
        gate_.abandon(id);
        {
            std::lock_guard lock(metrics_mu_);
            ++metrics_.failures;
        }
        finish_source(id);
        if (listener_.on_failed) listener_.on_failed(id, err);
        return;
    }

    // Drop whatever the failed attempt opened before trying again.
    src->begin_restart();
    r.generation = next_generation_++;
    uint64_t gen = r.generation;
    auto delay = r.backoff.next();

    if (r.attempts >= options_.max_attempts) {
        r.fallback = true;
        r.attempts = 0;
        {
            std::lock_guard lock(metrics_mu_);
            ++metrics_.fallbacks;
        }
        std::println(stderr, "coordinator: {} falling back to default device", source_name(id));
    }

    r.timer = queue_.post_after(delay, [this, id, gen] { attempt(id, gen); });
}

void DeviceChangeCoordinator::finish_source(SourceId id) {
    restarts_[index(id)].active = false;
    for (auto& r : restarts_) {
        if (r.active) return;
    }
    finish_restart();
}

void DeviceChangeCoordinator::finish_restart() {
    in_flight_ = false;
    gate_.resume();
    {
        std::lock_guard lock(metrics_mu_);
        metrics_.restart_in_flight = false;
    }
    if (pending_ != 0) schedule_debounce();
}
