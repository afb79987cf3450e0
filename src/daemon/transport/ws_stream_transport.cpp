#include "transport/ws_stream_transport.hpp"

#include <algorithm>
#include <bit>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <span>
#include <type_traits>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

// libcurl can hold decrypted bytes the socket no longer signals.
constexpr int connected_poll_ms = 100;
constexpr auto close_grace = std::chrono::milliseconds(500);

} // namespace

WsStreamTransport::WsStreamTransport(TransportConfig config, std::unique_ptr<WireProtocol> protocol,
                                     ConnectionFactory connection_factory, EventCallback on_event)
    : config_(std::move(config)), protocol_(std::move(protocol)),
      connection_factory_(std::move(connection_factory)), on_event_(std::move(on_event)),
      ring_(config_.ring_buffer, config_.sample_rate),
      backoff_(config_.reconnect_delays),
      closed_future_(closed_.get_future().share()) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (epoll_fd_ < 0 || wake_fd_ < 0) {
        std::println(stderr, "transport[{}]: epoll/eventfd setup failed: {}",
                     source_name(config_.source), std::strerror(errno));
        return;
    }
    epoll_event ev{.events = EPOLLIN, .data = {.fd = wake_fd_}};
    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev);

    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

WsStreamTransport::~WsStreamTransport() {
    abort_.request_stop();
    if (thread_.joinable()) {
        thread_.request_stop();
        wake();
        thread_.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

void WsStreamTransport::connect() {
    if (!thread_.joinable()) {
        emit(Error{ErrorCode::TransportHandshakeFailed, "transport I/O thread not running"});
        return;
    }
    post(ConnectCmd{});
}

void WsStreamTransport::send_pcm(AudioFrame frame) noexcept {
    if (frame.byte_size() > config_.max_frame_bytes) {
        std::println(stderr, "transport[{}]: rejecting {} byte frame (max {})",
                     source_name(config_.source), frame.byte_size(), config_.max_frame_bytes);
        std::lock_guard lock(stats_mu_);
        ++stats_.oversized_rejected;
        return;
    }

    try {
        post(PcmCmd{std::move(frame)});
    } catch (const std::bad_alloc&) {
        std::println(stderr, "transport[{}]: out of memory queueing frame", source_name(config_.source));
    }
}

void WsStreamTransport::send_control(ControlKind kind) {
    post(ControlCmd{kind});
}

void WsStreamTransport::close() {
    if (!thread_.joinable()) {
        set_state(TransportState::Disconnected);
        return;
    }
    abort_.request_stop();
    if (!close_requested_.exchange(true)) post(CloseCmd{});

    if (closed_future_.wait_for(config_.close_timeout + close_grace) != std::future_status::ready) {
        // The connection ignored the abort. The I/O thread exits once it
        // returns, and can no longer leave Disconnected.
        std::println(stderr, "transport[{}]: close timed out, abandoning connection",
                     source_name(config_.source));
        thread_.request_stop();
        wake();
        set_state(TransportState::Disconnected);
    }
}

TransportStats WsStreamTransport::stats() const {
    std::lock_guard lock(stats_mu_);
    return stats_;
}

void WsStreamTransport::post(Command cmd) {
    {
        std::lock_guard lock(inbox_mu_);
        inbox_.push_back(std::move(cmd));
    }
    wake();
}

void WsStreamTransport::wake() {
    if (wake_fd_ < 0) return;
    uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::println(stderr, "transport[{}]: wake failed: {}", source_name(config_.source),
                     std::strerror(errno));
    }
}

// ---- I/O thread ----

void WsStreamTransport::run(std::stop_token st) {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (!st.stop_requested() && !finished_) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "transport[{}]: epoll_wait error: {}", source_name(config_.source),
                         std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            if (events[i].data.fd == wake_fd_) {
                uint64_t val;
                while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
            }
        }

        drain_inbox();
        if (conn_) drain_inbound();
        fire_timers();
    }

    drop_connection();
    if (!finished_) {
        finished_ = true;
        closed_.set_value();
    }
}

void WsStreamTransport::drain_inbox() {
    std::deque<Command> batch;
    {
        std::lock_guard lock(inbox_mu_);
        batch.swap(inbox_);
    }
    for (auto& cmd : batch) {
        if (finished_) break;
        std::visit([this](auto& c) { handle(c); }, cmd);
    }
}

void WsStreamTransport::handle(ConnectCmd&) {
    auto s = state();
    if (closing_) return;
    if (s == TransportState::Idle || (s == TransportState::Disconnected && gave_up_)) {
        gave_up_ = false;
        failures_ = 0;
        backoff_.reset();
        start_connecting();
    }
}

void WsStreamTransport::handle(PcmCmd& cmd) {
    if (state() == TransportState::Connected) {
        flush_buffer();
        if (state() == TransportState::Connected) {
            transmit(cmd.frame);
            return;
        }
    }
    ring_.push(std::move(cmd.frame));
    update_buffer_stats();
}

void WsStreamTransport::handle(ControlCmd& cmd) {
    if (state() != TransportState::Connected) return;
    if (send_text(protocol_->control(cmd.kind))) {
        std::println(stderr, "transport[{}]: sent {}", source_name(config_.source), to_string(cmd.kind));
    }
}

void WsStreamTransport::handle(CloseCmd&) {
    if (closing_) return;
    closing_ = true;
    reconnect_at_.reset();
    handshake_deadline_.reset();

    if (state() == TransportState::Connected) {
        set_state(TransportState::Closing);
        if (send_text(protocol_->control(ControlKind::Finalize))) {
            close_deadline_ = Clock::now() + config_.close_timeout;
            return;
        }
    }
    finish_close();
}

void WsStreamTransport::start_connecting() {
    reconnect_at_.reset();
    if (abort_.stop_requested()) {
        finish_close();
        return;
    }
    set_state(TransportState::Connecting);

    auto request = protocol_->request(config_);
    std::println(stderr, "transport[{}]: connecting to {}", source_name(config_.source), request.url);

    conn_ = connection_factory_();
    auto opened = conn_->open(request, config_.connect_timeout, abort_.get_token());
    if (!opened) {
        conn_.reset();
        on_connection_lost(std::move(opened.error()));
        return;
    }
    if (abort_.stop_requested()) {
        finish_close();
        return;
    }

    watched_fd_ = conn_->poll_fd();
    if (watched_fd_ >= 0) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = watched_fd_}};
        epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, watched_fd_, &ev);
    }

    auto hello = protocol_->handshake(config_);
    if (!hello) {
        on_confirmed();
        return;
    }

    if (auto sent = conn_->send_text(*hello); !sent) {
        on_connection_lost(Error{ErrorCode::TransportHandshakeFailed, sent.error().message});
        return;
    }
    handshake_deadline_ = Clock::now() + config_.handshake_timeout;
}

void WsStreamTransport::on_confirmed() {
    handshake_deadline_.reset();
    failures_ = 0;
    backoff_.reset();
    last_send_ = Clock::now();
    {
        std::lock_guard lock(stats_mu_);
        stats_.sequence = 0;
    }
    set_state(TransportState::Connected);
    flush_buffer();
}

void WsStreamTransport::on_connection_lost(Error err) {
    if (closing_ || abort_.stop_requested()) {
        finish_close();
        return;
    }

    bool was_connected = state() == TransportState::Connected;
    drop_connection();
    handshake_deadline_.reset();
    set_state(TransportState::Disconnected);

    std::println(stderr, "transport[{}]: {}: {}", source_name(config_.source), to_string(err.code),
                 err.message);

    if (!was_connected) ++failures_;
    if (config_.max_reconnect_attempts > 0 && failures_ >= config_.max_reconnect_attempts) {
        gave_up_ = true;
        emit(Error{err.code, std::format("giving up after {} failed attempts: {}", failures_,
                                         err.message)});
        return;
    }

    auto delay = backoff_.next();
    std::println(stderr, "transport[{}]: reconnecting in {}ms", source_name(config_.source),
                 delay.count());
    reconnect_at_ = Clock::now() + delay;
}

void WsStreamTransport::drop_connection() {
    if (watched_fd_ >= 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, watched_fd_, nullptr);
        watched_fd_ = -1;
    }
    if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

void WsStreamTransport::drain_inbound() {
    while (conn_ && !finished_) {
        auto received = conn_->receive();
        if (!received) {
            on_connection_lost(std::move(received.error()));
            return;
        }
        if (!*received) return;
        on_message(**received);
    }
}

void WsStreamTransport::on_message(WsMessage& msg) {
    if (msg.kind == WsMessage::Kind::Close) {
        on_connection_lost(Error{ErrorCode::TransportSendFailed, "remote closed the connection"});
        return;
    }
    if (msg.kind == WsMessage::Kind::Binary) return;

    auto decoded = protocol_->decode(msg.payload, config_.source);
    if (!decoded) {
        {
            std::lock_guard lock(stats_mu_);
            ++stats_.protocol_errors;
        }
        emit(decoded.error());
        return;
    }

    std::visit(
        [this](auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, wire::Transcript>) {
                emit(std::move(m.event));
                if (m.finalizes && closing_) finish_close();
            } else if constexpr (std::is_same_v<T, wire::HandshakeAck>) {
                if (state() != TransportState::Connecting) return;
                if (m.ok) {
                    on_confirmed();
                } else {
                    on_connection_lost(Error{ErrorCode::TransportHandshakeFailed,
                                             m.reason.empty() ? "handshake rejected" : m.reason});
                }
            } else if constexpr (std::is_same_v<T, wire::FinalizeAck>) {
                if (closing_) finish_close();
            } else if constexpr (std::is_same_v<T, wire::Ping>) {
                send_text(protocol_->pong());
            }
        },
        *decoded);
}

void WsStreamTransport::fire_timers() {
    auto now = Clock::now();

    if (close_deadline_ && now >= *close_deadline_) {
        std::println(stderr, "transport[{}]: no finalize acknowledgement, closing anyway",
                     source_name(config_.source));
        finish_close();
        return;
    }

    if (handshake_deadline_ && now >= *handshake_deadline_) {
        handshake_deadline_.reset();
        on_connection_lost(Error{ErrorCode::TransportHandshakeFailed,
                                 std::format("no handshake acknowledgement within {}ms",
                                             config_.handshake_timeout.count())});
        return;
    }

    if (reconnect_at_ && now >= *reconnect_at_) {
        reconnect_at_.reset();
        {
            std::lock_guard lock(stats_mu_);
            ++stats_.reconnects;
        }
        start_connecting();
        return;
    }

    if (state() == TransportState::Connected && now - last_send_ >= config_.keepalive_interval) {
        send_text(protocol_->control(ControlKind::KeepAlive));
    }
}

int WsStreamTransport::next_timeout_ms() const {
    std::optional<Clock::time_point> next;
    auto consider = [&next](const std::optional<Clock::time_point>& t) {
        if (t && (!next || *t < *next)) next = t;
    };
    consider(close_deadline_);
    consider(handshake_deadline_);
    consider(reconnect_at_);
    if (state() == TransportState::Connected) consider(last_send_ + config_.keepalive_interval);

    int timeout = -1;
    if (next) {
        auto ms = std::chrono::ceil<std::chrono::milliseconds>(*next - Clock::now()).count();
        timeout = static_cast<int>(std::max<int64_t>(ms, 0));
    }
    if (conn_ && (timeout < 0 || timeout > connected_poll_ms)) timeout = connected_poll_ms;
    return timeout;
}

void WsStreamTransport::transmit(AudioFrame& frame) {
    if constexpr (std::endian::native == std::endian::big) {
        for (auto& s : frame.pcm) {
            s = static_cast<int16_t>(std::byteswap(static_cast<uint16_t>(s)));
        }
    }

    std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(frame.pcm.data()),
                                   frame.byte_size());
    if (auto sent = conn_->send_binary(bytes); !sent) {
        if constexpr (std::endian::native == std::endian::big) {
            for (auto& s : frame.pcm) {
                s = static_cast<int16_t>(std::byteswap(static_cast<uint16_t>(s)));
            }
        }
        // Oldest unsent audio; it goes out first on the next connection.
        ring_.restore(std::move(frame));
        update_buffer_stats();
        on_connection_lost(std::move(sent.error()));
        return;
    }

    last_send_ = Clock::now();
    std::lock_guard lock(stats_mu_);
    ++stats_.frames_sent;
    stats_.bytes_sent += bytes.size();
    ++stats_.sequence;
}

void WsStreamTransport::flush_buffer() {
    while (state() == TransportState::Connected && !ring_.empty()) {
        auto frame = ring_.pop();
        update_buffer_stats();
        transmit(*frame);
    }
}

bool WsStreamTransport::send_text(const std::string& text) {
    if (!conn_) return false;
    if (auto sent = conn_->send_text(text); !sent) {
        on_connection_lost(std::move(sent.error()));
        return false;
    }
    last_send_ = Clock::now();
    return true;
}

void WsStreamTransport::finish_close() {
    if (finished_) return;
    close_deadline_.reset();
    if (conn_) {
        if (auto sent = conn_->send_text(protocol_->control(ControlKind::CloseStream)); !sent) {
            std::println(stderr, "transport[{}]: CloseStream not sent: {}",
                         source_name(config_.source), sent.error().message);
        }
    }
    drop_connection();
    ring_.clear();
    update_buffer_stats();
    set_state(TransportState::Disconnected);
    finished_ = true;
    closed_.set_value();
}

void WsStreamTransport::set_state(TransportState s) {
    // Once closed, only the way down is reported.
    if (abort_.stop_requested() && s != TransportState::Closing && s != TransportState::Disconnected) {
        return;
    }
    if (state_.exchange(s, std::memory_order_acq_rel) == s) return;
    emit(TransportStateChanged{s});
}

void WsStreamTransport::emit(TransportEvent event) {
    if (on_event_) on_event_(config_.source, std::move(event));
}

void WsStreamTransport::update_buffer_stats() {
    std::lock_guard lock(stats_mu_);
    stats_.frames_buffered = ring_.frame_count();
    stats_.bytes_evicted = ring_.evicted_bytes();
    stats_.frames_evicted = ring_.evicted_frames();
    stats_.overruns = ring_.overruns();
}
