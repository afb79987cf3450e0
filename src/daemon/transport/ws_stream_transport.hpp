#pragma once

#include "backoff.hpp"
#include "pcm_ring_buffer.hpp"
#include "transport/stream_transport.hpp"
#include "transport/wire_protocol.hpp"
#include "transport/ws_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <variant>

// StreamTransport over a WebSocket, driven by one I/O thread.
//
// The thread owns the connection, the ring buffer and every timer
// (handshake, keepalive, reconnect, close). Public methods only append to
// its inbox and poke an eventfd, so callers never wait on the network.
class WsStreamTransport : public StreamTransport {
public:
    WsStreamTransport(TransportConfig config, std::unique_ptr<WireProtocol> protocol,
                      ConnectionFactory connection_factory, EventCallback on_event);
    ~WsStreamTransport() override;

    WsStreamTransport(const WsStreamTransport&) = delete;
    WsStreamTransport& operator=(const WsStreamTransport&) = delete;

    void connect() override;
    void send_pcm(AudioFrame frame) noexcept override;
    void send_control(ControlKind kind) override;
    void close() override;

    TransportState state() const override { return state_.load(std::memory_order_acquire); }
    TransportStats stats() const override;
    const TransportConfig& config() const override { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct ConnectCmd {};
    struct PcmCmd {
        AudioFrame frame;
    };
    struct ControlCmd {
        ControlKind kind;
    };
    struct CloseCmd {};
    using Command = std::variant<ConnectCmd, PcmCmd, ControlCmd, CloseCmd>;

    void post(Command cmd);
    void wake();

    // I/O thread.
    void run(std::stop_token st);
    void drain_inbox();
    void handle(ConnectCmd&);
    void handle(PcmCmd& cmd);
    void handle(ControlCmd& cmd);
    void handle(CloseCmd&);

    void start_connecting();
    void on_confirmed();
    void on_connection_lost(Error err);
    void drop_connection();
    void drain_inbound();
    void on_message(WsMessage& msg);
    void fire_timers();
    int next_timeout_ms() const;

    void transmit(AudioFrame& frame);
    void flush_buffer();
    bool send_text(const std::string& text);
    void finish_close();

    void set_state(TransportState s);
    void emit(TransportEvent event);
    void update_buffer_stats();

    TransportConfig config_;
    std::unique_ptr<WireProtocol> protocol_;
    ConnectionFactory connection_factory_;
    EventCallback on_event_;

    std::atomic<TransportState> state_{TransportState::Idle};
    std::atomic<bool> close_requested_{false};
    // Requested by close() and the destructor. Interrupts a connect in
    // progress and stops any further reconnects.
    std::stop_source abort_;

    std::mutex inbox_mu_;
    std::deque<Command> inbox_;

    int epoll_fd_ = -1;
    int wake_fd_ = -1;

    // Owned by the I/O thread.
    std::unique_ptr<WsConnection> conn_;
    int watched_fd_ = -1;
    PcmRingBuffer ring_;
    Backoff backoff_;
    uint32_t failures_ = 0;
    bool gave_up_ = false;
    bool closing_ = false;
    bool finished_ = false;
    std::optional<Clock::time_point> handshake_deadline_;
    std::optional<Clock::time_point> reconnect_at_;
    std::optional<Clock::time_point> close_deadline_;
    Clock::time_point last_send_;

    std::promise<void> closed_;
    std::shared_future<void> closed_future_;

    mutable std::mutex stats_mu_;
    TransportStats stats_;

    std::jthread thread_;
};
