#pragma once

#include "audio_frame.hpp"
#include "backoff.hpp"
#include "capture_source.hpp"
#include "errors.hpp"
#include "pause_gate.hpp"
#include "task_queue.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Turns bursts of endpoint-change notifications into single coordinated
// restarts of the affected CaptureSources.
//
// Everything past request_restart() runs on one serial TaskQueue, so at most
// one restart is ever in flight. A restart pauses the gate, releases the
// affected streams, waits for the settle delay and reopens them; the gate
// reopens on the first frame from every restarted source.
class DeviceChangeCoordinator {
public:
    struct Options {
        std::chrono::milliseconds debounce{400};
        std::chrono::milliseconds settle{200};
        std::chrono::milliseconds first_frame_timeout{2000};
        uint32_t max_attempts = 3;
        std::vector<std::chrono::milliseconds> backoff{
            std::chrono::milliseconds(500), std::chrono::milliseconds(1000),
            std::chrono::milliseconds(1500)};
    };

    // Callbacks run on the coordinator's queue thread.
    struct Listener {
        std::function<void(SourceId, const DeviceIdentity&)> on_restarted;
        std::function<void(SourceId, const DeviceIdentity&)> on_degraded;
        std::function<void(SourceId, const Error&)> on_failed;
    };

    struct SourceMetrics {
        uint64_t restarts = 0;
        std::chrono::milliseconds last_restart_duration{0};
    };

    struct Metrics {
        uint64_t requests = 0;
        uint64_t device_changes = 0;
        uint64_t fallbacks = 0;
        uint64_t failures = 0;
        std::array<SourceMetrics, 2> sources{};
        bool restart_in_flight = false;
        bool paused = false;
    };

    explicit DeviceChangeCoordinator(Options options, Listener listener = {});
    ~DeviceChangeCoordinator();

    DeviceChangeCoordinator(const DeviceChangeCoordinator&) = delete;
    DeviceChangeCoordinator& operator=(const DeviceChangeCoordinator&) = delete;

    // Sources consult this before delivering frames.
    PauseGate& gate() { return gate_; }

    // Registers a source for restarts. Call before the first request.
    void attach(CaptureSource& source);
    void detach(SourceId id);

    // Thread-safe. Coalesces with other requests inside the debounce window.
    void request_restart(SourceId id, std::string reason);

    void pause_all() { gate_.pause(); }
    void resume_all() { gate_.resume(); }

    // Cancels the pending debounce and any restart in flight. No restart step
    // runs after this returns. Not restartable.
    void stop();

    Metrics metrics() const;

private:
    struct Restart {
        bool active = false;
        bool fallback = false;
        uint32_t attempts = 0;
        uint64_t generation = 0;
        TaskQueue::TaskId timer = 0;
        Backoff backoff{{}};
    };

    static constexpr uint32_t bit(SourceId id) { return 1u << static_cast<uint32_t>(id); }
    static size_t index(SourceId id) { return static_cast<size_t>(id); }

    void schedule_debounce();
    void execute();
    void attempt(SourceId id, uint64_t generation);
    void on_first_frame(SourceId id);
    void on_first_frame_timeout(SourceId id, uint64_t generation);
    void fail_attempt(SourceId id, Error err);
    void finish_source(SourceId id);
    void finish_restart();

    Options options_;
    Listener listener_;
    PauseGate gate_;

    // Queue-thread state.
    std::array<CaptureSource*, 2> sources_{};
    std::array<Restart, 2> restarts_{};
    uint32_t pending_ = 0;
    TaskQueue::TaskId debounce_task_ = 0;
    bool in_flight_ = false;
    std::chrono::steady_clock::time_point restart_started_;
    uint64_t next_generation_ = 1;

    mutable std::mutex metrics_mu_;
    Metrics metrics_;

    // Declared last: destroyed (and joined) before the state its tasks touch.
    TaskQueue queue_{"coordinator"};
};
