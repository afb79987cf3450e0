#pragma once

#include "capture_source.hpp"
#include "config.hpp"
#include "device_change_coordinator.hpp"
#include "errors.hpp"
#include "frame_channel.hpp"
#include "platform/audio_backend.hpp"
#include "platform/permission_service.hpp"
#include "session_events.hpp"
#include "transport/stream_transport.hpp"
#include "transport/transport_factory.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// Owns the per-source pipelines
//   CaptureSource -> FrameChannel -> pump thread -> StreamTransport
// and the DeviceChangeCoordinator restarting them, and merges their events
// into one stream for the host.
class SessionOrchestrator {
public:
    // Called from any thread after events were queued; drain_events() on the
    // consumer's thread.
    using NotifyCallback = std::function<void()>;

    struct SourceStatus {
        SourceId source;
        CaptureSourceState capture = CaptureSourceState::Stopped;
        std::optional<DeviceIdentity> device;
        CaptureSource::Stats capture_stats;
        uint64_t channel_dropped = 0;
        TransportState transport = TransportState::Idle;
        TransportStats transport_stats;
    };

    struct Status {
        bool running = false;
        std::vector<SourceStatus> sources;
        DeviceChangeCoordinator::Metrics devices;
    };

    SessionOrchestrator(Config config, AudioBackend& backend, PermissionService& permissions,
                        TransportFactory transport_factory, NotifyCallback notify);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Succeeds if at least one source is capturing. Sources that fail are
    // reported through CaptureFailed and stay stopped.
    std::expected<void, Error> start();
    void stop();

    // Swaps transports in place when only transport settings changed;
    // restarts the whole session otherwise.
    std::expected<void, Error> reconfigure(Config config);

    Status status() const;
    std::vector<SessionEvent> drain_events();

    bool running() const;
    Config config() const;

private:
    struct Pipeline {
        SourceId id;
        std::unique_ptr<CaptureSource> capture;
        std::unique_ptr<FrameChannel> channel;

        std::mutex transport_mu;
        std::shared_ptr<StreamTransport> transport;
        // Bumped on each transport swap; state events from older transports
        // are not forwarded.
        std::atomic<uint64_t> transport_generation{0};

        std::jthread pump;
    };

    std::expected<void, Error> start_locked();
    void stop_locked();
    std::expected<void, Error> start_pipeline(SourceId id);
    void stop_pipeline(Pipeline& p);
    void swap_transport(Pipeline& p);
    std::shared_ptr<StreamTransport> make_transport(Pipeline& p);
    void pump(Pipeline& p, std::stop_token st);

    void on_transport_event(SourceId id, TransportEvent event);
    void on_topology_change(const TopologyChange& change);
    void request_restart(SourceId id, const std::string& reason);
    void push_event(SessionEvent event);

    static bool enabled(const Config& config, SourceId id);

    mutable std::mutex control_mu_;
    Config config_;
    AudioBackend& backend_;
    PermissionService& permissions_;
    TransportFactory transport_factory_;
    NotifyCallback notify_;

    bool running_ = false;

    // Guards coordinator_ against platform callbacks racing stop().
    mutable std::mutex coordinator_mu_;
    std::unique_ptr<DeviceChangeCoordinator> coordinator_;
    std::array<std::unique_ptr<Pipeline>, 2> pipelines_;

    std::mutex events_mu_;
    std::vector<SessionEvent> events_;
};
