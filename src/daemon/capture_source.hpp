#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"
#include "format_converter.hpp"
#include "pause_gate.hpp"
#include "platform/audio_backend.hpp"
#include "platform/permission_service.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Acquires PCM from one endpoint and delivers canonical frames.
//
// Lifecycle: Stopped -> Starting -> Running -> Stopped, and
// Running -> Restarting -> Running (or Degraded on the fallback device) when
// the coordinator swaps the device. Each (re)start opens a fresh platform
// stream; the previous one is always destroyed first.
class CaptureSource {
public:
    // Runs on the real-time audio thread. Must not block.
    using FrameCallback = std::function<void(AudioFrame&&)>;
    using DeviceLostCallback = std::function<void(SourceId, const std::string& reason)>;

    struct Options {
        uint32_t target_rate = 16000;
        uint32_t warmup_frames = 3;
        std::string device_id;
    };

    struct Stats {
        uint64_t callbacks = 0;
        uint64_t frames_delivered = 0;
        uint64_t warmup_dropped = 0;
        uint64_t paused_dropped = 0;
    };

    CaptureSource(SourceId id, AudioBackend& backend, PermissionService& permissions,
                  PauseGate& gate, Options options);
    ~CaptureSource();

    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;

    // No-op when already running.
    std::expected<void, Error> start(FrameCallback on_frame);
    // Idempotent; the device is released before this returns.
    void stop();

    // Coordinator restart steps. begin_restart() releases the stream and
    // returns false if the source is not running. reopen() opens a new
    // stream on the configured device, or on the platform default.
    bool begin_restart();
    std::expected<void, Error> reopen(bool use_default_device);
    // Gives up after a failed restart; the source ends Stopped.
    void abandon_restart();

    // begin_restart() followed by reopen().
    std::expected<void, Error> restart(bool use_default_device);

    // Called from the platform thread when an open stream fails.
    void set_device_lost_callback(DeviceLostCallback cb);

    SourceId id() const { return id_; }
    CaptureSourceState state() const { return state_.load(std::memory_order_acquire); }
    std::optional<DeviceIdentity> device() const;
    std::optional<NativeFormat> native_format() const;
    Stats stats() const;

private:
    std::expected<void, Error> open_locked(const std::string& device_id);
    std::unique_ptr<AudioStream> release_locked();
    void on_buffer(const NativeBuffer& buf);
    void on_stream_error(const Error& err);

    SourceId id_;
    AudioBackend& backend_;
    PermissionService& permissions_;
    PauseGate& gate_;
    Options options_;

    mutable std::mutex mu_;
    std::unique_ptr<AudioStream> stream_;
    std::optional<DeviceIdentity> device_;
    std::optional<NativeFormat> native_;
    FrameCallback on_frame_;
    // Read from platform callbacks, which must never wait on mu_.
    std::atomic<std::shared_ptr<const DeviceLostCallback>> on_device_lost_;
    std::atomic<CaptureSourceState> state_{CaptureSourceState::Stopped};

    // Audio-thread state. Only touched while no stream exists or from the
    // stream's own callback.
    std::atomic<bool> live_{false};
    uint32_t warmup_remaining_ = 0;
    std::optional<pcm::StreamConverter> converter_;

    std::atomic<uint64_t> callbacks_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> warmup_dropped_{0};
    std::atomic<uint64_t> paused_dropped_{0};
};
