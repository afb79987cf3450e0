#include "capture_source.hpp"

#include <chrono>
#include <format>
#include <print>

CaptureSource::CaptureSource(SourceId id, AudioBackend& backend, PermissionService& permissions,
                             PauseGate& gate, Options options)
    : id_(id), backend_(backend), permissions_(permissions), gate_(gate),
      options_(std::move(options)) {}

CaptureSource::~CaptureSource() {
    stop();
}

std::expected<void, Error> CaptureSource::start(FrameCallback on_frame) {
    std::lock_guard lock(mu_);
    auto st = state_.load(std::memory_order_acquire);
    if (st != CaptureSourceState::Stopped) return {};

    if (!permissions_.has_capture_permission(id_) &&
        !permissions_.request_capture_permission(id_)) {
        return std::unexpected(Error{ErrorCode::CapturePermissionDenied,
                                     std::format("{}: capture permission denied", source_name(id_))});
    }

    state_.store(CaptureSourceState::Starting, std::memory_order_release);
    on_frame_ = std::move(on_frame);

    auto opened = open_locked(options_.device_id);
    if (!opened) {
        on_frame_ = nullptr;
        state_.store(CaptureSourceState::Stopped, std::memory_order_release);
        return opened;
    }

    state_.store(CaptureSourceState::Running, std::memory_order_release);
    return {};
}

void CaptureSource::stop() {
    std::unique_ptr<AudioStream> released;
    {
        std::lock_guard lock(mu_);
        if (state_.load(std::memory_order_acquire) == CaptureSourceState::Stopped && !stream_) return;

        released = release_locked();
        on_frame_ = nullptr;
        state_.store(CaptureSourceState::Stopped, std::memory_order_release);
    }
    // Stream teardown takes the platform loop lock, which error callbacks
    // hold while they run; never do it under mu_.
    released.reset();
}

bool CaptureSource::begin_restart() {
    std::unique_ptr<AudioStream> released;
    {
        std::lock_guard lock(mu_);
        auto st = state_.load(std::memory_order_acquire);
        if (st == CaptureSourceState::Stopped || st == CaptureSourceState::Starting) return false;

        released = release_locked();
        state_.store(CaptureSourceState::Restarting, std::memory_order_release);
    }
    released.reset();
    return true;
}

std::expected<void, Error> CaptureSource::reopen(bool use_default_device) {
    std::unique_ptr<AudioStream> released;
    {
        std::lock_guard lock(mu_);
        if (state_.load(std::memory_order_acquire) != CaptureSourceState::Restarting) {
            return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                         std::format("{}: not restarting", source_name(id_))});
        }
        released = release_locked();
    }
    released.reset();

    std::lock_guard lock(mu_);
    // stop() may have won the race while the old stream was torn down.
    if (state_.load(std::memory_order_acquire) != CaptureSourceState::Restarting || stream_) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                     std::format("{}: restart cancelled", source_name(id_))});
    }
    auto opened = open_locked(use_default_device ? std::string{} : options_.device_id);
    if (!opened) return opened;

    state_.store(use_default_device ? CaptureSourceState::Degraded : CaptureSourceState::Running,
                 std::memory_order_release);
    return {};
}

void CaptureSource::abandon_restart() {
    std::unique_ptr<AudioStream> released;
    {
        std::lock_guard lock(mu_);
        released = release_locked();
        on_frame_ = nullptr;
        state_.store(CaptureSourceState::Stopped, std::memory_order_release);
    }
    released.reset();
}

std::expected<void, Error> CaptureSource::restart(bool use_default_device) {
    if (!begin_restart()) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                     std::format("{}: not running", source_name(id_))});
    }
    return reopen(use_default_device);
}

void CaptureSource::set_device_lost_callback(DeviceLostCallback cb) {
    on_device_lost_.store(cb ? std::make_shared<const DeviceLostCallback>(std::move(cb)) : nullptr,
                          std::memory_order_release);
}

std::optional<DeviceIdentity> CaptureSource::device() const {
    std::lock_guard lock(mu_);
    return device_;
}

std::optional<NativeFormat> CaptureSource::native_format() const {
    std::lock_guard lock(mu_);
    return native_;
}

CaptureSource::Stats CaptureSource::stats() const {
    return Stats{
        .callbacks = callbacks_.load(std::memory_order_relaxed),
        .frames_delivered = delivered_.load(std::memory_order_relaxed),
        .warmup_dropped = warmup_dropped_.load(std::memory_order_relaxed),
        .paused_dropped = paused_dropped_.load(std::memory_order_relaxed),
    };
}

std::expected<void, Error> CaptureSource::open_locked(const std::string& device_id) {
    warmup_remaining_ = options_.warmup_frames;
    converter_.reset();

    auto stream = backend_.open(
        StreamRequest{.source = id_, .device_id = device_id},
        [this](const NativeBuffer& buf) { on_buffer(buf); },
        [this](const Error& err) { on_stream_error(err); });
    if (!stream) {
        std::println(stderr, "audio[{}]: open failed: {}", source_name(id_), stream.error().message);
        return std::unexpected(stream.error());
    }

    auto fmt = (*stream)->format();
    if (auto valid = pcm::validate(fmt); !valid) {
        std::println(stderr, "audio[{}]: {}", source_name(id_), valid.error().message);
        return std::unexpected(valid.error());
    }

    stream_ = std::move(*stream);
    device_ = stream_->device();
    native_ = fmt;
    live_.store(true, std::memory_order_release);
    return {};
}

std::unique_ptr<AudioStream> CaptureSource::release_locked() {
    live_.store(false, std::memory_order_release);
    device_.reset();
    return std::move(stream_);
}

void CaptureSource::on_buffer(const NativeBuffer& buf) {
    if (!live_.load(std::memory_order_acquire)) return;
    callbacks_.fetch_add(1, std::memory_order_relaxed);

    if (warmup_remaining_ > 0) {
        --warmup_remaining_;
        warmup_dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (buf.frames == 0 || !pcm::validate(buf.format)) return;

    if (!converter_ || converter_->native_format().sample_rate != buf.format.sample_rate ||
        converter_->native_format().channels != buf.format.channels) {
        converter_.emplace(buf.format, options_.target_rate);
    }

    auto samples = buf.format.sample_format == SampleFormat::F32
        ? converter_->push(buf.f32())
        : converter_->push(buf.s16());
    if (samples.empty()) return;

    if (!gate_.admit(id_)) {
        paused_dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    AudioFrame frame{
        .source = id_,
        .pcm = std::move(samples),
        .sample_rate = options_.target_rate,
        .channels = 1,
        .captured_at = std::chrono::steady_clock::now(),
    };
    delivered_.fetch_add(1, std::memory_order_relaxed);
    if (on_frame_) on_frame_(std::move(frame));
}

// Runs with the platform loop lock held; must not touch mu_.
void CaptureSource::on_stream_error(const Error& err) {
    std::println(stderr, "audio[{}]: stream error: {}", source_name(id_), err.message);
    // A stream being released is already on its way out.
    if (!live_.load(std::memory_order_acquire)) return;
    auto cb = on_device_lost_.load(std::memory_order_acquire);
    if (cb && *cb) (*cb)(id_, err.message);
}
