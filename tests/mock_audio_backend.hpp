#pragma once

#include "platform/audio_backend.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <numbers>
#include <set>
#include <string>
#include <thread>
#include <vector>

// In-process AudioBackend. Tests push buffers into whatever stream is open
// for a source; buffers are delivered synchronously on the calling thread.
class MockAudioBackend : public AudioBackend {
public:
    struct OpenRecord {
        SourceId source;
        std::string device_id;
    };

    explicit MockAudioBackend(NativeFormat format = {SampleFormat::F32, 48000, 2})
        : format_(format) {}

    std::expected<std::unique_ptr<AudioStream>, Error>
    open(const StreamRequest& request, BufferCallback on_buffer,
         StreamErrorCallback on_error) override {
        std::lock_guard lock(mu_);
        opens_.push_back({request.source, request.device_id});

        if (unavailable_.contains(request.device_id)) {
            return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                         "no such device: " + request.device_id});
        }

        DeviceIdentity dev{
            .id = request.device_id.empty() ? default_id(request.source) : request.device_id,
            .display_name = "Mock device",
            .direction = source_direction(request.source),
        };
        auto stream = std::make_unique<Stream>(*this, request.source, format_, dev,
                                               std::move(on_buffer), std::move(on_error));
        streams_[request.source] = stream.get();
        return stream;
    }

    std::optional<DeviceIdentity> default_device(Direction direction) override {
        auto source = direction == Direction::Input ? SourceId::Microphone : SourceId::SystemOutput;
        return DeviceIdentity{default_id(source), "Default", direction};
    }

    std::vector<DeviceIdentity> list_devices(Direction direction) override {
        if (direction == Direction::Input) {
            return {{"default-mic", "Default", Direction::Input},
                    {"usb-mic", "USB Microphone", Direction::Input}};
        }
        return {{"default-sink", "Default", Direction::Output}};
    }

    void set_topology_listener(TopologyCallback cb) override {
        std::lock_guard lock(mu_);
        topology_ = std::move(cb);
    }

    // ---- test controls ----

    void set_unavailable(const std::string& device_id, bool unavailable) {
        std::lock_guard lock(mu_);
        if (unavailable) unavailable_.insert(device_id);
        else unavailable_.erase(device_id);
    }

    // Delivers one buffer of interleaved native samples. Returns false when
    // no stream is open for the source.
    bool feed(SourceId source, const std::vector<float>& interleaved) {
        std::lock_guard lock(mu_);
        auto it = streams_.find(source);
        if (it == streams_.end()) return false;
        NativeBuffer buf{
            .format = format_,
            .data = interleaved.data(),
            .frames = interleaved.size() / format_.channels,
        };
        it->second->on_buffer(buf);
        return true;
    }

    bool feed_silence(SourceId source, size_t frames = 480) {
        return feed(source, std::vector<float>(frames * format_.channels, 0.0f));
    }

    // Reports the open stream as lost, as PipeWire does when a node vanishes:
    // with the backend lock held, the same lock stream teardown takes.
    void fail(SourceId source, const std::string& reason) {
        std::lock_guard lock(mu_);
        auto it = streams_.find(source);
        if (it == streams_.end()) return;
        if (it->second->on_error) it->second->on_error(Error{ErrorCode::CaptureUnavailable, reason});
    }

    // Runs at the start of every stream teardown, before the backend lock
    // is taken.
    void set_release_hook(std::function<void(SourceId)> hook) {
        std::lock_guard lock(mu_);
        release_hook_ = std::move(hook);
    }

    void topology(const TopologyChange& change) {
        TopologyCallback cb;
        {
            std::lock_guard lock(mu_);
            cb = topology_;
        }
        if (cb) cb(change);
    }

    bool has_topology_listener() {
        std::lock_guard lock(mu_);
        return static_cast<bool>(topology_);
    }

    bool is_open(SourceId source) {
        std::lock_guard lock(mu_);
        return streams_.contains(source);
    }

    std::vector<OpenRecord> opens() {
        std::lock_guard lock(mu_);
        return opens_;
    }

    size_t open_count(SourceId source) {
        std::lock_guard lock(mu_);
        size_t n = 0;
        for (const auto& o : opens_) n += o.source == source;
        return n;
    }

    const NativeFormat& format() const { return format_; }

private:
    struct Stream : AudioStream {
        Stream(MockAudioBackend& owner, SourceId source, NativeFormat fmt, DeviceIdentity dev,
               BufferCallback buffer_cb, StreamErrorCallback error_cb)
            : owner(owner), source(source), fmt(fmt), dev(std::move(dev)),
              on_buffer(std::move(buffer_cb)), on_error(std::move(error_cb)) {}

        ~Stream() override {
            std::function<void(SourceId)> hook;
            {
                std::lock_guard lock(owner.mu_);
                hook = owner.release_hook_;
            }
            if (hook) hook(source);
            std::lock_guard lock(owner.mu_);
            auto it = owner.streams_.find(source);
            if (it != owner.streams_.end() && it->second == this) owner.streams_.erase(it);
        }

        NativeFormat format() const override { return fmt; }
        DeviceIdentity device() const override { return dev; }

        MockAudioBackend& owner;
        SourceId source;
        NativeFormat fmt;
        DeviceIdentity dev;
        BufferCallback on_buffer;
        StreamErrorCallback on_error;
    };

    static std::string default_id(SourceId source) {
        return source == SourceId::Microphone ? "default-mic" : "default-sink";
    }

    NativeFormat format_;
    std::mutex mu_;
    std::map<SourceId, Stream*> streams_;
    std::set<std::string> unavailable_;
    std::vector<OpenRecord> opens_;
    TopologyCallback topology_;
    std::function<void(SourceId)> release_hook_;
};

// Interleaved sine, identical on every channel.
inline std::vector<float> make_tone(const NativeFormat& fmt, size_t frames, double freq,
                                    size_t& position, float amplitude = 0.5f) {
    std::vector<float> out(frames * fmt.channels);
    for (size_t f = 0; f < frames; ++f) {
        double t = static_cast<double>(position + f) / fmt.sample_rate;
        auto s = static_cast<float>(amplitude * std::sin(2.0 * std::numbers::pi * freq * t));
        for (uint32_t c = 0; c < fmt.channels; ++c) out[f * fmt.channels + c] = s;
    }
    position += frames;
    return out;
}

// Polls pred until it holds or the timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
