#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

// One buffer as delivered by the device, in its negotiated native format.
struct NativeBuffer {
    NativeFormat format;
    const void* data = nullptr;
    size_t frames = 0;

    std::span<const float> f32() const {
        return {static_cast<const float*>(data), frames * format.channels};
    }
    std::span<const int16_t> s16() const {
        return {static_cast<const int16_t*>(data), frames * format.channels};
    }
};

struct StreamRequest {
    SourceId source = SourceId::Microphone;
    // Device node name; empty follows the platform default.
    std::string device_id;
};

struct TopologyChange {
    Direction direction = Direction::Input;
    std::string reason;
};

// An open capture stream. Destroying it releases the device; no callback
// runs after the destructor returns.
class AudioStream {
public:
    virtual ~AudioStream() = default;
    virtual NativeFormat format() const = 0;
    virtual DeviceIdentity device() const = 0;
};

class AudioBackend {
public:
    // Runs on the device's real-time thread. Must not block.
    using BufferCallback = std::function<void(const NativeBuffer&)>;
    // The stream failed after opening (device unplugged, node removed).
    using StreamErrorCallback = std::function<void(const Error&)>;
    // Endpoint added, removed or default changed. Runs on a platform thread.
    using TopologyCallback = std::function<void(const TopologyChange&)>;

    virtual ~AudioBackend() = default;

    // Opens a stream and waits for format negotiation. Fails with
    // CaptureUnavailable when no matching endpoint exists.
    virtual std::expected<std::unique_ptr<AudioStream>, Error>
        open(const StreamRequest& request, BufferCallback on_buffer,
             StreamErrorCallback on_error) = 0;

    virtual std::optional<DeviceIdentity> default_device(Direction direction) = 0;
    virtual std::vector<DeviceIdentity> list_devices(Direction direction) = 0;

    virtual void set_topology_listener(TopologyCallback cb) = 0;
};
