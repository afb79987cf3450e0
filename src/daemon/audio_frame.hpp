#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SourceId : uint8_t { Microphone = 0, SystemOutput = 1 };

inline constexpr SourceId all_sources[] = {SourceId::Microphone, SourceId::SystemOutput};

// Wire name used in handshakes, IPC and logs.
constexpr std::string_view source_name(SourceId id) {
    return id == SourceId::Microphone ? "mic" : "sys";
}

inline std::optional<SourceId> source_from_name(std::string_view name) {
    if (name == "mic" || name == "microphone") return SourceId::Microphone;
    if (name == "sys" || name == "system") return SourceId::SystemOutput;
    return std::nullopt;
}

enum class Direction : uint8_t { Input, Output };

struct DeviceIdentity {
    std::string id;            // PipeWire node.name
    std::string display_name;  // node.description
    Direction direction = Direction::Input;

    bool operator==(const DeviceIdentity&) const = default;
};

// Microphone records from an input endpoint, system output from a sink monitor.
constexpr Direction source_direction(SourceId id) {
    return id == SourceId::Microphone ? Direction::Input : Direction::Output;
}

enum class SampleFormat : uint8_t { Unknown, F32, S16 };

struct NativeFormat {
    SampleFormat sample_format = SampleFormat::Unknown;
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
};

// Canonical frame: mono int16 little-endian at the target rate.
struct AudioFrame {
    SourceId source = SourceId::Microphone;
    std::vector<int16_t> pcm;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    std::chrono::steady_clock::time_point captured_at;

    size_t byte_size() const { return pcm.size() * sizeof(int16_t); }

    std::chrono::microseconds duration() const {
        if (sample_rate == 0 || channels == 0) return {};
        return std::chrono::microseconds(
            static_cast<int64_t>(pcm.size()) * 1'000'000 / (int64_t(sample_rate) * channels));
    }
};

enum class CaptureSourceState : uint8_t { Stopped, Starting, Running, Restarting, Degraded };

constexpr std::string_view to_string(CaptureSourceState s) {
    switch (s) {
        case CaptureSourceState::Stopped: return "stopped";
        case CaptureSourceState::Starting: return "starting";
        case CaptureSourceState::Running: return "running";
        case CaptureSourceState::Restarting: return "restarting";
        case CaptureSourceState::Degraded: return "degraded";
    }
    return "unknown";
}
