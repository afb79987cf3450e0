#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class TransportState : uint8_t { Idle, Connecting, Connected, Closing, Disconnected };

constexpr std::string_view to_string(TransportState s) {
    switch (s) {
        case TransportState::Idle: return "idle";
        case TransportState::Connecting: return "connecting";
        case TransportState::Connected: return "connected";
        case TransportState::Closing: return "closing";
        case TransportState::Disconnected: return "disconnected";
    }
    return "unknown";
}

enum class TranscriptKind : uint8_t { Live, Done, Final };

constexpr std::string_view to_string(TranscriptKind k) {
    switch (k) {
        case TranscriptKind::Live: return "live";
        case TranscriptKind::Done: return "done";
        case TranscriptKind::Final: return "final";
    }
    return "unknown";
}

struct TranscriptEvent {
    TranscriptKind kind = TranscriptKind::Live;
    std::string text;
    double confidence = 0.0;
    // Diarization label ("Speaker 0"); empty when the service sent none.
    std::string speaker;
    SourceId source = SourceId::Microphone;
    // Seconds from stream start as reported by the service.
    double timestamp = 0.0;
};

enum class ControlKind : uint8_t { KeepAlive, Finalize, CloseStream };

constexpr std::string_view to_string(ControlKind k) {
    switch (k) {
        case ControlKind::KeepAlive: return "KeepAlive";
        case ControlKind::Finalize: return "Finalize";
        case ControlKind::CloseStream: return "CloseStream";
    }
    return "unknown";
}

// Everything one transport needs; derived from Config per source.
struct TransportConfig {
    SourceId source = SourceId::Microphone;
    std::string mode = "backend";
    std::string endpoint;
    std::string auth_token;
    std::string meeting_id;
    std::string device_id;
    std::string language = "en";
    std::string model = "nova-2";
    uint32_t sample_rate = 16000;
    uint32_t channels = 1;

    std::chrono::milliseconds ring_buffer{500};
    size_t max_frame_bytes = 32 * 1024;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds close_timeout{3000};
    std::chrono::milliseconds keepalive_interval{5000};
    std::vector<std::chrono::milliseconds> reconnect_delays{
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000),
        std::chrono::milliseconds(5000), std::chrono::milliseconds(10000),
        std::chrono::milliseconds(30000)};
    uint32_t max_reconnect_attempts = 5; // 0 = unlimited
};

struct TransportStats {
    uint64_t frames_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t frames_buffered = 0;
    uint64_t bytes_evicted = 0;
    uint64_t frames_evicted = 0;
    uint64_t oversized_rejected = 0;
    uint64_t protocol_errors = 0;
    uint64_t reconnects = 0;
    uint64_t overruns = 0;
    // Frames sent since the last transition to Connected.
    uint64_t sequence = 0;
};

struct TransportStateChanged {
    TransportState state;
};

using TransportEvent = std::variant<TransportStateChanged, TranscriptEvent, Error>;

// Duplex channel to a transcription service for one source.
//
// All methods are thread-safe and return without waiting on the network,
// except close(), which waits up to the close timeout.
class StreamTransport {
public:
    // Runs on the transport's I/O thread.
    using EventCallback = std::function<void(SourceId, TransportEvent)>;

    virtual ~StreamTransport() = default;

    // Starts connecting; progress is reported through events.
    virtual void connect() = 0;

    // Sends the frame when Connected, otherwise keeps it in the ring buffer
    // until the next connection. Never throws.
    virtual void send_pcm(AudioFrame frame) noexcept = 0;

    virtual void send_control(ControlKind kind) = 0;

    // Finalizes and tears down. Returns once Disconnected. Idempotent.
    virtual void close() = 0;

    virtual TransportState state() const = 0;
    virtual TransportStats stats() const = 0;
    virtual const TransportConfig& config() const = 0;
};
