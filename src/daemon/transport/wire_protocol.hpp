#pragma once

#include "transport/stream_transport.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Where to connect and which headers to send with the upgrade request.
struct WireRequest {
    std::string url;
    std::vector<std::string> headers;
};

namespace wire {

struct Transcript {
    TranscriptEvent event;
    // Answer to our Finalize; a closing transport can finish.
    bool finalizes = false;
};

struct HandshakeAck {
    bool ok = false;
    std::string reason;
};

struct FinalizeAck {};
struct Ping {};

struct Ignored {
    std::string type;
};

} // namespace wire

using InboundMessage =
    std::variant<wire::Transcript, wire::HandshakeAck, wire::FinalizeAck, wire::Ping, wire::Ignored>;

// Message layout of one transcription service.
class WireProtocol {
public:
    virtual ~WireProtocol() = default;

    virtual std::string_view name() const = 0;

    virtual WireRequest request(const TransportConfig& cfg) const = 0;

    // First text frame after the upgrade. nullopt means the upgrade itself
    // confirms the session.
    virtual std::optional<std::string> handshake(const TransportConfig& cfg) const = 0;

    // Fails with TransportProtocolError on malformed input.
    virtual std::expected<InboundMessage, Error> decode(std::string_view text,
                                                        SourceId source) const = 0;

    std::string control(ControlKind kind) const;
    std::string pong() const;
};

// Meeting ingest backend: handshake-first, transcripts relayed by the backend.
class BackendProtocol : public WireProtocol {
public:
    std::string_view name() const override { return "backend"; }
    WireRequest request(const TransportConfig& cfg) const override;
    std::optional<std::string> handshake(const TransportConfig& cfg) const override;
    std::expected<InboundMessage, Error> decode(std::string_view text,
                                                SourceId source) const override;
};

// Deepgram live streaming; parameters travel in the query string.
class DeepgramProtocol : public WireProtocol {
public:
    std::string_view name() const override { return "direct"; }
    WireRequest request(const TransportConfig& cfg) const override;
    std::optional<std::string> handshake(const TransportConfig&) const override {
        return std::nullopt;
    }
    std::expected<InboundMessage, Error> decode(std::string_view text,
                                                SourceId source) const override;
};

// "backend" or "direct"; nullptr for anything else.
std::unique_ptr<WireProtocol> make_protocol(std::string_view mode);
