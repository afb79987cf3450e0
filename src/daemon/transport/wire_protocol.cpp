#include "transport/wire_protocol.hpp"

#include <cctype>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

Error protocol_error(std::string message) {
    return Error{ErrorCode::TransportProtocolError, std::move(message)};
}

// Query-string escaping for the few values users configure.
std::string url_escape(std::string_view in) {
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

std::string trim_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

std::expected<json, Error> parse_object(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::unexpected(protocol_error("inbound payload is not JSON"));
    if (!j.is_object()) return std::unexpected(protocol_error("inbound payload is not an object"));
    if (!j.contains("type") || !j["type"].is_string()) {
        return std::unexpected(protocol_error("inbound payload has no type"));
    }
    return j;
}

bool truthy(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return false;
    const auto& v = obj[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) return v.get<std::string>() == "true";
    return false;
}

} // namespace

std::string WireProtocol::control(ControlKind kind) const {
    return json{{"type", std::string(to_string(kind))}}.dump();
}

std::string WireProtocol::pong() const {
    return json{{"type", "pong"}}.dump();
}

// ---- backend ----

WireRequest BackendProtocol::request(const TransportConfig& cfg) const {
    WireRequest req;
    req.url = std::format("{}/ws/ingest/meetings/{}?source={}", trim_slash(cfg.endpoint),
                          url_escape(cfg.meeting_id), source_name(cfg.source));
    if (!cfg.auth_token.empty()) req.headers.push_back("Authorization: Bearer " + cfg.auth_token);
    return req;
}

std::optional<std::string> BackendProtocol::handshake(const TransportConfig& cfg) const {
    json j = {
        {"type", "handshake"},
        {"meeting_id", cfg.meeting_id},
        {"source", std::string(source_name(cfg.source))},
        {"sample_rate", cfg.sample_rate},
        {"channels", cfg.channels},
        {"language", cfg.language},
        {"device_id", std::format("{}-{}", cfg.device_id, source_name(cfg.source))},
        {"codec", "pcm_s16le"},
        {"client", "meetcap"},
    };
    return j.dump();
}

std::expected<InboundMessage, Error> BackendProtocol::decode(std::string_view text,
                                                             SourceId source) const {
    auto parsed = parse_object(text);
    if (!parsed) return std::unexpected(parsed.error());
    const json& j = *parsed;
    auto type = j["type"].get<std::string>();

    if (type == "handshake-ack") {
        wire::HandshakeAck ack;
        ack.ok = j.value("ok", false);
        if (j.contains("error") && j["error"].is_string()) ack.reason = j["error"].get<std::string>();
        else if (j.contains("reason") && j["reason"].is_string()) ack.reason = j["reason"].get<std::string>();
        return ack;
    }
    if (type == "ping") return wire::Ping{};
    if (type == "finalize-ack" || type == "finalized") return wire::FinalizeAck{};

    if (type == "transcript.partial" || type == "transcript.final") {
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(protocol_error(std::format("{} without text", type)));
        }
        wire::Transcript t;
        t.event.kind = type == "transcript.final" ? TranscriptKind::Final : TranscriptKind::Live;
        t.event.text = j["text"].get<std::string>();
        t.event.source = source;
        if (j.contains("confidence") && j["confidence"].is_number()) {
            t.event.confidence = j["confidence"].get<double>();
        }
        if (j.contains("speaker") && j["speaker"].is_string()) {
            t.event.speaker = j["speaker"].get<std::string>();
        }
        if (j.contains("start_ms") && j["start_ms"].is_number()) {
            t.event.timestamp = j["start_ms"].get<double>() / 1000.0;
        }
        if (j.contains("meta")) {
            t.finalizes = truthy(j["meta"], "from_finalize");
        }
        return t;
    }

    return wire::Ignored{type};
}

// ---- deepgram ----

WireRequest DeepgramProtocol::request(const TransportConfig& cfg) const {
    WireRequest req;
    req.url = std::format(
        "{}?encoding=linear16&sample_rate={}&channels={}&model={}&language={}"
        "&interim_results=true&punctuate=true&smart_format=true&diarize=true&endpointing=300",
        trim_slash(cfg.endpoint), cfg.sample_rate, cfg.channels, url_escape(cfg.model),
        url_escape(cfg.language));
    if (!cfg.auth_token.empty()) req.headers.push_back("Authorization: Token " + cfg.auth_token);
    return req;
}

std::expected<InboundMessage, Error> DeepgramProtocol::decode(std::string_view text,
                                                              SourceId source) const {
    auto parsed = parse_object(text);
    if (!parsed) return std::unexpected(parsed.error());
    const json& j = *parsed;
    auto type = j["type"].get<std::string>();

    if (type == "Metadata") return wire::FinalizeAck{};
    if (type != "Results") return wire::Ignored{type};

    if (!j.contains("channel") || !j["channel"].is_object()) {
        return std::unexpected(protocol_error("Results without channel"));
    }
    const auto& alts = j["channel"].value("alternatives", json::array());
    if (!alts.is_array() || alts.empty() || !alts[0].is_object()) {
        return std::unexpected(protocol_error("Results without alternatives"));
    }
    const auto& alt = alts[0];
    if (!alt.contains("transcript") || !alt["transcript"].is_string()) {
        return std::unexpected(protocol_error("Results without transcript"));
    }

    bool is_final = truthy(j, "is_final");
    bool speech_final = truthy(j, "speech_final");
    bool from_finalize = truthy(j, "from_finalize");

    wire::Transcript t;
    t.finalizes = from_finalize;
    t.event.source = source;
    t.event.text = alt["transcript"].get<std::string>();
    if (!is_final) {
        t.event.kind = TranscriptKind::Live;
    } else if (speech_final || from_finalize) {
        t.event.kind = TranscriptKind::Final;
    } else {
        t.event.kind = TranscriptKind::Done;
    }
    if (alt.contains("confidence") && alt["confidence"].is_number()) {
        t.event.confidence = alt["confidence"].get<double>();
    }
    if (alt.contains("words") && alt["words"].is_array() && !alt["words"].empty()) {
        const auto& w = alt["words"][0];
        if (w.is_object() && w.contains("speaker") && w["speaker"].is_number_integer()) {
            t.event.speaker = std::format("Speaker {}", w["speaker"].get<int>());
        }
    }
    if (j.contains("start") && j["start"].is_number()) {
        t.event.timestamp = j["start"].get<double>();
    }
    return t;
}

std::unique_ptr<WireProtocol> make_protocol(std::string_view mode) {
    if (mode == "backend") return std::make_unique<BackendProtocol>();
    if (mode == "direct") return std::make_unique<DeepgramProtocol>();
    return nullptr;
}
