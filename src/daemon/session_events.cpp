#include "session_events.hpp"

using json = nlohmann::json;

namespace {

json error_json(const Error& e) {
    return {{"code", std::string(to_string(e.code))}, {"message", e.message}};
}

} // namespace

json to_json(const SessionEvent& event) {
    using namespace session_event;
    return std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, SourceConnected>) {
                return {{"event", "source_connected"}, {"source", std::string(source_name(e.source))}};
            } else if constexpr (std::is_same_v<T, SourceDisconnected>) {
                return {{"event", "source_disconnected"}, {"source", std::string(source_name(e.source))}};
            } else if constexpr (std::is_same_v<T, TransportError>) {
                return {{"event", "transport_error"}, {"source", std::string(source_name(e.source))},
                        {"error", error_json(e.error)}};
            } else if constexpr (std::is_same_v<T, Transcript>) {
                json j = {
                    {"event", "transcript"},
                    {"source", std::string(source_name(e.event.source))},
                    {"kind", std::string(to_string(e.event.kind))},
                    {"text", e.event.text},
                    {"confidence", e.event.confidence},
                    {"timestamp", e.event.timestamp},
                };
                if (!e.event.speaker.empty()) j["speaker"] = e.event.speaker;
                return j;
            } else if constexpr (std::is_same_v<T, CaptureFailed>) {
                return {{"event", "capture_failed"}, {"source", std::string(source_name(e.source))},
                        {"error", error_json(e.error)}};
            } else {
                return {{"event", "source_degraded"}, {"source", std::string(source_name(e.source))},
                        {"device", e.device.id}, {"device_name", e.device.display_name}};
            }
        },
        event);
}
