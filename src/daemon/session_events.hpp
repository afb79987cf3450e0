#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"
#include "transport/stream_transport.hpp"

#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

namespace session_event {

struct SourceConnected {
    SourceId source;
};

struct SourceDisconnected {
    SourceId source;
};

struct TransportError {
    SourceId source;
    Error error;
};

struct Transcript {
    TranscriptEvent event;
};

struct CaptureFailed {
    SourceId source;
    Error error;
};

struct SourceDegraded {
    SourceId source;
    DeviceIdentity device;
};

} // namespace session_event

using SessionEvent = std::variant<session_event::SourceConnected, session_event::SourceDisconnected,
                                  session_event::TransportError, session_event::Transcript,
                                  session_event::CaptureFailed, session_event::SourceDegraded>;

// One IPC line: {"event": "...", ...}.
nlohmann::json to_json(const SessionEvent& event);
