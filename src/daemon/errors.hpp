#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    CaptureUnavailable,
    CapturePermissionDenied,
    FormatNegotiationError,
    DeviceChangeTimeout,
    TransportHandshakeFailed,
    TransportSendFailed,
    TransportProtocolError,
    BufferOverrun,
};

struct Error {
    ErrorCode code;
    std::string message;
};

// Stable snake_case name, used in IPC events.
std::string_view to_string(ErrorCode code);
