#include "errors.hpp"

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CaptureUnavailable: return "capture_unavailable";
        case ErrorCode::CapturePermissionDenied: return "capture_permission_denied";
        case ErrorCode::FormatNegotiationError: return "format_negotiation_error";
        case ErrorCode::DeviceChangeTimeout: return "device_change_timeout";
        case ErrorCode::TransportHandshakeFailed: return "transport_handshake_failed";
        case ErrorCode::TransportSendFailed: return "transport_send_failed";
        case ErrorCode::TransportProtocolError: return "transport_protocol_error";
        case ErrorCode::BufferOverrun: return "buffer_overrun";
    }
    return "unknown";
}
