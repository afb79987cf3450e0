#include "transport/transport_factory.hpp"

#include "transport/curl_ws_connection.hpp"
#include "transport/wire_protocol.hpp"
#include "transport/ws_stream_transport.hpp"

#include <print>

TransportConfig make_transport_config(const Config& config, SourceId source) {
    const auto& t = config.transport;
    TransportConfig tc;
    tc.source = source;
    tc.mode = t.mode;
    tc.endpoint = t.endpoint;
    tc.auth_token = t.auth_token;
    tc.meeting_id = t.meeting_id;
    tc.device_id = t.device_id;
    tc.language = t.language;
    tc.model = t.model;
    tc.sample_rate = config.audio.target_sample_rate;
    tc.channels = config.audio.channels;
    tc.ring_buffer = std::chrono::milliseconds(t.ring_buffer_ms);
    tc.max_frame_bytes = t.max_frame_bytes;
    tc.connect_timeout = std::chrono::milliseconds(t.connect_timeout_ms);
    tc.handshake_timeout = std::chrono::milliseconds(t.handshake_timeout_ms);
    tc.close_timeout = std::chrono::milliseconds(t.close_timeout_ms);
    tc.keepalive_interval = std::chrono::milliseconds(t.keepalive_interval_ms);
    tc.reconnect_delays = to_durations(t.reconnect_delays_ms);
    tc.max_reconnect_attempts = t.max_reconnect_attempts;
    return tc;
}

TransportFactory websocket_transport_factory() {
    return [](const TransportConfig& cfg, StreamTransport::EventCallback on_event)
               -> std::unique_ptr<StreamTransport> {
        auto protocol = make_protocol(cfg.mode);
        if (!protocol) {
            std::println(stderr, "transport: unknown mode '{}', using backend", cfg.mode);
            protocol = std::make_unique<BackendProtocol>();
        }
        return std::make_unique<WsStreamTransport>(
            cfg, std::move(protocol), [] { return std::make_unique<CurlWsConnection>(); },
            std::move(on_event));
    };
}
