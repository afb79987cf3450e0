#pragma once

#include "config.hpp"
#include "transport/stream_transport.hpp"

#include <functional>
#include <memory>

using TransportFactory = std::function<std::unique_ptr<StreamTransport>(
    const TransportConfig&, StreamTransport::EventCallback)>;

TransportConfig make_transport_config(const Config& config, SourceId source);

// WebSocket transports over libcurl; the wire protocol follows config.mode.
TransportFactory websocket_transport_factory();
