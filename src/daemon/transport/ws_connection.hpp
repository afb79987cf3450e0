#pragma once

#include "errors.hpp"
#include "transport/wire_protocol.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

struct WsMessage {
    enum class Kind : uint8_t { Text, Binary, Close };
    Kind kind = Kind::Text;
    std::string payload;
};

// One WebSocket connection. Used from a single I/O thread.
class WsConnection {
public:
    virtual ~WsConnection() = default;

    // Connects and completes the HTTP upgrade. Blocks up to timeout, or
    // until stop is requested.
    virtual std::expected<void, Error> open(const WireRequest& request,
                                            std::chrono::milliseconds timeout,
                                            std::stop_token stop) = 0;

    virtual std::expected<void, Error> send_text(std::string_view text) = 0;
    virtual std::expected<void, Error> send_binary(std::span<const uint8_t> data) = 0;

    // Non-blocking. nullopt when no complete message is pending.
    virtual std::expected<std::optional<WsMessage>, Error> receive() = 0;

    // Becomes readable when receive() may have something; -1 before open().
    virtual int poll_fd() const = 0;

    virtual void close() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<WsConnection>()>;
