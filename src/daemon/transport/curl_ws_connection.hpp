#pragma once

#include "transport/ws_connection.hpp"

#include <curl/curl.h>
#include <string>

// WebSocket over libcurl's connect-only mode.
class CurlWsConnection : public WsConnection {
public:
    CurlWsConnection();
    ~CurlWsConnection() override;

    CurlWsConnection(const CurlWsConnection&) = delete;
    CurlWsConnection& operator=(const CurlWsConnection&) = delete;

    std::expected<void, Error> open(const WireRequest& request,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token stop) override;
    std::expected<void, Error> send_text(std::string_view text) override;
    std::expected<void, Error> send_binary(std::span<const uint8_t> data) override;
    std::expected<std::optional<WsMessage>, Error> receive() override;
    int poll_fd() const override { return fd_; }
    void close() override;

private:
    std::expected<void, Error> send_frame(const char* data, size_t len, unsigned int flags);
    bool wait_writable(int timeout_ms) const;
    static int on_progress(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    int fd_ = -1;
    std::stop_token stop_;

    // Fragments of the message being received.
    std::string partial_;
    unsigned int partial_flags_ = 0;
};
