#include "transport/curl_ws_connection.hpp"

#include <format>
#include <mutex>
#include <poll.h>
#include <print>

namespace {

constexpr int send_stall_timeout_ms = 1000;

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Error send_error(std::string message) {
    return Error{ErrorCode::TransportSendFailed, std::move(message)};
}

} // namespace

CurlWsConnection::CurlWsConnection() {
    global_init();
}

CurlWsConnection::~CurlWsConnection() {
    close();
}

std::expected<void, Error> CurlWsConnection::open(const WireRequest& request,
                                                  std::chrono::milliseconds timeout,
                                                  std::stop_token stop) {
    close();
    stop_ = std::move(stop);

    curl_ = curl_easy_init();
    if (!curl_) {
        return std::unexpected(Error{ErrorCode::TransportHandshakeFailed, "curl_easy_init failed"});
    }

    for (const auto& h : request.headers) {
        headers_ = curl_slist_append(headers_, h.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &CurlWsConnection::on_progress);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl_);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        close();
        return std::unexpected(Error{ErrorCode::TransportHandshakeFailed,
                                     std::format("connect to {} aborted", request.url)});
    }
    if (res != CURLE_OK) {
        auto err = Error{ErrorCode::TransportHandshakeFailed,
                         std::format("connect to {} failed: {}", request.url, curl_easy_strerror(res))};
        close();
        return std::unexpected(std::move(err));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 101) {
        auto err = Error{ErrorCode::TransportHandshakeFailed,
                         std::format("upgrade refused with HTTP {}", status)};
        close();
        return std::unexpected(std::move(err));
    }

    curl_socket_t sock = CURL_SOCKET_BAD;
    res = curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock);
    if (res != CURLE_OK || sock == CURL_SOCKET_BAD) {
        close();
        return std::unexpected(Error{ErrorCode::TransportHandshakeFailed, "no active socket"});
    }
    fd_ = static_cast<int>(sock);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 1L);
    return {};
}

// Called by libcurl about once a second, and on every socket event, while
// the connect is in progress.
int CurlWsConnection::on_progress(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<CurlWsConnection*>(self)->stop_.stop_requested() ? 1 : 0;
}

std::expected<void, Error> CurlWsConnection::send_text(std::string_view text) {
    return send_frame(text.data(), text.size(), CURLWS_TEXT);
}

std::expected<void, Error> CurlWsConnection::send_binary(std::span<const uint8_t> data) {
    return send_frame(reinterpret_cast<const char*>(data.data()), data.size(), CURLWS_BINARY);
}

std::expected<void, Error> CurlWsConnection::send_frame(const char* data, size_t len,
                                                        unsigned int flags) {
    if (!curl_) return std::unexpected(send_error("not connected"));

    size_t offset = 0;
    do {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, data + offset, len - offset, &sent, 0, flags);
        if (res == CURLE_AGAIN) {
            if (!wait_writable(send_stall_timeout_ms)) {
                return std::unexpected(send_error("send stalled"));
            }
            continue;
        }
        if (res != CURLE_OK) {
            return std::unexpected(send_error(std::format("send failed: {}", curl_easy_strerror(res))));
        }
        offset += sent;
    } while (offset < len);
    return {};
}

bool CurlWsConnection::wait_writable(int timeout_ms) const {
    if (fd_ < 0) return false;
    pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLOUT);
}

std::expected<std::optional<WsMessage>, Error> CurlWsConnection::receive() {
    if (!curl_) return std::unexpected(Error{ErrorCode::TransportProtocolError, "not connected"});

    char buf[16384];
    for (;;) {
        size_t n = 0;
        const curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(curl_, buf, sizeof(buf), &n, &meta);
        if (res == CURLE_AGAIN) return std::optional<WsMessage>{};
        if (res == CURLE_GOT_NOTHING) {
            return WsMessage{.kind = WsMessage::Kind::Close, .payload = {}};
        }
        if (res != CURLE_OK) {
            return std::unexpected(Error{ErrorCode::TransportSendFailed,
                                         std::format("receive failed: {}", curl_easy_strerror(res))});
        }
        if (!meta) continue;

        if (meta->flags & CURLWS_CLOSE) {
            return WsMessage{.kind = WsMessage::Kind::Close, .payload = std::string(buf, n)};
        }
        // libcurl answers pings itself.
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;

        if (partial_.empty()) partial_flags_ = meta->flags;
        partial_.append(buf, n);
        if (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT)) continue;

        WsMessage msg;
        msg.kind = (partial_flags_ & CURLWS_BINARY) ? WsMessage::Kind::Binary : WsMessage::Kind::Text;
        msg.payload = std::move(partial_);
        partial_.clear();
        partial_flags_ = 0;
        return msg;
    }
}

void CurlWsConnection::close() {
    if (curl_) {
        if (fd_ >= 0) {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            if (res != CURLE_OK && res != CURLE_AGAIN) {
                std::println(stderr, "transport: close frame not sent: {}", curl_easy_strerror(res));
            }
        }
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    fd_ = -1;
    stop_ = {};
    partial_.clear();
    partial_flags_ = 0;
}
