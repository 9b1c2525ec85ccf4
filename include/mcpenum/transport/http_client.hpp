#pragma once

#include "mcpenum/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Transport-level failures only. A response with any status code is a
// success at this layer; callers interpret the status.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpClientError::Code::Timeout:          return "Timeout";
        case HttpClientError::Code::SslError:         return "SslError";
        case HttpClientError::Code::InvalidRequest:   return "InvalidRequest";
        case HttpClientError::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_client_error() const {
        return (status_code >= 400) && (status_code < 500);
    }

    [[nodiscard]] bool is_server_error() const {
        return (status_code >= 500) && (status_code < 600);
    }

    [[nodiscard]] bool is_sse() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) {
            return false;
        }
        return content_type->find("text/event-stream") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Blocking, timeout-bounded requests against one base URL. Discovery creates
// a fresh client per server and resets the read timeout before every call
// to the time left on that server's deadline.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Origin such as "https://api.example.com:443"; paths are appended
    virtual void set_base_url(const std::string& url) = 0;

    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Upper bound on the whole exchange, not just the first byte
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;
};

/// Default implementation, backed by cpr
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcpenum
