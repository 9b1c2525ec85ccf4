#include "mcpenum/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (libcurl underneath) with the connect and total timeouts applied to
// every request. cpr::Timeout bounds the whole transfer, so a server that
// accepts the connection and then stalls is cut off at the deadline.

class CprHttpClient final : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto response = cpr::Get(
            cpr::Url{*url},
            build_headers(headers),
            cpr::ConnectTimeout{effective_connect_timeout()},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{effective_connect_timeout()},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

private:
    // Connecting can never take longer than the request as a whole
    [[nodiscard]] std::chrono::milliseconds effective_connect_timeout() const {
        return std::min(connect_timeout_, read_timeout_);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Path validation
    // ─────────────────────────────────────────────────────────────────────────
    // Paths come from configuration (server URLs) and from the fixed REST
    // probe list. Reject control characters and traversal sequences so a
    // configured URL cannot be bent into a different endpoint on the host.

    static bool contains_traversal_pattern(const std::string& path) {
        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        const bool literal = (lower.find("/../") != std::string::npos) ||
                             lower.ends_with("/..");
        const bool encoded = (lower.find("%2e%2e") != std::string::npos) ||
                             (lower.find("%2e.") != std::string::npos) ||
                             (lower.find(".%2e") != std::string::npos) ||
                             (lower.find("%252e") != std::string::npos);
        const bool backslash = (lower.find("..\\") != std::string::npos) ||
                               (lower.find("..%5c") != std::string::npos);
        return literal || encoded || backslash;
    }

    static bool contains_control_characters(const std::string& path) {
        return std::any_of(path.begin(), path.end(), [](unsigned char c) {
            return (c < 0x20) || (c == 0x7F);
        });
    }

    HttpClientResult<std::string> build_url(const std::string& path) const {
        if (contains_control_characters(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Path contains control characters"));
        }
        if (contains_traversal_pattern(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Path traversal pattern detected in URL path"));
        }
        const bool has_leading_slash = (path.empty() == false) && (path.front() == '/');
        return base_url_ + (has_leading_slash ? path : "/" + path);
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            default:
                // DNS, refused, reset: all connection-level
                return HttpClientError::connection_failed(msg);
        }
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcpenum
