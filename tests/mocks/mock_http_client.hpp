#ifndef MCPENUM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MCPENUM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "mcpenum/discovery/http_strategy.hpp"
#include "mcpenum/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpenum::testing {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Answers from a queue of canned responses first, then from a handler.
// Every request is recorded together with the read timeout in force.
//
// The discovery strategy creates its own client per server; hand it
// factory(mock) so all those clients forward to this one instance.

struct RecordedRequest {
    HttpMethod method;
    std::string path;
    std::string body;
    std::string content_type;
    HeaderMap headers;
    std::chrono::milliseconds read_timeout{0};

    /// JSON-RPC method of a POST body, empty otherwise
    [[nodiscard]] std::string rpc_method() const {
        const auto j = Json::parse(body, nullptr, false);
        if (j.is_discarded() || (j.is_object() == false)) {
            return "";
        }
        return j.value("method", "");
    }
};

class MockHttpClient final : public IHttpClient {
public:
    using ResponseHandler = std::function<HttpClientResult<HttpClientResponse>(const RecordedRequest& request)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const HeaderMap& headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(HttpClientResponse{status_code, headers, body});
    }

    void queue_json_response(int status_code, const std::string& body) {
        queue_response(status_code, body, {{"Content-Type", "application/json"}});
    }

    void queue_sse_response(const std::string& body) {
        queue_response(200, body, {{"Content-Type", "text/event-stream"}});
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(tl::unexpected(HttpClientError{code, message}));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    void set_response_handler(ResponseHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] bool was_requested(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& req : requests_) {
            if (req.path == path) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::string base_url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return base_url_;
    }

    [[nodiscard]] HeaderMap default_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_headers_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient
    // ─────────────────────────────────────────────────────────────────────────

    void set_base_url(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(const std::string& path, const HeaderMap& headers = {}) override {
        return make_request(HttpMethod::Get, path, "", "", headers);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) override {
        return make_request(HttpMethod::Post, path, body, content_type, headers);
    }

private:
    HttpClientResult<HttpClientResponse> make_request(
        HttpMethod method,
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) {
        ResponseHandler handler;
        RecordedRequest req{method, path, body, content_type, headers, std::chrono::milliseconds{0}};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            req.read_timeout = read_timeout_;
            requests_.push_back(req);

            if (queue_.empty() == false) {
                auto next = std::move(queue_.front());
                queue_.pop_front();
                return next;
            }
            handler = handler_;
        }

        // Outside the lock: handlers may block to simulate slow servers
        if (handler) {
            return handler(req);
        }
        return tl::unexpected(HttpClientError{HttpClientError::Code::ConnectionFailed, "No mock response queued"});
    }

    mutable std::mutex mutex_;
    std::deque<HttpClientResult<HttpClientResponse>> queue_;
    ResponseHandler handler_;
    std::vector<RecordedRequest> requests_;

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{0};
    std::chrono::milliseconds read_timeout_{0};
    bool verify_ssl_{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// Forwarding client + factory
// ─────────────────────────────────────────────────────────────────────────────

class ForwardingHttpClient final : public IHttpClient {
public:
    explicit ForwardingHttpClient(std::shared_ptr<MockHttpClient> target) : target_(std::move(target)) {}

    void set_base_url(const std::string& url) override { target_->set_base_url(url); }
    void set_default_headers(const HeaderMap& headers) override { target_->set_default_headers(headers); }
    void set_connect_timeout(std::chrono::milliseconds timeout) override { target_->set_connect_timeout(timeout); }
    void set_read_timeout(std::chrono::milliseconds timeout) override { target_->set_read_timeout(timeout); }
    void set_verify_ssl(bool verify) override { target_->set_verify_ssl(verify); }

    HttpClientResult<HttpClientResponse> get(const std::string& path, const HeaderMap& headers = {}) override {
        return target_->get(path, headers);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) override {
        return target_->post(path, body, content_type, headers);
    }

private:
    std::shared_ptr<MockHttpClient> target_;
};

inline HttpClientFactory factory(std::shared_ptr<MockHttpClient> mock) {
    return [mock]() -> std::unique_ptr<IHttpClient> {
        return std::make_unique<ForwardingHttpClient>(mock);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Scripted MCP endpoint
// ─────────────────────────────────────────────────────────────────────────────
// Handler that behaves like a streamable HTTP MCP server advertising `tools`:
// initialize -> result with a session id, notifications -> 202,
// tools/list -> {"tools": tools}.

inline MockHttpClient::ResponseHandler mcp_server_handler(Json tools, std::string session_id = "session-1") {
    return [tools = std::move(tools), session_id = std::move(session_id)](const RecordedRequest& request)
        -> HttpClientResult<HttpClientResponse> {
        const auto message = Json::parse(request.body, nullptr, false);
        if (message.is_discarded() || (message.is_object() == false)) {
            return HttpClientResponse{400, {}, "bad request"};
        }
        const std::string method = message.value("method", "");
        if (message.contains("id") == false) {
            return HttpClientResponse{202, {}, ""};
        }

        Json result;
        if (method == "initialize") {
            result = {
                {"protocolVersion", "2025-06-18"},
                {"capabilities", {{"tools", Json::object()}}},
                {"serverInfo", {{"name", "mock-http"}, {"version", "1.0"}}}
            };
        } else if (method == "tools/list") {
            result = {{"tools", tools}};
        } else {
            return HttpClientResponse{200, {{"Content-Type", "application/json"}},
                Json{{"jsonrpc", "2.0"}, {"id", message["id"]},
                     {"error", {{"code", -32601}, {"message", "Method not found"}}}}.dump()};
        }

        const Json response = {{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", result}};
        return HttpClientResponse{
            200,
            {{"Content-Type", "application/json"}, {"Mcp-Session-Id", session_id}},
            response.dump()
        };
    };
}

}  // namespace mcpenum::testing

#endif  // MCPENUM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
