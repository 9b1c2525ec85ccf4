#include "mcpenum/discovery/http_strategy.hpp"
#include "mcpenum/json/fast_json.hpp"
#include "mcpenum/log/logger.hpp"
#include "mcpenum/protocol/json_rpc.hpp"
#include "mcpenum/protocol/mcp_types.hpp"
#include "mcpenum/transport/sse_parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <thread>
#include <vector>

namespace mcpenum {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{50};
constexpr std::size_t kBodySnippetLength = 200;
constexpr const char* kAcceptHeader = "application/json, text/event-stream";
constexpr const char* kProtocolVersionHeader = "MCP-Protocol-Version";

std::string snippet(const std::string& body) {
    if (body.size() <= kBodySnippetLength) {
        return body;
    }
    return body.substr(0, kBodySnippetLength) + "...";
}

DiscoveryError from_client_error(const HttpClientError& error) {
    switch (error.code) {
        case HttpClientError::Code::Timeout:
            return DiscoveryError::timeout("HTTP request timed out: " + error.message);
        case HttpClientError::Code::InvalidRequest:
            return DiscoveryError::configuration("Invalid HTTP request: " + error.message);
        case HttpClientError::Code::ConnectionFailed:
        case HttpClientError::Code::SslError:
        case HttpClientError::Code::Unknown:
            return DiscoveryError::connection_failure(error.message);
    }
    return DiscoveryError::connection_failure(error.message);
}

DiscoveryError from_status(const HttpClientResponse& response) {
    std::string message = "HTTP " + std::to_string(response.status_code);
    if (response.body.empty() == false) {
        message += ": " + snippet(response.body);
    }
    return DiscoveryError::upstream(std::move(message));
}

DiscoveryError deadline_error(const Deadline& deadline) {
    if (deadline.cancelled()) {
        return DiscoveryError::timeout("Overall request timeout exceeded");
    }
    return DiscoveryError::timeout("Server discovery timed out");
}

// Wakes early when the overall request is cancelled
void interruptible_sleep(std::chrono::milliseconds delay, const Deadline& deadline) {
    const auto wake_at = Clock::now() + delay;
    while ((Clock::now() < wake_at) && (deadline.cancelled() == false)) {
        const auto left = std::chrono::ceil<std::chrono::milliseconds>(wake_at - Clock::now());
        std::this_thread::sleep_for(std::min(left, kSleepSlice));
    }
}

std::optional<std::chrono::milliseconds> retry_after(const HttpClientResponse& response) {
    const auto header = get_header(response.headers, "Retry-After");
    if (header.has_value() == false) {
        return std::nullopt;
    }
    int seconds = 0;
    const auto* first = header->data();
    const auto* last = header->data() + header->size();
    const auto [ptr, ec] = std::from_chars(first, last, seconds);
    const bool valid = (ec == std::errc{}) && (ptr == last) && (seconds >= 0);
    if (valid == false) {
        return std::nullopt;  // HTTP-date form is not worth honoring here
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(seconds) * 1000};
}

// Tool array in a REST listing: [..], {"tools": [..]} or {"data": [..]}
const Json* find_tool_array(const Json& payload) {
    if (payload.is_array()) {
        return &payload;
    }
    if (payload.is_object() == false) {
        return nullptr;
    }
    for (const char* key : {"tools", "data"}) {
        const auto it = payload.find(key);
        if ((it != payload.end()) && it->is_array()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::vector<DiscoveredTool> tag_tools(const std::string& server, std::vector<Tool> tools) {
    std::vector<DiscoveredTool> out;
    out.reserve(tools.size());
    for (auto& tool : tools) {
        out.push_back(DiscoveredTool{server, std::move(tool.name), std::move(tool.description), std::move(tool.input_schema)});
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpSession - state of one discover() call
// ─────────────────────────────────────────────────────────────────────────────

class HttpSession {
public:
    HttpSession(
        const std::string& server,
        IHttpClient& client,
        const UrlComponents& url,
        const Deadline& deadline,
        const RetryPolicy& retry_policy,
        IBackoffPolicy& backoff_policy
    )
        : server_(server)
        , client_(client)
        , url_(url)
        , deadline_(deadline)
        , retry_policy_(retry_policy)
        , backoff_policy_(backoff_policy)
    {}

    [[nodiscard]] std::int64_t next_id() noexcept {
        return next_id_++;
    }

    void set_protocol_version(const std::string& version) {
        if (version.empty() == false) {
            protocol_version_ = version;
        }
    }

    /// POST with retries. Any response that is not retried is returned,
    /// whatever its status.
    tl::expected<HttpClientResponse, DiscoveryError> post(const Json& message) {
        const std::string body = message.dump();

        for (std::size_t attempt = 0; ; ++attempt) {
            const bool out_of_time = deadline_.cancelled() || deadline_.expired();
            if (out_of_time) {
                return tl::unexpected(deadline_error(deadline_));
            }
            client_.set_read_timeout(deadline_.remaining());

            auto result = client_.post(url_.path_with_query(), body, "application/json", request_headers());

            DiscoveryError last_error;
            std::optional<std::chrono::milliseconds> server_delay;
            if (result.has_value() == false) {
                last_error = from_client_error(result.error());
                const bool retryable = retry_policy_.should_retry(result.error().code, attempt);
                if (retryable == false) {
                    get_logger().debug_fmt("Server '{}': not retrying after attempt {}: {}",
                                           server_, attempt + 1, result.error().message);
                    return tl::unexpected(last_error);
                }
            } else {
                remember_session(*result);
                const bool retryable = (result->is_success() == false) &&
                                       retry_policy_.should_retry_http_status(result->status_code, attempt);
                if (retryable == false) {
                    return std::move(*result);
                }
                last_error = from_status(*result);
                server_delay = retry_after(*result);
            }

            const auto delay = server_delay.value_or(backoff_policy_.next_delay(attempt));
            if (delay >= deadline_.remaining()) {
                get_logger().debug_fmt("Server '{}': no time left for retry", server_);
                return tl::unexpected(last_error);
            }
            get_logger().info_fmt("Server '{}': retrying in {}ms (attempt {}/{}): {}",
                                  server_, delay.count(), attempt + 1,
                                  retry_policy_.max_attempts(), last_error.message);
            interruptible_sleep(delay, deadline_);
        }
    }

    /// Request/response round trip; returns the JSON-RPC result
    tl::expected<Json, DiscoveryError> call(const std::string& method, Json params) {
        const JsonRpcRequest request(method, next_id(), std::move(params));
        auto response = post(request.to_json());
        if (response.has_value() == false) {
            return tl::unexpected(response.error());
        }
        return decode(*response, request.id());
    }

    tl::expected<Json, DiscoveryError> decode(const HttpClientResponse& response, const JsonRpcId& id) {
        if (response.is_success() == false) {
            return tl::unexpected(from_status(response));
        }
        if (response.body.empty()) {
            return tl::unexpected(DiscoveryError::malformed_response(
                "empty body (HTTP " + std::to_string(response.status_code) + ")"));
        }

        auto message = response.is_sse() ? response_from_stream(response.body, id)
                                         : response_from_body(response.body);
        if (message.has_value() == false) {
            return tl::unexpected(message.error());
        }

        auto rpc = JsonRpcResponse::from_json(*message);
        if (rpc.has_value() == false) {
            return tl::unexpected(DiscoveryError::malformed_response(rpc.error().message));
        }
        if ((rpc->id() == id) == false) {
            return tl::unexpected(DiscoveryError::protocol(
                "Response id " + rpc->id().to_string() + " does not match request id " + id.to_string()));
        }
        if (rpc->is_error()) {
            return tl::unexpected(DiscoveryError::upstream(
                "JSON-RPC error " + std::to_string(rpc->error().code) + ": " + rpc->error().message));
        }
        return rpc->result();
    }

    /// Notifications expect 202 and no body; failures only get logged
    void notify(const std::string& method) {
        const JsonRpcNotification notification(method);
        auto response = post(notification.to_json());
        if (response.has_value() == false) {
            get_logger().warn_fmt("Server '{}': {} failed: {}", server_, method, response.error().message);
            return;
        }
        if (response->is_success() == false) {
            get_logger().warn_fmt("Server '{}': {} answered HTTP {}", server_, method, response->status_code);
        }
    }

    /// GET a few conventional REST listing paths, once each
    tl::expected<std::vector<Tool>, DiscoveryError> probe_rest_listing() {
        std::vector<std::string> paths = {url_.child_path("/tools"), "/api/tools", "/v1/tools", "/mcp/tools"};
        std::vector<std::string> unique_paths;
        for (auto& path : paths) {
            const bool seen = std::find(unique_paths.begin(), unique_paths.end(), path) != unique_paths.end();
            if (seen == false) {
                unique_paths.push_back(std::move(path));
            }
        }

        for (const auto& path : unique_paths) {
            const bool out_of_time = deadline_.cancelled() || deadline_.expired();
            if (out_of_time) {
                return tl::unexpected(deadline_error(deadline_));
            }
            client_.set_read_timeout(deadline_.remaining());

            auto response = client_.get(path, request_headers());
            if ((response.has_value() == false) || (response->is_success() == false)) {
                continue;
            }
            auto payload = fast_parse(response->body);
            if (payload.has_value() == false) {
                continue;
            }
            const Json* listing = find_tool_array(*payload);
            if (listing == nullptr) {
                continue;
            }
            auto decoded = ListToolsResult::from_json(*listing);
            if (decoded.has_value() == false) {
                continue;
            }
            get_logger().info_fmt("Server '{}': {} tools via REST listing {}",
                                  server_, decoded->tools.size(), path);
            return std::move(decoded->tools);
        }
        return tl::unexpected(DiscoveryError::upstream("No REST tool listing found"));
    }

private:
    HeaderMap request_headers() const {
        HeaderMap headers;
        if (session_id_.has_value()) {
            headers[MCP_SESSION_HEADER] = *session_id_;
        }
        if (protocol_version_.has_value()) {
            headers[kProtocolVersionHeader] = *protocol_version_;
        }
        return headers;
    }

    void remember_session(const HttpClientResponse& response) {
        auto session = get_header(response.headers, MCP_SESSION_HEADER);
        if (session.has_value() && (session->empty() == false)) {
            session_id_ = std::move(session);
        }
    }

    tl::expected<Json, DiscoveryError> response_from_body(const std::string& body) {
        auto parsed = fast_parse(body);
        if (parsed.has_value() == false) {
            return tl::unexpected(DiscoveryError::malformed_response(parsed.error().message));
        }
        return std::move(*parsed);
    }

    // Streams may carry notifications and progress before the response
    tl::expected<Json, DiscoveryError> response_from_stream(const std::string& body, const JsonRpcId& id) {
        std::vector<SseEvent> events;
        try {
            events = parse_sse_body(body);
        } catch (const SseBufferOverflowError& e) {
            return tl::unexpected(DiscoveryError::malformed_response(e.what()));
        }

        std::optional<Json> unmatched;
        for (const auto& event : events) {
            if (event.is_message() == false) {
                continue;
            }
            auto parsed = fast_parse(event.data);
            if (parsed.has_value() == false) {
                continue;
            }
            if (classify(*parsed) != MessageKind::Response) {
                continue;
            }
            const auto rpc = JsonRpcResponse::from_json(*parsed);
            const bool matches = rpc.has_value() && (rpc->id() == id);
            if (matches) {
                return std::move(*parsed);
            }
            unmatched = std::move(*parsed);
        }

        if (unmatched.has_value()) {
            return std::move(*unmatched);  // decode() reports the id mismatch
        }
        return tl::unexpected(DiscoveryError::malformed_response("no JSON-RPC response in event stream"));
    }

    const std::string& server_;
    IHttpClient& client_;
    const UrlComponents& url_;
    const Deadline& deadline_;
    const RetryPolicy& retry_policy_;
    IBackoffPolicy& backoff_policy_;

    std::int64_t next_id_{1};
    std::optional<std::string> session_id_;
    std::optional<std::string> protocol_version_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// HttpDiscoveryStrategy
// ═══════════════════════════════════════════════════════════════════════════

HttpDiscoveryStrategy::HttpDiscoveryStrategy(HttpDiscoveryConfig config, HttpClientFactory client_factory)
    : config_(std::move(config))
    , client_factory_(std::move(client_factory))
{
    const bool has_retry_policy = (config_.retry_policy != nullptr);
    if (has_retry_policy) {
        retry_policy_ = config_.retry_policy;
    } else {
        retry_policy_ = std::make_shared<RetryPolicy>();
        retry_policy_->with_max_attempts(config_.max_retries);
    }

    const bool has_backoff = (config_.backoff_policy != nullptr);
    if (has_backoff) {
        backoff_policy_ = config_.backoff_policy;
    } else {
        backoff_policy_ = std::make_shared<ExponentialBackoff>();
    }
}

DiscoveryResult HttpDiscoveryStrategy::discover(
    const ServerDescriptor& descriptor,
    const Deadline& deadline
) {
    const auto* spec = std::get_if<HttpSpec>(&descriptor.spec);
    const bool has_url = (spec != nullptr) && (spec->url.empty() == false);
    if (has_url == false) {
        return tl::unexpected(DiscoveryError::configuration("Server declares no url"));
    }

    const auto url = parse_url(spec->url);
    if (url.has_value() == false) {
        return tl::unexpected(DiscoveryError::configuration("Invalid URL: " + spec->url));
    }

    if (deadline.cancelled() || deadline.expired()) {
        return tl::unexpected(deadline_error(deadline));
    }

    std::unique_ptr<IHttpClient> client;
    if (client_factory_) {
        client = client_factory_();
    }
    if (client == nullptr) {
        return tl::unexpected(DiscoveryError::connection_failure("No HTTP client available"));
    }

    HeaderMap headers = spec->headers;
    const bool has_accept = (find_header(headers, "Accept") != headers.end());
    if (has_accept == false) {
        headers["Accept"] = kAcceptHeader;
    }
    client->set_base_url(url->origin());
    client->set_default_headers(headers);
    client->set_connect_timeout(config_.connect_timeout);
    client->set_verify_ssl(config_.verify_ssl);

    get_logger().debug_fmt("Server '{}': MCP over HTTP at {}{}",
                           descriptor.name, url->origin(), url->path);

    HttpSession session(descriptor.name, *client, *url, deadline, *retry_policy_, *backoff_policy_);

    try {
        // Handshake
        InitializeParams params;
        params.client_info = Implementation{config_.client_name, config_.client_version};
        const JsonRpcRequest initialize(methods::kInitialize, session.next_id(), params.to_json());

        auto init_response = session.post(initialize.to_json());
        if (init_response.has_value() == false) {
            return tl::unexpected(init_response.error());
        }

        const int status = init_response->status_code;
        const bool no_mcp_endpoint = (status == 404) || (status == 405);
        if (no_mcp_endpoint && config_.rest_fallback) {
            get_logger().debug_fmt("Server '{}': initialize answered HTTP {}, probing REST listings",
                                   descriptor.name, status);
            auto listed = session.probe_rest_listing();
            if (listed.has_value()) {
                return tag_tools(descriptor.name, std::move(*listed));
            }
            if (listed.error().kind == DiscoveryError::Kind::Timeout) {
                return tl::unexpected(listed.error());
            }
            return tl::unexpected(from_status(*init_response));
        }

        auto init_result = session.decode(*init_response, initialize.id());
        if (init_result.has_value() == false) {
            return tl::unexpected(init_result.error());
        }
        const auto handshake = InitializeResult::from_json(*init_result);
        if (handshake.has_value() == false) {
            return tl::unexpected(DiscoveryError::malformed_response(handshake.error().message));
        }
        session.set_protocol_version(handshake->protocol_version);
        session.notify(methods::kInitialized);

        // Listing
        std::vector<DiscoveredTool> tools;
        std::optional<std::string> cursor;
        for (std::size_t page = 0; page < config_.max_pages; ++page) {
            auto result = session.call(methods::kToolsList, list_tools_params(cursor));
            if (result.has_value() == false) {
                return tl::unexpected(result.error());
            }
            auto listing = ListToolsResult::from_json(*result);
            if (listing.has_value() == false) {
                return tl::unexpected(DiscoveryError::malformed_response(listing.error().message));
            }
            auto page_tools = tag_tools(descriptor.name, std::move(listing->tools));
            tools.insert(tools.end(),
                         std::make_move_iterator(page_tools.begin()),
                         std::make_move_iterator(page_tools.end()));
            if (listing->next_cursor.has_value() == false) {
                return tools;
            }
            cursor = std::move(listing->next_cursor);
        }

        get_logger().warn_fmt("Server '{}': stopped after {} tools/list pages", descriptor.name, config_.max_pages);
        return tools;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(DiscoveryError::malformed_response(e.what()));
    }
}

}  // namespace mcpenum
