#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpenum {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidResult,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// Standard JSON-RPC error codes used when answering server-initiated requests
inline constexpr std::int64_t kJsonRpcMethodNotFound = -32601;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] static JsonRpcError from_json(const Json& node);
};

// ─────────────────────────────────────────────────────────────────────────────
// Incoming messages
// ─────────────────────────────────────────────────────────────────────────────
// A peer may interleave notifications and its own requests with the
// responses we are waiting for; classify() sorts them apart.

enum class MessageKind {
    Response,       // has id and result/error
    Notification,   // has method, no id
    Request,        // has method and id (server-initiated)
    Invalid
};

[[nodiscard]] MessageKind classify(const Json& message) noexcept;

class JsonRpcResponse {
public:
    [[nodiscard]] const JsonRpcId& id() const noexcept { return id_; }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }
    [[nodiscard]] const Json& result() const noexcept { return result_; }
    [[nodiscard]] const JsonRpcError& error() const { return *error_; }

    /// Validate envelope, id and result/error exclusivity
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

    /// Error reply to a server-initiated request we do not support
    [[nodiscard]] static Json method_not_found(const Json& request_id, std::string_view method);

private:
    JsonRpcId id_;
    Json result_;
    std::optional<JsonRpcError> error_;
};

}  // namespace mcpenum
