#include "mcpenum/protocol/json_rpc.hpp"

namespace mcpenum {
namespace {
constexpr const char* kJsonRpcVersion = "2.0";

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}
}  // namespace

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&](const auto& id_value) { node = id_value; }, value);
    return node;
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error;
    if (node.is_object() == false) {
        error.message = node.is_string() ? node.get<std::string>() : node.dump();
        return error;
    }
    const auto code_it = node.find("code");
    if ((code_it != node.end()) && code_it->is_number_integer()) {
        error.code = code_it->get<std::int64_t>();
    }
    const auto message_it = node.find("message");
    if ((message_it != node.end()) && message_it->is_string()) {
        error.message = message_it->get<std::string>();
    }
    const auto data_it = node.find("data");
    if (data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// Incoming messages
// ─────────────────────────────────────────────────────────────────────────────

MessageKind classify(const Json& message) noexcept {
    if (message.is_object() == false) {
        return MessageKind::Invalid;
    }
    const bool has_id = message.contains("id") && (message["id"].is_null() == false);
    const bool has_method = message.contains("method") && message["method"].is_string();
    const bool has_outcome = message.contains("result") || message.contains("error");

    if (has_method && has_id) {
        return MessageKind::Request;
    }
    if (has_method) {
        return MessageKind::Notification;
    }
    if (has_outcome) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const auto version_it = payload.find("jsonrpc");
    const bool version_ok = (version_it != payload.end()) && version_it->is_string() &&
                            (version_it->get<std::string>() == kJsonRpcVersion);
    if (version_ok == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(*id_it);
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidResult,
            "response must carry exactly one of result or error"});
    }

    JsonRpcResponse response;
    response.id_ = std::move(*parsed_id);
    if (has_error) {
        response.error_ = JsonRpcError::from_json(payload.at("error"));
    } else {
        response.result_ = payload.at("result");
    }
    return response;
}

Json JsonRpcResponse::method_not_found(const Json& request_id, std::string_view method) {
    JsonRpcError error;
    error.code = kJsonRpcMethodNotFound;
    error.message = "Method not found: " + std::string(method);

    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = request_id;
    payload["error"] = error.to_json();
    return payload;
}

}  // namespace mcpenum
