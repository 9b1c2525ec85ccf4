#include "mcpenum/protocol/mcp_types.hpp"

namespace mcpenum {

namespace {

std::optional<std::string> string_field(const Json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto it = j.find(key);
        const bool usable = (it != j.end()) && it->is_string() && (it->get<std::string>().empty() == false);
        if (usable) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

Json schema_field(const Json& j) {
    for (const char* key : {"inputSchema", "inSchema", "schema"}) {
        const auto it = j.find(key);
        if ((it != j.end()) && (it->is_null() == false)) {
            return *it;
        }
    }
    return nullptr;
}

JsonError invalid_result(std::string message) {
    return JsonError{JsonError::Code::InvalidResult, std::move(message)};
}

}  // namespace

JsonResult<InitializeResult> InitializeResult::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(invalid_result("initialize result must be an object"));
    }

    InitializeResult result;
    const auto version_it = j.find("protocolVersion");
    if (version_it != j.end()) {
        if (version_it->is_string() == false) {
            return tl::unexpected(invalid_result("protocolVersion must be a string"));
        }
        result.protocol_version = version_it->get<std::string>();
    }
    const auto info_it = j.find("serverInfo");
    if (info_it != j.end()) {
        result.server_info = Implementation::from_json(*info_it);
    }
    const auto caps_it = j.find("capabilities");
    if ((caps_it != j.end()) && caps_it->is_object()) {
        result.advertises_tools = caps_it->contains("tools");
    }
    return result;
}

JsonResult<Tool> Tool::from_json(const Json& j, std::size_t index) {
    if (j.is_object() == false) {
        return tl::unexpected(invalid_result(
            "tool entry " + std::to_string(index) + " is not an object"));
    }

    // {"search": {"description": ...}} style entries
    const bool keyed_entry = (j.size() == 1) && j.begin().value().is_object() &&
                             (j.contains("name") == false) &&
                             (schema_field(j).is_null() == true) &&
                             (j.contains("annotations") == false);
    if (keyed_entry) {
        auto inner = from_json(j.begin().value(), index);
        if (inner.has_value() && (j.begin().value().contains("name") == false)) {
            inner->name = j.begin().key();
        }
        return inner;
    }

    Tool tool;
    tool.name = string_field(j, {"name", "id", "tool_name"})
                    .value_or("tool_" + std::to_string(index));
    tool.description = string_field(j, {"description", "summary"}).value_or("");
    tool.input_schema = schema_field(j);
    return tool;
}

JsonResult<ListToolsResult> ListToolsResult::from_json(const Json& j) {
    const Json* tools_node = nullptr;
    if (j.is_array()) {
        tools_node = &j;
    } else if (j.is_object()) {
        const auto it = j.find("tools");
        if ((it != j.end()) && it->is_array()) {
            tools_node = &(*it);
        }
    }

    if (tools_node == nullptr) {
        return tl::unexpected(invalid_result("tools/list result has no tools array"));
    }

    ListToolsResult result;
    result.tools.reserve(tools_node->size());
    std::size_t index = 0;
    for (const auto& entry : *tools_node) {
        auto tool = Tool::from_json(entry, index);
        if (tool.has_value() == false) {
            return tl::unexpected(tool.error());
        }
        result.tools.push_back(std::move(*tool));
        ++index;
    }

    if (j.is_object()) {
        const auto cursor_it = j.find("nextCursor");
        const bool has_cursor = (cursor_it != j.end()) && cursor_it->is_string() &&
                                (cursor_it->get<std::string>().empty() == false);
        if (has_cursor) {
            result.next_cursor = cursor_it->get<std::string>();
        }
    }
    return result;
}

Json list_tools_params(const std::optional<std::string>& cursor) {
    Json params = Json::object();
    if (cursor.has_value()) {
        params["cursor"] = *cursor;
    }
    return params;
}

}  // namespace mcpenum
