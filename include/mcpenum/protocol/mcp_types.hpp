#ifndef MCPENUM_PROTOCOL_MCP_TYPES_HPP
#define MCPENUM_PROTOCOL_MCP_TYPES_HPP

#include "mcpenum/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpenum {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Constants
// ═══════════════════════════════════════════════════════════════════════════

// Version offered in the initialize handshake. Servers answer with the
// version they speak; we only list tools, which every revision supports.
inline constexpr const char* MCP_PROTOCOL_VERSION = "2025-06-18";

inline constexpr const char* MCP_SESSION_HEADER = "Mcp-Session-Id";

namespace methods {
inline constexpr const char* kInitialize = "initialize";
inline constexpr const char* kInitialized = "notifications/initialized";
inline constexpr const char* kToolsList = "tools/list";
}  // namespace methods

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    // Fields of the wrong type read as empty
    static Implementation from_json(const Json& j) {
        if (j.is_object() == false) {
            return {};
        }
        const auto text = [&j](const char* key) -> std::string {
            const auto it = j.find(key);
            if ((it == j.end()) || (it->is_string() == false)) {
                return {};
            }
            return it->get<std::string>();
        };
        return {text("name"), text("version")};
    }
};

struct InitializeParams {
    std::string protocol_version{MCP_PROTOCOL_VERSION};
    Implementation client_info;

    // Enumeration needs no client capabilities; an empty object is sent
    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", Json::object()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;
    bool advertises_tools{false};

    /// Fails when the result is not an object; missing fields are tolerated
    static JsonResult<InitializeResult> from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::string description;
    Json input_schema;  // null when the server declares none

    /// Lenient decode used for live and declared tools alike.
    /// Field fallbacks: name <- name|id|tool_name|"tool_<index>",
    /// description <- description|summary, schema <- inputSchema|inSchema|schema.
    /// A single-key object {"<name>": {...}} names the tool by its key.
    static JsonResult<Tool> from_json(const Json& j, std::size_t index);
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    /// Accepts {"tools": [...]} as MCP specifies, plus a bare array.
    /// Anything else, or a non-object tool entry, is an error.
    static JsonResult<ListToolsResult> from_json(const Json& j);
};

/// Params for tools/list; empty object when no cursor is given
[[nodiscard]] Json list_tools_params(const std::optional<std::string>& cursor);

}  // namespace mcpenum

#endif  // MCPENUM_PROTOCOL_MCP_TYPES_HPP
