#pragma once

#include "mcpenum/config/config_error.hpp"
#include "mcpenum/model/enumeration.hpp"

#include <nlohmann/json.hpp>

namespace mcpenum {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Response JSON
// ─────────────────────────────────────────────────────────────────────────────
//   {
//     "success": true,                 // at least one server connected
//     "message": "Connected to 1 of 2 servers",
//     "data": {
//       "status": "partial",
//       "timestamp": "2026-03-01T12:00:00Z",
//       "servers": [{"name", "status", "tool_count", "error", "error_kind",
//                    "transport", "elapsed_ms"}],
//       "tools": [{"server", "name", "description", "inputSchema"}],
//       "total_servers": 2,
//       "connected_servers": 1
//     }
//   }

[[nodiscard]] Json to_json(const DiscoveredTool& tool);
[[nodiscard]] Json to_json(const ServerOutcome& outcome);

/// The "data" object
[[nodiscard]] Json to_json(const EnumerationReport& report);

[[nodiscard]] Json make_response(const EnumerationReport& report);

/// {"success": false, "message", "error": {"code", "field"}}
[[nodiscard]] Json make_error_response(const ConfigError& error);

}  // namespace mcpenum
