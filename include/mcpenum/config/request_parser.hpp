#ifndef MCPENUM_CONFIG_REQUEST_PARSER_HPP
#define MCPENUM_CONFIG_REQUEST_PARSER_HPP

#include "mcpenum/config/config_error.hpp"
#include "mcpenum/model/enumeration.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace mcpenum {

using OrderedJson = nlohmann::ordered_json;

struct RequestLimits {
    std::size_t max_servers{50};
    std::chrono::seconds min_timeout{5};
    std::chrono::seconds max_timeout{300};
    std::chrono::seconds default_timeout{30};
};

// ═══════════════════════════════════════════════════════════════════════════
// RequestParser
// ═══════════════════════════════════════════════════════════════════════════
// Turns an enumeration request document into an EnumerationRequest:
//
//   {
//     "mcp_json": {"mcpServers": {"<name>": {...}, ...}},
//     "timeout_seconds": 30,
//     "include_schemas": true,
//     "parallel_discovery": true
//   }
//
// A bare {"mcpServers": {...}} document is accepted too. Server order is
// the order of declaration. Per server:
//
//   url + headers       -> HttpSpec
//   command + args/env  -> CommandSpec (when there is no url)
//   timeout             -> per-server timeout in seconds (> 0)
//   everything else     -> metadata (declared tools, capabilities, ...)

class RequestParser {
public:
    RequestParser() = default;
    explicit RequestParser(RequestLimits limits) : limits_(limits) {}

    /// Parse request text; duplicate object keys are rejected
    [[nodiscard]] ConfigResult<EnumerationRequest> parse(std::string_view text) const;

    [[nodiscard]] ConfigResult<EnumerationRequest> parse(const OrderedJson& document) const;

    [[nodiscard]] const RequestLimits& limits() const noexcept { return limits_; }

private:
    [[nodiscard]] ConfigResult<ServerDescriptor> parse_server(
        const std::string& name,
        const OrderedJson& node,
        std::size_t index,
        const std::string& field
    ) const;

    RequestLimits limits_;
};

}  // namespace mcpenum

#endif  // MCPENUM_CONFIG_REQUEST_PARSER_HPP
