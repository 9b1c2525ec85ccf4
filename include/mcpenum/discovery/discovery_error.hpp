#pragma once

#include "mcpenum/discovery/discovered_tool.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// DiscoveryError
// ─────────────────────────────────────────────────────────────────────────────
// Why one server produced no tools. Strategies never throw across their
// boundary; everything they can hit maps onto one of these kinds.

struct DiscoveryError {
    enum class Kind {
        ConfigurationError,  // declaration unusable (bad URL, bare npx, ...)
        Timeout,             // per-server or overall deadline reached
        ConnectionFailure,   // could not connect or start the process
        ProtocolError,       // peer spoke, but not valid MCP/JSON-RPC
        UpstreamError        // peer answered with an error (JSON-RPC, 4xx)
    };

    Kind kind{Kind::ProtocolError};
    std::string message;
    std::optional<std::string> diagnostics;  // e.g. stderr tail of the process

    static DiscoveryError configuration(std::string msg) {
        return {Kind::ConfigurationError, std::move(msg), std::nullopt};
    }
    static DiscoveryError timeout(std::string msg) {
        return {Kind::Timeout, std::move(msg), std::nullopt};
    }
    static DiscoveryError connection_failure(std::string msg) {
        return {Kind::ConnectionFailure, std::move(msg), std::nullopt};
    }
    static DiscoveryError protocol(std::string msg) {
        return {Kind::ProtocolError, std::move(msg), std::nullopt};
    }
    static DiscoveryError upstream(std::string msg) {
        return {Kind::UpstreamError, std::move(msg), std::nullopt};
    }

    // Strategy-specific spellings of the generic kinds
    static DiscoveryError malformed_response(const std::string& detail) {
        return protocol("Malformed response: " + detail);
    }
    static DiscoveryError process_failure(const std::string& detail) {
        return connection_failure("Process failure: " + detail);
    }

    DiscoveryError& with_diagnostics(std::string text) {
        if (text.empty() == false) {
            diagnostics = std::move(text);
        }
        return *this;
    }
};

[[nodiscard]] constexpr std::string_view to_string(DiscoveryError::Kind kind) noexcept {
    switch (kind) {
        case DiscoveryError::Kind::ConfigurationError: return "configuration_error";
        case DiscoveryError::Kind::Timeout:            return "timeout";
        case DiscoveryError::Kind::ConnectionFailure:  return "connection_failure";
        case DiscoveryError::Kind::ProtocolError:      return "protocol_error";
        case DiscoveryError::Kind::UpstreamError:      return "upstream_error";
    }
    return "unknown";
}

using DiscoveryResult = tl::expected<std::vector<DiscoveredTool>, DiscoveryError>;

}  // namespace mcpenum
