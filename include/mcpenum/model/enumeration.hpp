#ifndef MCPENUM_MODEL_ENUMERATION_HPP
#define MCPENUM_MODEL_ENUMERATION_HPP

#include "mcpenum/discovery/discovered_tool.hpp"
#include "mcpenum/discovery/discovery_error.hpp"
#include "mcpenum/discovery/server_spec.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpenum {

// ═══════════════════════════════════════════════════════════════════════════
// Request
// ═══════════════════════════════════════════════════════════════════════════

struct EnumerationRequest {
    std::vector<ServerDescriptor> servers;  // declaration order, unique names
    std::chrono::milliseconds timeout{30'000};
    bool include_schemas{true};
    bool parallel_discovery{true};
};

// ═══════════════════════════════════════════════════════════════════════════
// Per-server results
// ═══════════════════════════════════════════════════════════════════════════

/// Raw result of running one server's strategy, as collected by the
/// orchestrator before aggregation
struct ServerRun {
    std::string name;
    StrategyKind strategy{StrategyKind::Static};
    DiscoveryResult result;
    std::chrono::milliseconds elapsed{0};
};

enum class ServerStatus {
    Connected,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ServerStatus status) noexcept {
    switch (status) {
        case ServerStatus::Connected: return "connected";
        case ServerStatus::Failed:    return "failed";
    }
    return "unknown";
}

struct ServerOutcome {
    std::string name;
    ServerStatus status{ServerStatus::Failed};
    std::size_t tool_count{0};
    std::optional<DiscoveryError> error;  // set iff status is Failed
    StrategyKind strategy{StrategyKind::Static};
    std::chrono::milliseconds elapsed{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Report
// ═══════════════════════════════════════════════════════════════════════════

enum class OverallStatus {
    Success,
    Partial,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(OverallStatus status) noexcept {
    switch (status) {
        case OverallStatus::Success: return "success";
        case OverallStatus::Partial: return "partial";
        case OverallStatus::Failed:  return "failed";
    }
    return "unknown";
}

/// How connected/total maps onto the overall status.
///   RequireAll: success = all, partial = some, failed = none
///   RequireAny: success = at least one, failed = none
enum class StatusPolicy {
    RequireAll,
    RequireAny
};

[[nodiscard]] constexpr std::string_view to_string(StatusPolicy policy) noexcept {
    switch (policy) {
        case StatusPolicy::RequireAll: return "all";
        case StatusPolicy::RequireAny: return "any";
    }
    return "unknown";
}

/// Accepts "all"/"require_all" and "any"/"require_any"
[[nodiscard]] std::optional<StatusPolicy> parse_status_policy(std::string_view text);

struct EnumerationReport {
    OverallStatus status{OverallStatus::Failed};
    std::string timestamp;  // ISO-8601 UTC
    std::vector<ServerOutcome> servers;
    std::vector<DiscoveredTool> tools;
    std::size_t total_servers{0};
    std::size_t connected_servers{0};

    [[nodiscard]] std::size_t failed_servers() const noexcept {
        return total_servers - connected_servers;
    }

    [[nodiscard]] std::string message() const {
        const bool all_connected = (total_servers > 0) && (connected_servers == total_servers);
        if (all_connected) {
            return "Successfully connected to all " + std::to_string(total_servers) + " servers";
        }
        return "Connected to " + std::to_string(connected_servers) + " of " +
               std::to_string(total_servers) + " servers";
    }
};

}  // namespace mcpenum

#endif  // MCPENUM_MODEL_ENUMERATION_HPP
