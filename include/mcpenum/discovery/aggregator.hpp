#pragma once

#include "mcpenum/model/enumeration.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mcpenum {

struct AggregationOptions {
    bool include_schemas{true};
    StatusPolicy status_policy{StatusPolicy::RequireAll};
};

/// Fold per-server runs (declaration order) into the report. Pure: the
/// timestamp is passed in.
[[nodiscard]] EnumerationReport aggregate(
    std::vector<ServerRun> runs,
    const AggregationOptions& options,
    std::string timestamp
);

[[nodiscard]] OverallStatus overall_status(
    std::size_t connected,
    std::size_t total,
    StatusPolicy policy
) noexcept;

/// "2026-03-01T12:00:00Z"
[[nodiscard]] std::string utc_timestamp(std::chrono::system_clock::time_point when);

}  // namespace mcpenum
