#include "mcpenum/discovery/aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpenum {

std::optional<StatusPolicy> parse_status_policy(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if ((lowered == "all") || (lowered == "require_all")) {
        return StatusPolicy::RequireAll;
    }
    if ((lowered == "any") || (lowered == "require_any")) {
        return StatusPolicy::RequireAny;
    }
    return std::nullopt;
}

OverallStatus overall_status(std::size_t connected, std::size_t total, StatusPolicy policy) noexcept {
    if (connected == 0) {
        return OverallStatus::Failed;
    }
    if (policy == StatusPolicy::RequireAny) {
        return OverallStatus::Success;
    }
    return (connected == total) ? OverallStatus::Success : OverallStatus::Partial;
}

std::string utc_timestamp(std::chrono::system_clock::time_point when) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(when));
}

EnumerationReport aggregate(
    std::vector<ServerRun> runs,
    const AggregationOptions& options,
    std::string timestamp
) {
    EnumerationReport report;
    report.timestamp = std::move(timestamp);
    report.total_servers = runs.size();
    report.servers.reserve(runs.size());

    for (auto& run : runs) {
        ServerOutcome outcome;
        outcome.name = run.name;
        outcome.strategy = run.strategy;
        outcome.elapsed = run.elapsed;

        if (run.result.has_value() == false) {
            outcome.status = ServerStatus::Failed;
            outcome.error = std::move(run.result.error());
            report.servers.push_back(std::move(outcome));
            continue;
        }

        outcome.status = ServerStatus::Connected;
        outcome.tool_count = run.result->size();
        ++report.connected_servers;

        for (auto& tool : *run.result) {
            tool.server = run.name;
            if (options.include_schemas == false) {
                tool.input_schema = nullptr;
            }
            report.tools.push_back(std::move(tool));
        }
        report.servers.push_back(std::move(outcome));
    }

    report.status = overall_status(report.connected_servers, report.total_servers, options.status_policy);
    return report;
}

}  // namespace mcpenum
