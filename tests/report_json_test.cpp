// ─────────────────────────────────────────────────────────────────────────────
// Report JSON Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpenum/discovery/aggregator.hpp"
#include "mcpenum/report/report_json.hpp"

using namespace mcpenum;
using namespace std::chrono_literals;

namespace {

EnumerationReport partial_report() {
    std::vector<ServerRun> runs;
    runs.push_back(ServerRun{
        "github",
        StrategyKind::Http,
        std::vector<DiscoveredTool>{
            {"github", "create_issue", "Open an issue", Json{{"type", "object"}}}
        },
        120ms
    });
    auto error = DiscoveryError::process_failure("Process closed its output (exit code 1)");
    error.with_diagnostics("Error: GITHUB_TOKEN missing");
    runs.push_back(ServerRun{"local", StrategyKind::Stdio, tl::unexpected(std::move(error)), 40ms});
    return aggregate(std::move(runs), AggregationOptions{}, "2026-03-01T12:00:00Z");
}

}  // namespace

TEST_CASE("make_response wraps the report", "[report]") {
    const auto response = make_response(partial_report());

    CHECK(response["success"] == true);
    CHECK(response["message"] == "Connected to 1 of 2 servers");

    const auto& data = response["data"];
    CHECK(data["status"] == "partial");
    CHECK(data["timestamp"] == "2026-03-01T12:00:00Z");
    CHECK(data["total_servers"] == 2);
    CHECK(data["connected_servers"] == 1);
    REQUIRE(data["servers"].size() == 2);
    REQUIRE(data["tools"].size() == 1);
}

TEST_CASE("Server outcomes serialize status and error", "[report]") {
    const auto data = to_json(partial_report());

    const auto& github = data["servers"][0];
    CHECK(github["name"] == "github");
    CHECK(github["status"] == "connected");
    CHECK(github["tool_count"] == 1);
    CHECK(github["transport"] == "http");
    CHECK(github["elapsed_ms"] == 120);
    CHECK(github["error"].is_null());
    CHECK(github["error_kind"].is_null());
    CHECK(github.contains("diagnostics") == false);

    const auto& local = data["servers"][1];
    CHECK(local["status"] == "failed");
    CHECK(local["tool_count"] == 0);
    CHECK(local["transport"] == "stdio");
    CHECK(local["error"] == "Process failure: Process closed its output (exit code 1)");
    CHECK(local["error_kind"] == "connection_failure");
    CHECK(local["diagnostics"] == "Error: GITHUB_TOKEN missing");
}

TEST_CASE("Tools serialize with their server and schema", "[report]") {
    const auto tool = to_json(DiscoveredTool{"github", "create_issue", "Open an issue", Json{{"type", "object"}}});

    CHECK(tool["server"] == "github");
    CHECK(tool["name"] == "create_issue");
    CHECK(tool["description"] == "Open an issue");
    CHECK(tool["inputSchema"]["type"] == "object");

    const auto bare = to_json(DiscoveredTool{"docs", "search", "", nullptr});
    CHECK(bare["inputSchema"].is_null());
    CHECK(bare["description"] == "");
}

TEST_CASE("A fully failed report is not successful", "[report]") {
    std::vector<ServerRun> runs;
    runs.push_back(ServerRun{"a", StrategyKind::Http, tl::unexpected(DiscoveryError::upstream("HTTP 401")), 5ms});
    const auto response = make_response(aggregate(std::move(runs), AggregationOptions{}, "t"));

    CHECK(response["success"] == false);
    CHECK(response["data"]["status"] == "failed");
    CHECK(response["data"]["tools"].is_array());
    CHECK(response["data"]["tools"].empty());
}

TEST_CASE("make_error_response describes a rejected request", "[report]") {
    const auto response = make_error_response(ConfigError{
        ConfigError::Code::EmptyServers, "At least one server must be configured", "mcp_json.mcpServers"});

    CHECK(response["success"] == false);
    CHECK(response["message"] == "At least one server must be configured");
    CHECK(response["error"]["code"] == "empty_servers");
    CHECK(response["error"]["field"] == "mcp_json.mcpServers");

    const auto no_field = make_error_response(ConfigError::invalid_json("parse error"));
    CHECK(no_field["error"].contains("field") == false);
}
