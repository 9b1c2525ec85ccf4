#include "mcpenum/report/report_json.hpp"

namespace mcpenum {

Json to_json(const DiscoveredTool& tool) {
    return {
        {"server", tool.server},
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema}
    };
}

Json to_json(const ServerOutcome& outcome) {
    Json j = {
        {"name", outcome.name},
        {"status", std::string(to_string(outcome.status))},
        {"tool_count", outcome.tool_count},
        {"transport", std::string(to_string(outcome.strategy))},
        {"elapsed_ms", outcome.elapsed.count()}
    };

    if (outcome.error.has_value()) {
        j["error"] = outcome.error->message;
        j["error_kind"] = std::string(to_string(outcome.error->kind));
        if (outcome.error->diagnostics.has_value()) {
            j["diagnostics"] = *outcome.error->diagnostics;
        }
    } else {
        j["error"] = nullptr;
        j["error_kind"] = nullptr;
    }
    return j;
}

Json to_json(const EnumerationReport& report) {
    Json servers = Json::array();
    for (const auto& outcome : report.servers) {
        servers.push_back(to_json(outcome));
    }
    Json tools = Json::array();
    for (const auto& tool : report.tools) {
        tools.push_back(to_json(tool));
    }

    return {
        {"status", std::string(to_string(report.status))},
        {"timestamp", report.timestamp},
        {"servers", std::move(servers)},
        {"tools", std::move(tools)},
        {"total_servers", report.total_servers},
        {"connected_servers", report.connected_servers}
    };
}

Json make_response(const EnumerationReport& report) {
    return {
        {"success", report.connected_servers > 0},
        {"message", report.message()},
        {"data", to_json(report)}
    };
}

Json make_error_response(const ConfigError& error) {
    Json details = {{"code", std::string(to_string(error.code))}};
    if (error.field.empty() == false) {
        details["field"] = error.field;
    }
    return {
        {"success", false},
        {"message", error.message},
        {"error", std::move(details)}
    };
}

}  // namespace mcpenum
