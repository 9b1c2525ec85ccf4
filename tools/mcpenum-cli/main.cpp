// ─────────────────────────────────────────────────────────────────────────────
// mcpenum-cli - MCP Tool Enumeration
// ─────────────────────────────────────────────────────────────────────────────
// Reads an enumeration request (an mcpServers map) and prints which tools
// every declared server exposes.
//
// Usage:
//   mcpenum-cli --config servers.json --pretty
//   cat request.json | mcpenum-cli --config - --timeout 60 --no-schemas
//   mcpenum-cli --config servers.json --summary --status-policy any
//
// Exit codes:
//   0  request processed (individual servers may still have failed)
//   2  invalid request, arguments or settings

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpenum/config/request_parser.hpp"
#include "mcpenum/config/service_config.hpp"
#include "mcpenum/log/spdlog_logger.hpp"
#include "mcpenum/report/report_json.hpp"

#include <fstream>
#include <iostream>
#include <cstdint>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace mcpenum;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 2;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_summary(const EnumerationReport& report) {
    const char* status_color = color::green;
    if (report.status == OverallStatus::Partial) {
        status_color = color::yellow;
    } else if (report.status == OverallStatus::Failed) {
        status_color = color::red;
    }

    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << report.message() << " ═══" << color::c(color::reset) << "\n";
    std::cout << "Status: " << color::c(status_color) << to_string(report.status)
              << color::c(color::reset) << "  " << color::c(color::dim) << report.timestamp
              << color::c(color::reset) << "\n\n";

    for (const auto& server : report.servers) {
        const bool connected = (server.status == ServerStatus::Connected);
        std::cout << (connected ? color::c(color::green) + "✓ " : color::c(color::red) + "✗ ")
                  << color::c(color::reset) << color::c(color::bold) << server.name << color::c(color::reset)
                  << color::c(color::dim) << " [" << to_string(server.strategy) << ", "
                  << server.elapsed.count() << "ms]" << color::c(color::reset);
        if (connected) {
            std::cout << " " << server.tool_count << " tools\n";
        } else {
            std::cout << " " << to_string(server.error->kind) << ": " << server.error->message << "\n";
        }

        for (const auto& tool : report.tools) {
            if (tool.server != server.name) {
                continue;
            }
            std::cout << "    " << color::c(color::cyan) << tool.name << color::c(color::reset);
            if (tool.description.empty() == false) {
                std::cout << color::c(color::dim) << " - " << tool.description << color::c(color::reset);
            }
            std::cout << "\n";
        }
    }
    std::cout << "\n";
}

std::optional<std::string> read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path);
    if (file.is_open() == false) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void install_logger(const ServiceConfig& config) {
    if (config.log_file.has_value()) {
        set_logger(make_spdlog_console_file_logger(*config.log_file, config.log_level));
    } else {
        set_logger(make_spdlog_console_logger(config.log_level));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpenum-cli", "Enumerate the tools of MCP servers");

    options.add_options()
        ("c,config", "Request JSON file ('-' for stdin)", cxxopts::value<std::string>())

        // Request overrides
        ("t,timeout", "Overall timeout in seconds (5-300)", cxxopts::value<double>())
        ("sequential", "Discover servers one at a time")
        ("no-schemas", "Omit tool input schemas")

        // Service settings (override MCPENUM_* environment variables)
        ("max-in-flight", "Servers discovered concurrently", cxxopts::value<std::size_t>())
        ("server-timeout", "Per-server timeout in seconds", cxxopts::value<std::size_t>())
        ("status-policy", "Overall status rule: all|any", cxxopts::value<std::string>())
        ("log-level", "trace|debug|info|warn|error|off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())

        // Output
        ("pretty", "Indent the JSON response")
        ("summary", "Print a human-readable summary instead of JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Request format:\n";
            std::cout << "  {\"mcp_json\": {\"mcpServers\": {\n";
            std::cout << "     \"remote\": {\"url\": \"https://example.com/mcp\", \"headers\": {\"Authorization\": \"Bearer ...\"}},\n";
            std::cout << "     \"local\":  {\"command\": \"npx\", \"args\": [\"-y\", \"@modelcontextprotocol/server-filesystem\", \"/tmp\"]}\n";
            std::cout << "   }},\n";
            std::cout << "   \"timeout_seconds\": 30, \"include_schemas\": true, \"parallel_discovery\": true}\n";
            return kExitOk;
        }

        color::enabled = (result.count("no-color") == 0);

        auto config = ServiceConfig::from_environment();
        if (config.has_value() == false) {
            print_error(config.error().message);
            return kExitInvalid;
        }

        if (result.count("max-in-flight")) {
            const auto count = result["max-in-flight"].as<std::size_t>();
            if (count == 0) {
                print_error("--max-in-flight must be at least 1");
                return kExitInvalid;
            }
            config->with_max_in_flight(count);
        }
        if (result.count("server-timeout")) {
            const auto seconds = result["server-timeout"].as<std::size_t>();
            const auto longest = static_cast<std::size_t>(config->limits.max_timeout.count());
            if ((seconds == 0) || (seconds > longest)) {
                print_error("--server-timeout must be between 1 and " + std::to_string(longest));
                return kExitInvalid;
            }
            config->with_server_timeout(std::chrono::seconds{seconds});
        }
        if (result.count("status-policy")) {
            const auto text = result["status-policy"].as<std::string>();
            const auto policy = parse_status_policy(text);
            if (policy.has_value() == false) {
                print_error("--status-policy must be 'all' or 'any', got '" + text + "'");
                return kExitInvalid;
            }
            config->with_status_policy(*policy);
        }
        if (result.count("log-level")) {
            const auto text = result["log-level"].as<std::string>();
            const auto level = parse_log_level(text);
            if (level.has_value() == false) {
                print_error("Unknown log level '" + text + "'");
                return kExitInvalid;
            }
            config->with_log_level(*level);
        }
        if (result.count("log-file")) {
            config->with_log_file(result["log-file"].as<std::string>());
        }

        install_logger(*config);

        if (result.count("config") == 0) {
            print_error("--config is required");
            std::cout << "\n" << options.help() << "\n";
            return kExitInvalid;
        }

        const auto path = result["config"].as<std::string>();
        const auto text = read_input(path);
        if (text.has_value() == false) {
            print_error("Cannot read " + path);
            return kExitInvalid;
        }

        const RequestParser parser(config->limits);
        auto request = parser.parse(*text);
        if (request.has_value() == false) {
            get_logger().error_fmt("Invalid request: {}", request.error().message);
            std::cout << make_error_response(request.error()).dump(result.count("pretty") ? 2 : -1) << "\n";
            return kExitInvalid;
        }

        if (result.count("timeout")) {
            const double seconds = result["timeout"].as<double>();
            const auto& limits = config->limits;
            const bool in_range = (seconds >= static_cast<double>(limits.min_timeout.count())) &&
                                  (seconds <= static_cast<double>(limits.max_timeout.count()));
            if (in_range == false) {
                print_error("--timeout must be between " + std::to_string(limits.min_timeout.count()) +
                            " and " + std::to_string(limits.max_timeout.count()) + " seconds");
                return kExitInvalid;
            }
            request->timeout = std::chrono::milliseconds{static_cast<std::int64_t>(seconds * 1000.0)};
        }
        if (result.count("sequential")) {
            request->parallel_discovery = false;
        }
        if (result.count("no-schemas")) {
            request->include_schemas = false;
        }

        auto orchestrator = make_orchestrator(*config);
        const auto report = orchestrator->run(*request);

        if (result.count("summary")) {
            print_summary(report);
        } else {
            std::cout << make_response(report).dump(result.count("pretty") ? 2 : -1) << "\n";
        }
        return kExitOk;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitInvalid;
    } catch (const std::exception& e) {
        print_error(e.what());
        return kExitInvalid;
    }
}
