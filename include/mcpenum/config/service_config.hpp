#ifndef MCPENUM_CONFIG_SERVICE_CONFIG_HPP
#define MCPENUM_CONFIG_SERVICE_CONFIG_HPP

#include "mcpenum/config/config_error.hpp"
#include "mcpenum/config/request_parser.hpp"
#include "mcpenum/discovery/http_strategy.hpp"
#include "mcpenum/discovery/orchestrator.hpp"
#include "mcpenum/discovery/static_strategy.hpp"
#include "mcpenum/discovery/stdio_strategy.hpp"
#include "mcpenum/log/logger.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcpenum {

/// Environment variable lookup; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// Reads the process environment
[[nodiscard]] std::optional<std::string> process_env(const char* name);

// ═══════════════════════════════════════════════════════════════════════════
// ServiceConfig
// ═══════════════════════════════════════════════════════════════════════════
// Everything tunable about the service, outside the request itself.
//
// Environment variables (all optional):
//
//   MCPENUM_MAX_IN_FLIGHT           servers discovered at once (default 8)
//   MCPENUM_SERVER_TIMEOUT_SECONDS  per-server budget (default 30)
//   MCPENUM_MAX_SERVERS             servers per request (default 50)
//   MCPENUM_HTTP_MAX_RETRIES        retries per HTTP call (default 2)
//   MCPENUM_VERIFY_SSL              true/false (default true)
//   MCPENUM_STATUS_POLICY           all|any (default all)
//   MCPENUM_LOG_LEVEL               trace..off (default info)
//   MCPENUM_LOG_FILE                also log to this file

struct ServiceConfig {
    OrchestratorConfig orchestrator;
    HttpDiscoveryConfig http;
    StdioDiscoveryConfig stdio;
    StaticDiscoveryConfig static_discovery;
    RequestLimits limits;

    LogLevel log_level{LogLevel::Info};
    std::optional<std::string> log_file;

    [[nodiscard]] static ConfigResult<ServiceConfig> from_environment(const EnvLookup& lookup = process_env);

    ServiceConfig& with_max_in_flight(std::size_t count) {
        orchestrator.with_max_in_flight(count);
        return *this;
    }

    ServiceConfig& with_server_timeout(std::chrono::milliseconds timeout) {
        orchestrator.with_default_server_timeout(timeout);
        return *this;
    }

    ServiceConfig& with_status_policy(StatusPolicy policy) {
        orchestrator.with_status_policy(policy);
        return *this;
    }

    ServiceConfig& with_max_servers(std::size_t count) {
        limits.max_servers = count;
        return *this;
    }

    ServiceConfig& with_log_level(LogLevel level) {
        log_level = level;
        return *this;
    }

    ServiceConfig& with_log_file(std::string path) {
        log_file = std::move(path);
        return *this;
    }
};

/// Strategies configured from the service config; HTTP uses cpr clients
[[nodiscard]] StrategySet make_strategy_set(const ServiceConfig& config);

[[nodiscard]] std::unique_ptr<DiscoveryOrchestrator> make_orchestrator(const ServiceConfig& config);

}  // namespace mcpenum

#endif  // MCPENUM_CONFIG_SERVICE_CONFIG_HPP
