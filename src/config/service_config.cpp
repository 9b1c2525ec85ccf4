#include "mcpenum/config/service_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace mcpenum {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ConfigResult<std::size_t> parse_count(const char* name, const std::string& text, std::size_t minimum,
                                      std::size_t maximum = std::numeric_limits<std::size_t>::max()) {
    std::size_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    const bool valid = (ec == std::errc{}) && (ptr == last) && (text.empty() == false);
    if ((valid == false) || (value < minimum)) {
        return tl::unexpected(ConfigError::invalid_value(
            name, std::string(name) + " must be an integer >= " + std::to_string(minimum) + ", got '" + text + "'"));
    }
    if (value > maximum) {
        return tl::unexpected(ConfigError::invalid_value(
            name, std::string(name) + " must be an integer <= " + std::to_string(maximum) + ", got '" + text + "'"));
    }
    return value;
}

ConfigResult<bool> parse_flag(const char* name, const std::string& text) {
    const auto lowered = lowercase(text);
    if ((lowered == "1") || (lowered == "true") || (lowered == "yes") || (lowered == "on")) {
        return true;
    }
    if ((lowered == "0") || (lowered == "false") || (lowered == "no") || (lowered == "off")) {
        return false;
    }
    return tl::unexpected(ConfigError::invalid_value(
        name, std::string(name) + " must be true or false, got '" + text + "'"));
}

}  // namespace

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

ConfigResult<ServiceConfig> ServiceConfig::from_environment(const EnvLookup& lookup) {
    ServiceConfig config;

    if (const auto value = lookup("MCPENUM_MAX_IN_FLIGHT")) {
        auto count = parse_count("MCPENUM_MAX_IN_FLIGHT", *value, 1);
        if (count.has_value() == false) {
            return tl::unexpected(count.error());
        }
        config.with_max_in_flight(*count);
    }

    if (const auto value = lookup("MCPENUM_SERVER_TIMEOUT_SECONDS")) {
        auto seconds = parse_count("MCPENUM_SERVER_TIMEOUT_SECONDS", *value, 1,
                                   static_cast<std::size_t>(config.limits.max_timeout.count()));
        if (seconds.has_value() == false) {
            return tl::unexpected(seconds.error());
        }
        config.with_server_timeout(std::chrono::seconds{*seconds});
    }

    if (const auto value = lookup("MCPENUM_MAX_SERVERS")) {
        auto count = parse_count("MCPENUM_MAX_SERVERS", *value, 1);
        if (count.has_value() == false) {
            return tl::unexpected(count.error());
        }
        config.with_max_servers(*count);
    }

    if (const auto value = lookup("MCPENUM_HTTP_MAX_RETRIES")) {
        auto retries = parse_count("MCPENUM_HTTP_MAX_RETRIES", *value, 0);
        if (retries.has_value() == false) {
            return tl::unexpected(retries.error());
        }
        config.http.with_max_retries(*retries);
    }

    if (const auto value = lookup("MCPENUM_VERIFY_SSL")) {
        auto verify = parse_flag("MCPENUM_VERIFY_SSL", *value);
        if (verify.has_value() == false) {
            return tl::unexpected(verify.error());
        }
        config.http.with_verify_ssl(*verify);
    }

    if (const auto value = lookup("MCPENUM_STATUS_POLICY")) {
        const auto policy = parse_status_policy(*value);
        if (policy.has_value() == false) {
            return tl::unexpected(ConfigError::invalid_value(
                "MCPENUM_STATUS_POLICY", "MCPENUM_STATUS_POLICY must be 'all' or 'any', got '" + *value + "'"));
        }
        config.with_status_policy(*policy);
    }

    if (const auto value = lookup("MCPENUM_LOG_LEVEL")) {
        const auto level = parse_log_level(*value);
        if (level.has_value() == false) {
            return tl::unexpected(ConfigError::invalid_value(
                "MCPENUM_LOG_LEVEL", "Unknown log level '" + *value + "'"));
        }
        config.with_log_level(*level);
    }

    if (const auto value = lookup("MCPENUM_LOG_FILE")) {
        if (value->empty() == false) {
            config.with_log_file(*value);
        }
    }

    return config;
}

StrategySet make_strategy_set(const ServiceConfig& config) {
    return StrategySet(
        std::make_shared<HttpDiscoveryStrategy>(config.http),
        std::make_shared<StdioDiscoveryStrategy>(config.stdio),
        std::make_shared<StaticDiscoveryStrategy>(config.static_discovery)
    );
}

std::unique_ptr<DiscoveryOrchestrator> make_orchestrator(const ServiceConfig& config) {
    return std::make_unique<DiscoveryOrchestrator>(make_strategy_set(config), config.orchestrator);
}

}  // namespace mcpenum
