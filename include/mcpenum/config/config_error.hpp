#pragma once

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// ConfigError
// ─────────────────────────────────────────────────────────────────────────────
// A rejected request document or service setting. `field` names the
// offending location ("mcp_json.mcpServers.github.args", "MCPENUM_MAX_SERVERS").

struct ConfigError {
    enum class Code {
        InvalidJson,
        MissingServers,
        EmptyServers,
        TooManyServers,
        DuplicateKey,
        InvalidServer,
        InvalidTimeout,
        InvalidType,
        InvalidValue
    };

    Code code{Code::InvalidValue};
    std::string message;
    std::string field;

    static ConfigError invalid_json(std::string msg) {
        return {Code::InvalidJson, std::move(msg), ""};
    }
    static ConfigError invalid_type(std::string field, std::string expected) {
        std::string msg = field + " must be " + expected;
        return {Code::InvalidType, std::move(msg), std::move(field)};
    }
    static ConfigError invalid_value(std::string field, std::string msg) {
        return {Code::InvalidValue, std::move(msg), std::move(field)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError::Code code) noexcept {
    switch (code) {
        case ConfigError::Code::InvalidJson:    return "invalid_json";
        case ConfigError::Code::MissingServers: return "missing_servers";
        case ConfigError::Code::EmptyServers:   return "empty_servers";
        case ConfigError::Code::TooManyServers: return "too_many_servers";
        case ConfigError::Code::DuplicateKey:   return "duplicate_key";
        case ConfigError::Code::InvalidServer:  return "invalid_server";
        case ConfigError::Code::InvalidTimeout: return "invalid_timeout";
        case ConfigError::Code::InvalidType:    return "invalid_type";
        case ConfigError::Code::InvalidValue:   return "invalid_value";
    }
    return "unknown";
}

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

}  // namespace mcpenum
