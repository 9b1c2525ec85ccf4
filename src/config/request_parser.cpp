#include "mcpenum/config/request_parser.hpp"
#include "mcpenum/log/logger.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

namespace mcpenum {

namespace {

constexpr const char* kServersKey = "mcpServers";

// Keys that make up the connection shape; everything else is metadata
const std::set<std::string> kConnectionKeys = {"url", "headers", "command", "args", "env", "timeout"};

template <typename Map>
ConfigResult<Map> parse_string_map(const OrderedJson& node, const std::string& field) {
    if (node.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_type(field, "an object of strings"));
    }
    Map out;
    for (const auto& [key, value] : node.items()) {
        if (value.is_string() == false) {
            return tl::unexpected(ConfigError::invalid_type(field + "." + key, "a string"));
        }
        out.emplace(key, value.template get<std::string>());
    }
    return out;
}

ConfigResult<std::vector<std::string>> parse_string_list(const OrderedJson& node, const std::string& field) {
    if (node.is_array() == false) {
        return tl::unexpected(ConfigError::invalid_type(field, "an array of strings"));
    }
    std::vector<std::string> out;
    out.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        if (node[i].is_string() == false) {
            return tl::unexpected(ConfigError::invalid_type(field + "[" + std::to_string(i) + "]", "a string"));
        }
        out.push_back(node[i].get<std::string>());
    }
    return out;
}

ConfigResult<std::optional<std::string>> optional_string(
    const OrderedJson& node,
    const char* key,
    const std::string& field
) {
    const auto it = node.find(key);
    if ((it == node.end()) || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (it->is_string() == false) {
        return tl::unexpected(ConfigError::invalid_type(field + "." + key, "a string"));
    }
    return std::optional<std::string>(it->get<std::string>());
}

ConfigResult<bool> optional_bool(const OrderedJson& document, const char* key, bool fallback) {
    const auto it = document.find(key);
    if ((it == document.end()) || it->is_null()) {
        return fallback;
    }
    if (it->is_boolean() == false) {
        return tl::unexpected(ConfigError::invalid_type(key, "a boolean"));
    }
    return it->get<bool>();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Document
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<EnumerationRequest> RequestParser::parse(std::string_view text) const {
    // JSON objects may legally repeat keys, but a repeated server name would
    // silently replace the earlier declaration
    std::vector<std::set<std::string>> open_objects;
    std::optional<std::string> duplicate_key;
    const OrderedJson::parser_callback_t track_keys =
        [&](int /*depth*/, OrderedJson::parse_event_t event, OrderedJson& parsed) {
            switch (event) {
                case OrderedJson::parse_event_t::object_start:
                    open_objects.emplace_back();
                    break;
                case OrderedJson::parse_event_t::object_end:
                    if (open_objects.empty() == false) {
                        open_objects.pop_back();
                    }
                    break;
                case OrderedJson::parse_event_t::key: {
                    const bool inserted = (open_objects.empty() == false) &&
                                          open_objects.back().insert(parsed.get<std::string>()).second;
                    if ((inserted == false) && (duplicate_key.has_value() == false)) {
                        duplicate_key = parsed.get<std::string>();
                    }
                    break;
                }
                default:
                    break;
            }
            return true;
        };

    OrderedJson document;
    try {
        document = OrderedJson::parse(text.data(), text.data() + text.size(), track_keys);
    } catch (const OrderedJson::parse_error& e) {
        return tl::unexpected(ConfigError::invalid_json(e.what()));
    }

    if (duplicate_key.has_value()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::DuplicateKey,
            "Duplicate key '" + *duplicate_key + "' in request",
            *duplicate_key
        });
    }
    return parse(document);
}

ConfigResult<EnumerationRequest> RequestParser::parse(const OrderedJson& document) const {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_type("request", "a JSON object"));
    }

    // Locate the server map: mcp_json.mcpServers, or mcpServers at the top
    const OrderedJson* servers = nullptr;
    std::string servers_field;
    const auto wrapper_it = document.find("mcp_json");
    if (wrapper_it != document.end()) {
        if (wrapper_it->is_object() == false) {
            return tl::unexpected(ConfigError::invalid_type("mcp_json", "an object"));
        }
        const auto it = wrapper_it->find(kServersKey);
        if (it != wrapper_it->end()) {
            servers = &(*it);
            servers_field = "mcp_json.mcpServers";
        }
    } else {
        const auto it = document.find(kServersKey);
        if (it != document.end()) {
            servers = &(*it);
            servers_field = kServersKey;
        }
    }

    if (servers == nullptr) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::MissingServers,
            "mcp_json.mcpServers is required",
            "mcp_json.mcpServers"
        });
    }
    if (servers->is_object() == false) {
        return tl::unexpected(ConfigError::invalid_type(servers_field, "an object"));
    }
    if (servers->empty()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::EmptyServers,
            "At least one server must be configured",
            servers_field
        });
    }
    if (servers->size() > limits_.max_servers) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::TooManyServers,
            "Too many servers: " + std::to_string(servers->size()) +
                " (maximum " + std::to_string(limits_.max_servers) + ")",
            servers_field
        });
    }

    EnumerationRequest request;
    request.timeout = limits_.default_timeout;

    const auto timeout_it = document.find("timeout_seconds");
    const bool has_timeout = (timeout_it != document.end()) && (timeout_it->is_null() == false);
    if (has_timeout) {
        if (timeout_it->is_number() == false) {
            return tl::unexpected(ConfigError::invalid_type("timeout_seconds", "a number"));
        }
        const double seconds = timeout_it->get<double>();
        const bool in_range = std::isfinite(seconds) &&
                              (seconds >= static_cast<double>(limits_.min_timeout.count())) &&
                              (seconds <= static_cast<double>(limits_.max_timeout.count()));
        if (in_range == false) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidTimeout,
                "timeout_seconds must be between " + std::to_string(limits_.min_timeout.count()) +
                    " and " + std::to_string(limits_.max_timeout.count()),
                "timeout_seconds"
            });
        }
        request.timeout = std::chrono::milliseconds{std::llround(seconds * 1000.0)};
    }

    auto include_schemas = optional_bool(document, "include_schemas", true);
    if (include_schemas.has_value() == false) {
        return tl::unexpected(include_schemas.error());
    }
    request.include_schemas = *include_schemas;

    auto parallel = optional_bool(document, "parallel_discovery", true);
    if (parallel.has_value() == false) {
        return tl::unexpected(parallel.error());
    }
    request.parallel_discovery = *parallel;

    std::set<std::string> seen;
    std::size_t index = 0;
    for (const auto& [name, node] : servers->items()) {
        const std::string field = servers_field + "." + name;
        if (name.empty()) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidServer, "Server names must not be empty", servers_field});
        }
        const bool unique = seen.insert(name).second;
        if (unique == false) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::DuplicateKey, "Duplicate server name '" + name + "'", field});
        }

        auto descriptor = parse_server(name, node, index, field);
        if (descriptor.has_value() == false) {
            return tl::unexpected(descriptor.error());
        }
        request.servers.push_back(std::move(*descriptor));
        ++index;
    }

    get_logger().debug_fmt("Parsed request: {} servers, timeout {}ms",
                           request.servers.size(), request.timeout.count());
    return request;
}

// ─────────────────────────────────────────────────────────────────────────────
// One server declaration
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<ServerDescriptor> RequestParser::parse_server(
    const std::string& name,
    const OrderedJson& node,
    std::size_t index,
    const std::string& field
) const {
    if (node.is_object() == false) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::InvalidServer,
            "Server '" + name + "' must be an object",
            field
        });
    }

    ServerDescriptor descriptor;
    descriptor.name = name;
    descriptor.index = index;

    auto url = optional_string(node, "url", field);
    if (url.has_value() == false) {
        return tl::unexpected(url.error());
    }
    auto command = optional_string(node, "command", field);
    if (command.has_value() == false) {
        return tl::unexpected(command.error());
    }

    const bool has_url = url->has_value() && ((*url)->empty() == false);
    const bool has_command = command->has_value() && ((*command)->empty() == false);

    if (has_url) {
        HttpSpec spec;
        spec.url = **url;
        const auto headers_it = node.find("headers");
        if ((headers_it != node.end()) && (headers_it->is_null() == false)) {
            auto headers = parse_string_map<HeaderMap>(*headers_it, field + ".headers");
            if (headers.has_value() == false) {
                return tl::unexpected(headers.error());
            }
            spec.headers = std::move(*headers);
        }
        descriptor.spec = std::move(spec);
    } else if (has_command) {
        CommandSpec spec;
        spec.command = **command;
        const auto args_it = node.find("args");
        if ((args_it != node.end()) && (args_it->is_null() == false)) {
            auto args = parse_string_list(*args_it, field + ".args");
            if (args.has_value() == false) {
                return tl::unexpected(args.error());
            }
            spec.args = std::move(*args);
        }
        const auto env_it = node.find("env");
        if ((env_it != node.end()) && (env_it->is_null() == false)) {
            auto env = parse_string_map<std::map<std::string, std::string>>(*env_it, field + ".env");
            if (env.has_value() == false) {
                return tl::unexpected(env.error());
            }
            spec.env = std::move(*env);
        }
        descriptor.spec = std::move(spec);
    } else {
        descriptor.spec = MetadataSpec{};
    }

    const auto timeout_it = node.find("timeout");
    if ((timeout_it != node.end()) && (timeout_it->is_null() == false)) {
        const bool positive = timeout_it->is_number() && std::isfinite(timeout_it->get<double>()) &&
                              (timeout_it->get<double>() > 0.0);
        if (positive == false) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidTimeout,
                "Server '" + name + "' timeout must be a positive number of seconds",
                field + ".timeout"
            });
        }
        if (timeout_it->get<double>() > static_cast<double>(limits_.max_timeout.count())) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidTimeout,
                "Server '" + name + "' timeout must not exceed " +
                    std::to_string(limits_.max_timeout.count()) + " seconds",
                field + ".timeout"
            });
        }
        const auto ms = std::max<long long>(1, std::llround(timeout_it->get<double>() * 1000.0));
        descriptor.timeout = std::chrono::milliseconds{ms};
    }

    // Remaining keys, in declaration order, as plain JSON
    descriptor.metadata = Json::object();
    for (const auto& [key, value] : node.items()) {
        if (kConnectionKeys.contains(key)) {
            continue;
        }
        descriptor.metadata[key] = Json::parse(value.dump());
    }

    return descriptor;
}

}  // namespace mcpenum
