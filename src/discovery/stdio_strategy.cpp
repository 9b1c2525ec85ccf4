#include "mcpenum/discovery/stdio_strategy.hpp"
#include "mcpenum/log/logger.hpp"
#include "mcpenum/protocol/json_rpc.hpp"
#include "mcpenum/protocol/mcp_types.hpp"
#include "mcpenum/transport/process_transport.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

namespace mcpenum {

namespace {

DiscoveryError from_transport_error(const TransportError& error) {
    switch (error.category) {
        case TransportError::Category::Timeout:
            return DiscoveryError::timeout("Server discovery timed out");
        case TransportError::Category::Cancelled:
            return DiscoveryError::timeout("Overall request timeout exceeded");
        case TransportError::Category::Protocol:
            return DiscoveryError::malformed_response(error.message);
        case TransportError::Category::Spawn:
        case TransportError::Category::Closed:
        case TransportError::Category::Io:
            return DiscoveryError::process_failure(error.message);
    }
    return DiscoveryError::process_failure(error.message);
}

std::string_view basename_of(std::string_view path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// StdioSession - JSON-RPC conversation with one started process
// ─────────────────────────────────────────────────────────────────────────────

class StdioSession {
public:
    StdioSession(const std::string& server, ProcessTransport& process, const Deadline& deadline)
        : server_(server)
        , process_(process)
        , deadline_(deadline)
    {}

    tl::expected<Json, DiscoveryError> call(const std::string& method, Json params) {
        const JsonRpcRequest request(method, next_id_++, std::move(params));
        auto sent = process_.send(request.to_json());
        if (sent.has_value() == false) {
            return tl::unexpected(from_transport_error(sent.error()));
        }
        return await_response(request.id());
    }

    tl::expected<void, DiscoveryError> notify(const std::string& method) {
        const JsonRpcNotification notification(method);
        auto sent = process_.send(notification.to_json());
        if (sent.has_value() == false) {
            return tl::unexpected(from_transport_error(sent.error()));
        }
        return {};
    }

private:
    // Servers log through notifications and may ask us things (roots,
    // sampling) before answering; neither is part of enumeration.
    tl::expected<Json, DiscoveryError> await_response(const JsonRpcId& id) {
        while (true) {
            auto message = process_.receive(deadline_);
            if (message.has_value() == false) {
                return tl::unexpected(from_transport_error(message.error()));
            }

            switch (classify(*message)) {
                case MessageKind::Notification:
                    continue;

                case MessageKind::Request: {
                    const std::string method = message->value("method", "");
                    get_logger().debug_fmt("Server '{}': declining server request '{}'", server_, method);
                    auto sent = process_.send(JsonRpcResponse::method_not_found(message->at("id"), method));
                    if (sent.has_value() == false) {
                        return tl::unexpected(from_transport_error(sent.error()));
                    }
                    continue;
                }

                case MessageKind::Invalid:
                    return tl::unexpected(DiscoveryError::protocol(
                        "Unexpected message from server: " + message->dump()));

                case MessageKind::Response:
                    break;
            }

            auto rpc = JsonRpcResponse::from_json(*message);
            if (rpc.has_value() == false) {
                return tl::unexpected(DiscoveryError::malformed_response(rpc.error().message));
            }
            if ((rpc->id() == id) == false) {
                return tl::unexpected(DiscoveryError::protocol(
                    "Response id " + rpc->id().to_string() + " does not match request id " + id.to_string()));
            }
            if (rpc->is_error()) {
                return tl::unexpected(DiscoveryError::upstream(
                    "JSON-RPC error " + std::to_string(rpc->error().code) + ": " + rpc->error().message));
            }
            return rpc->result();
        }
    }

    const std::string& server_;
    ProcessTransport& process_;
    const Deadline& deadline_;
    std::int64_t next_id_{1};
};

DiscoveryResult converse(
    const ServerDescriptor& descriptor,
    const StdioDiscoveryConfig& config,
    StdioSession& session
) {
    InitializeParams params;
    params.client_info = Implementation{config.client_name, config.client_version};

    auto init_result = session.call(methods::kInitialize, params.to_json());
    if (init_result.has_value() == false) {
        return tl::unexpected(init_result.error());
    }
    const auto handshake = InitializeResult::from_json(*init_result);
    if (handshake.has_value() == false) {
        return tl::unexpected(DiscoveryError::malformed_response(handshake.error().message));
    }
    get_logger().debug_fmt("Server '{}': initialized {} {} (protocol {})",
                           descriptor.name, handshake->server_info.name,
                           handshake->server_info.version, handshake->protocol_version);

    auto initialized = session.notify(methods::kInitialized);
    if (initialized.has_value() == false) {
        return tl::unexpected(initialized.error());
    }

    std::vector<DiscoveredTool> tools;
    std::optional<std::string> cursor;
    for (std::size_t page = 0; page < config.max_pages; ++page) {
        auto result = session.call(methods::kToolsList, list_tools_params(cursor));
        if (result.has_value() == false) {
            return tl::unexpected(result.error());
        }
        auto listing = ListToolsResult::from_json(*result);
        if (listing.has_value() == false) {
            return tl::unexpected(DiscoveryError::malformed_response(listing.error().message));
        }
        for (auto& tool : listing->tools) {
            tools.push_back(DiscoveredTool{
                descriptor.name, std::move(tool.name), std::move(tool.description), std::move(tool.input_schema)});
        }
        if (listing->next_cursor.has_value() == false) {
            return tools;
        }
        cursor = std::move(listing->next_cursor);
    }

    get_logger().warn_fmt("Server '{}': stopped after {} tools/list pages", descriptor.name, config.max_pages);
    return tools;
}

}  // namespace

bool is_bare_launcher(const std::string& command, const std::vector<std::string>& args) {
    static constexpr std::array<std::string_view, 3> kLaunchers = {"npx", "uvx", "uv"};
    const auto name = basename_of(command);
    const bool is_launcher = std::find(kLaunchers.begin(), kLaunchers.end(), name) != kLaunchers.end();
    return is_launcher && args.empty();
}

// ═══════════════════════════════════════════════════════════════════════════
// StdioDiscoveryStrategy
// ═══════════════════════════════════════════════════════════════════════════

DiscoveryResult StdioDiscoveryStrategy::discover(
    const ServerDescriptor& descriptor,
    const Deadline& deadline
) {
    const auto* spec = std::get_if<CommandSpec>(&descriptor.spec);
    const bool has_command = (spec != nullptr) && (spec->command.empty() == false);
    if (has_command == false) {
        return tl::unexpected(DiscoveryError::configuration("Server declares no command"));
    }
    if (is_bare_launcher(spec->command, spec->args)) {
        return tl::unexpected(DiscoveryError::configuration(
            "'" + spec->command + "' requires a package argument"));
    }
    const bool rejected = config_.validate_commands && (is_safe_command(spec->command, spec->args) == false);
    if (rejected) {
        return tl::unexpected(DiscoveryError::configuration(
            "Command rejected: shell metacharacters in command or arguments"));
    }
    if (deadline.cancelled()) {
        return tl::unexpected(DiscoveryError::timeout("Overall request timeout exceeded"));
    }
    if (deadline.expired()) {
        return tl::unexpected(DiscoveryError::timeout("Server discovery timed out"));
    }

    ProcessTransportConfig process_config;
    process_config.command = spec->command;
    process_config.args = spec->args;
    process_config.env = spec->env;
    process_config.max_stderr_bytes = config_.max_stderr_bytes;
    process_config.termination_grace = config_.termination_grace;
    process_config.skip_command_validation = true;  // checked above

    ProcessTransport process(process_config);

    auto started = process.start();
    for (std::size_t retry = 0; (started.has_value() == false) && (retry < config_.spawn_retries); ++retry) {
        if (started.error().is_transient_spawn_failure() == false) {
            break;
        }
        get_logger().warn_fmt("Server '{}': retrying start after: {}", descriptor.name, started.error().message);
        started = process.start();
    }
    if (started.has_value() == false) {
        return tl::unexpected(DiscoveryError::process_failure(started.error().message));
    }

    StdioSession session(descriptor.name, process, deadline);
    DiscoveryResult result;
    try {
        result = converse(descriptor, config_, session);
    } catch (const nlohmann::json::exception& e) {
        result = tl::unexpected(DiscoveryError::malformed_response(e.what()));
    }

    if (result.has_value() == false) {
        // Stop first so the last stderr lines are collected
        process.stop();
        const auto& tail = process.stderr_tail();
        if (tail.empty() == false) {
            get_logger().debug_fmt("Server '{}' stderr:\n{}", descriptor.name, tail);
        }
        auto error = result.error();
        error.with_diagnostics(tail);
        return tl::unexpected(std::move(error));
    }
    return result;
}

}  // namespace mcpenum
