#pragma once

#include "mcpenum/discovery/strategy.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace mcpenum {

struct StdioDiscoveryConfig {
    /// Client info sent in the initialize handshake
    std::string client_name = "mcpenum";
    std::string client_version = "0.1.0";

    /// tools/list pages followed before giving up on nextCursor
    std::size_t max_pages{16};

    /// SIGTERM to SIGKILL escalation when the process is torn down
    std::chrono::milliseconds termination_grace{100};

    /// Bytes of stderr kept for error diagnostics
    std::size_t max_stderr_bytes{8 * 1024};

    /// Reject commands with shell metacharacters
    bool validate_commands{true};

    /// Extra start attempts after EAGAIN/ENOMEM/EMFILE/ENFILE/ETXTBSY
    std::size_t spawn_retries{1};

    StdioDiscoveryConfig& with_termination_grace(std::chrono::milliseconds grace) {
        termination_grace = grace;
        return *this;
    }

    StdioDiscoveryConfig& with_validate_commands(bool enable) {
        validate_commands = enable;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioDiscoveryStrategy
// ─────────────────────────────────────────────────────────────────────────────
// Launches the declared command, performs the MCP handshake over its stdio,
// lists tools and tears the process down again. The process never outlives
// discover(): every return path stops and reaps it.

class StdioDiscoveryStrategy final : public IDiscoveryStrategy {
public:
    StdioDiscoveryStrategy() = default;
    explicit StdioDiscoveryStrategy(StdioDiscoveryConfig config) : config_(std::move(config)) {}

    [[nodiscard]] DiscoveryResult discover(
        const ServerDescriptor& descriptor,
        const Deadline& deadline
    ) override;

private:
    StdioDiscoveryConfig config_;
};

/// npx, uvx and uv do nothing useful without a package argument
[[nodiscard]] bool is_bare_launcher(const std::string& command, const std::vector<std::string>& args);

}  // namespace mcpenum
