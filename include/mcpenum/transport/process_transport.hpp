#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcpenum/deadline.hpp"
#include "mcpenum/transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcpenum {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ProcessTransportConfig {
    std::string command;
    std::vector<std::string> args;

    // Applied on top of the inherited environment. PATH from here is used
    // to find command.
    std::map<std::string, std::string> env;

    // One JSON message per line
    std::size_t max_message_size{4 * 1024 * 1024};

    // Last bytes of stderr kept for diagnostics
    std::size_t max_stderr_bytes{8 * 1024};

    // Time between SIGTERM and SIGKILL when stopping
    std::chrono::milliseconds termination_grace{100};

    // Only for trusted input such as tests; disables metacharacter checks
    bool skip_command_validation{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Owns one child process and the pipes to it. The child is started in its
// own process group; stop() (also run by the destructor) signals the whole
// group and reaps the child, so nothing outlives the transport.
//
// Not thread-safe: one discovery task drives a transport from start to stop.

class ProcessTransport {
public:
    explicit ProcessTransport(ProcessTransportConfig config);
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    /// Spawn the child. Fails with Category::Spawn when exec fails, so a
    /// missing command is reported here rather than on first read.
    [[nodiscard]] TransportResult<void> start();

    /// Close stdin, SIGTERM the group, SIGKILL after the grace period, reap
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return child_pid_ > 0; }

    /// Child pid while running, -1 otherwise
    [[nodiscard]] pid_t pid() const noexcept { return child_pid_; }

    [[nodiscard]] TransportResult<void> send(const Json& message);

    /// Next complete message; waits until the deadline expires or its token
    /// is cancelled (Category::Timeout / Category::Cancelled)
    [[nodiscard]] TransportResult<Json> receive(const Deadline& deadline);

    /// Exit status once the child has been reaped; negative for signals
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

    /// Captured stderr tail
    [[nodiscard]] const std::string& stderr_tail() const noexcept { return stderr_tail_; }

private:
    // nullopt while no complete message is buffered yet
    [[nodiscard]] TransportResult<std::optional<Json>> next_buffered_message();
    [[nodiscard]] TransportResult<std::optional<std::string>> take_line();
    [[nodiscard]] TransportError exited_error(const std::string& what);

    void drain_stderr(std::chrono::milliseconds wait_for_eof);
    void append_stderr(const char* data, std::size_t n);
    bool try_reap(std::chrono::milliseconds wait);
    bool wait_for_exit(std::chrono::milliseconds wait);
    void close_fds();

    ProcessTransportConfig config_;
    pid_t child_pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    bool reaped_{false};
    std::optional<int> exit_code_;

    std::string read_buffer_;
    std::string stderr_tail_;
};

/// Reject commands containing shell metacharacters and arguments carrying
/// command substitution or control characters
[[nodiscard]] bool is_safe_command(const std::string& command, const std::vector<std::string>& args);

}  // namespace mcpenum
