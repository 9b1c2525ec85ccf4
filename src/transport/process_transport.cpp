#include "mcpenum/transport/process_transport.hpp"
#include "mcpenum/json/fast_json.hpp"
#include "mcpenum/log/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

extern char** environ;

namespace mcpenum {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};
constexpr std::chrono::milliseconds kExitStatusWait{100};
constexpr std::size_t kReadChunkSize = 8192;

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError::make(cat, msg);
}

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

// Writing to a child that already exited must surface as EPIPE, not kill us
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Pipes are close-on-exec so that children spawned concurrently by other
// discovery tasks never inherit each other's ends
bool make_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Child side only: async-signal-safe calls, no allocation
void redirect_in_child(int fd, int target) {
    if (fd == target) {
        const int flags = ::fcntl(fd, F_GETFD);
        ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
        return;
    }
    ::dup2(fd, target);
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "terminated by signal " + std::to_string(WTERMSIG(status));
    }
    return "changed state " + std::to_string(status);
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

}  // namespace

bool TransportError::is_transient_spawn_failure() const noexcept {
    if ((category != Category::Spawn) || (sys_errno.has_value() == false)) {
        return false;
    }
    switch (*sys_errno) {
        case EAGAIN:
        case ENOMEM:
        case EMFILE:
        case ENFILE:
        case ETXTBSY:
            return true;
        default:
            return false;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Command validation
// ─────────────────────────────────────────────────────────────────────────────

#if defined(__APPLE__)
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/opt/homebrew/bin/",
    "/usr/sbin/", "/sbin/", "/Applications/"
};
#else
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/usr/sbin/", "/sbin/",
    "/snap/bin/", "/var/lib/flatpak/", "/home/", "/opt/"
};
#endif

bool is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }

    // No shell is involved (execvp), but a command name carrying shell
    // syntax is never a legitimate launcher
    const std::string dangerous_chars = ";|&$`\\\"'<>(){}[]!#~*?";
    const bool command_has_metachar = std::any_of(command.begin(), command.end(), [&](char c) {
        return dangerous_chars.find(c) != std::string::npos;
    });
    if (command_has_metachar) {
        return false;
    }

    // Arguments legitimately carry URLs and package specs ("@scope/pkg",
    // "?a=b&c=d"); only command substitution and control bytes are refused
    for (const auto& arg : args) {
        const bool has_substitution = (arg.find('`') != std::string::npos) ||
                                      (arg.find("$(") != std::string::npos);
        const bool has_control = std::any_of(arg.begin(), arg.end(), [](unsigned char c) {
            return (c < 0x20) || (c == 0x7F);
        });
        if (has_substitution || has_control) {
            return false;
        }
    }

    const bool is_absolute = (command.front() == '/');
    if (is_absolute) {
        const bool allowed = std::any_of(
            kAllowedCommandPrefixes.begin(), kAllowedCommandPrefixes.end(),
            [&](const std::string& prefix) { return command.rfind(prefix, 0) == 0; });
        if (allowed == false) {
            return false;
        }
    }

    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ProcessTransport::ProcessTransport(ProcessTransportConfig config)
    : config_(std::move(config))
{}

ProcessTransport::~ProcessTransport() {
    stop();
}

TransportResult<void> ProcessTransport::start() {
    const bool validation_failed = (config_.skip_command_validation == false) &&
                                   (is_safe_command(config_.command, config_.args) == false);
    if (validation_failed) {
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Command validation failed: potentially unsafe command or arguments"
        ));
    }
    if (child_pid_ > 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Process already running"
        ));
    }

    ignore_sigpipe_once();

    // Everything the child needs is allocated before fork(): after fork only
    // the calling thread exists in the child and malloc may be locked.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged_env;
    for (char** entry = environ; (entry != nullptr) && (*entry != nullptr); ++entry) {
        const std::string_view kv(*entry);
        const auto eq = kv.find('=');
        if (eq != std::string_view::npos) {
            merged_env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
        }
    }
    for (const auto& [key, value] : config_.env) {
        merged_env[key] = value;
    }
    std::vector<std::string> env_storage;
    env_storage.reserve(merged_env.size());
    for (const auto& [key, value] : merged_env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& str : env_storage) {
        envp.push_back(str.data());
    }
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // child reports exec errno here

    const bool pipes_ok = make_pipe(stdin_pipe) && make_pipe(stdout_pipe) &&
                          make_pipe(stderr_pipe) && make_pipe(status_pipe);
    if (pipes_ok == false) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        auto error = make_error(TransportError::Category::Spawn, "Failed to create pipes: " + errno_text(err));
        error.sys_errno = err;
        return tl::unexpected(error);
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        auto error = make_error(TransportError::Category::Spawn, "Failed to fork: " + errno_text(err));
        error.sys_errno = err;
        return tl::unexpected(error);
    }

    if (pid == 0) {
        // Child. Own process group so stop() can signal launcher grandchildren.
        ::setpgid(0, 0);

        redirect_in_child(stdin_pipe[0], STDIN_FILENO);
        redirect_in_child(stdout_pipe[1], STDOUT_FILENO);
        redirect_in_child(stderr_pipe[1], STDERR_FILENO);

        environ = envp.data();
        ::execvp(argv_storage.front().c_str(), argv.data());

        const int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Set the group from this side too; whichever runs first wins.
    ::setpgid(pid, pid);

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    // EOF means exec succeeded (the write end closed on exec)
    int exec_errno = 0;
    ssize_t status_read = 0;
    do {
        status_read = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while ((status_read == -1) && (errno == EINTR));
    ::close(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while ((::waitpid(pid, &status, 0) == -1) && (errno == EINTR)) {}
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);

        std::string message = "Failed to start '" + config_.command + "': " + errno_text(exec_errno);
        if (exec_errno == ENOENT) {
            message = "Command '" + config_.command + "' not found in PATH";
        }
        auto error = make_error(TransportError::Category::Spawn, message);
        error.sys_errno = exec_errno;
        return tl::unexpected(error);
    }

    child_pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    reaped_ = false;
    exit_code_.reset();
    read_buffer_.clear();
    stderr_tail_.clear();

    get_logger().info_fmt("Started process '{}' ({} args) pid={}",
                          config_.command, config_.args.size(), static_cast<long>(pid));
    return {};
}

void ProcessTransport::stop() {
    if (child_pid_ <= 0) {
        close_fds();
        return;
    }

    const pid_t pid = child_pid_;

    // EOF on stdin is the polite shutdown request for stdio servers
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }

    // A leader reaped here or earlier no longer holds its group id, so the
    // group is only signalled while the leader is unreaped
    const bool already_exited = try_reap(std::chrono::milliseconds{0});
    if (already_exited == false) {
        if (::kill(-pid, SIGTERM) == -1) {
            ::kill(pid, SIGTERM);
        }
        const bool exited_on_term = wait_for_exit(config_.termination_grace);

        // Group members that ignored SIGTERM or outlived the leader
        ::kill(-pid, SIGKILL);
        if (exited_on_term == false) {
            ::kill(pid, SIGKILL);
        }

        int status = 0;
        pid_t waited = -1;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while ((waited == -1) && (errno == EINTR));
        if (waited == pid) {
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
            get_logger().debug_fmt("Process pid={} {}", static_cast<long>(pid), describe_status(status));
        }
        reaped_ = true;
    }

    drain_stderr(std::chrono::milliseconds{0});
    close_fds();
    child_pid_ = -1;

    get_logger().debug_fmt("Stopped process pid={} exit={}",
                           static_cast<long>(pid), exit_code_.value_or(0));
}

bool ProcessTransport::try_reap(std::chrono::milliseconds wait) {
    if (reaped_) {
        return true;
    }
    const auto give_up_at = Clock::now() + wait;
    while (true) {
        int status = 0;
        const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
        if (result == child_pid_) {
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
            reaped_ = true;
            get_logger().debug_fmt("Process pid={} {}", static_cast<long>(child_pid_), describe_status(status));
            return true;
        }
        if ((result == -1) && (errno != EINTR)) {
            // ECHILD: nothing left to wait for
            reaped_ = true;
            return true;
        }
        if (Clock::now() >= give_up_at) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
}

// Leaves the exited child unreaped (WNOWAIT)
bool ProcessTransport::wait_for_exit(std::chrono::milliseconds wait) {
    const auto give_up_at = Clock::now() + wait;
    while (true) {
        siginfo_t info{};
        const int result = ::waitid(P_PID, static_cast<id_t>(child_pid_), &info, WEXITED | WNOHANG | WNOWAIT);
        if ((result == 0) && (info.si_pid == child_pid_)) {
            return true;
        }
        if ((result == -1) && (errno != EINTR)) {
            return true;
        }
        if (Clock::now() >= give_up_at) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
}

void ProcessTransport::close_fds() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> ProcessTransport::send(const Json& message) {
    if ((child_pid_ <= 0) || (stdin_fd_ < 0)) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
    }

    const std::string data = message.dump() + "\n";

    // Partial writes are normal once a frame exceeds PIPE_BUF
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return tl::unexpected(exited_error("Process closed its input"));
            }
            return tl::unexpected(make_error(
                TransportError::Category::Io,
                "Failed to write to process: " + errno_text(errno)
            ));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

TransportResult<Json> ProcessTransport::receive(const Deadline& deadline) {
    if ((child_pid_ <= 0) || (stdout_fd_ < 0)) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
    }

    std::array<char, kReadChunkSize> chunk{};
    while (true) {
        auto buffered = next_buffered_message();
        if (!buffered) {
            return tl::unexpected(buffered.error());
        }
        if (buffered->has_value()) {
            return std::move(**buffered);
        }

        if (deadline.cancelled()) {
            return tl::unexpected(make_error(TransportError::Category::Cancelled,
                                             "Cancelled while waiting for process output"));
        }
        if (deadline.expired()) {
            return tl::unexpected(make_error(TransportError::Category::Timeout,
                                             "Timed out waiting for process output"));
        }

        // Short slices so cancellation is noticed promptly
        const auto slice = std::clamp(deadline.remaining(), std::chrono::milliseconds{1}, kPollSlice);

        std::array<pollfd, 2> fds{};
        fds[0].fd = stdout_fd_;
        fds[0].events = POLLIN;
        nfds_t count = 1;
        if (stderr_fd_ >= 0) {
            fds[1].fd = stderr_fd_;
            fds[1].events = POLLIN;
            count = 2;
        }

        const int ready = ::poll(fds.data(), count, static_cast<int>(slice.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_error(TransportError::Category::Io,
                                             "poll failed: " + errno_text(errno)));
        }
        if (ready == 0) {
            continue;
        }

        if ((count == 2) && (fds[1].revents != 0)) {
            drain_stderr(std::chrono::milliseconds{0});
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            const ssize_t n = ::read(stdout_fd_, chunk.data(), chunk.size());
            if (n > 0) {
                read_buffer_.append(chunk.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                return tl::unexpected(exited_error("Process closed its output"));
            } else if ((errno != EINTR) && (errno != EAGAIN)) {
                return tl::unexpected(make_error(TransportError::Category::Io,
                                                 "Failed to read from process: " + errno_text(errno)));
            }
        }
    }
}

TransportResult<std::optional<Json>> ProcessTransport::next_buffered_message() {
    while (true) {
        auto payload = take_line();
        if (!payload) {
            return tl::unexpected(payload.error());
        }
        if (payload->has_value() == false) {
            return std::optional<Json>{};
        }

        const std::string text = trim(**payload);
        if (text.empty()) {
            continue;  // blank keep-alive lines
        }

        auto parsed = fast_parse(text);
        if (!parsed) {
            return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Invalid JSON from process: " + parsed.error().message
            ));
        }
        return std::optional<Json>(std::move(*parsed));
    }
}

TransportResult<std::optional<std::string>> ProcessTransport::take_line() {
    const auto newline = read_buffer_.find('\n');
    if (newline == std::string::npos) {
        if (read_buffer_.size() > config_.max_message_size) {
            return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Message exceeds " + std::to_string(config_.max_message_size) + " bytes"
            ));
        }
        return std::optional<std::string>{};
    }
    std::string line = read_buffer_.substr(0, newline);
    read_buffer_.erase(0, newline + 1);
    return std::optional<std::string>(std::move(line));
}

TransportError ProcessTransport::exited_error(const std::string& what) {
    // Give the exit status and the last stderr lines a moment to arrive
    drain_stderr(kExitStatusWait);
    const bool reaped = try_reap(kExitStatusWait);

    std::string message = what;
    if (reaped && exit_code_.has_value()) {
        if (*exit_code_ >= 0) {
            message += " (exit code " + std::to_string(*exit_code_) + ")";
        } else {
            message += " (signal " + std::to_string(-*exit_code_) + ")";
        }
    }
    return make_error(TransportError::Category::Closed, message);
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr capture
// ─────────────────────────────────────────────────────────────────────────────

void ProcessTransport::drain_stderr(std::chrono::milliseconds wait_for_eof) {
    if (stderr_fd_ < 0) {
        return;
    }
    const auto give_up_at = Clock::now() + wait_for_eof;
    std::array<char, kReadChunkSize> chunk{};
    while (stderr_fd_ >= 0) {
        const auto left = std::chrono::ceil<std::chrono::milliseconds>(give_up_at - Clock::now());
        pollfd pfd{};
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;
        const int timeout_ms = static_cast<int>(std::max<std::int64_t>(0, left.count()));
        const int ready = ::poll(&pfd, 1, timeout_ms);
        if ((ready == -1) && (errno == EINTR)) {
            continue;
        }
        if (ready <= 0) {
            return;
        }
        const ssize_t n = ::read(stderr_fd_, chunk.data(), chunk.size());
        if (n > 0) {
            append_stderr(chunk.data(), static_cast<std::size_t>(n));
            continue;
        }
        if ((n == -1) && (errno == EINTR)) {
            continue;
        }
        // EOF or error: stop polling this descriptor
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

void ProcessTransport::append_stderr(const char* data, std::size_t n) {
    stderr_tail_.append(data, n);
    if (stderr_tail_.size() > config_.max_stderr_bytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - config_.max_stderr_bytes);
    }
}

}  // namespace mcpenum
