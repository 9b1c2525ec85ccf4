#ifndef MCPENUM_TESTS_MOCKS_PROCESS_WATCH_HPP
#define MCPENUM_TESTS_MOCKS_PROCESS_WATCH_HPP

#include <cerrno>
#include <chrono>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/types.h>

namespace mcpenum::testing {

// A process counts as gone once it no longer exists or is a zombie waiting
// for a parent other than us (orphans reparented to a reaper that is slow
// to collect them).
inline bool process_gone(pid_t pid) {
    if ((::kill(pid, 0) == -1) && (errno == ESRCH)) {
        return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (stat.is_open() == false) {
        return true;
    }
    std::string line;
    std::getline(stat, line);
    const auto close_paren = line.rfind(')');
    return (close_paren != std::string::npos) && (close_paren + 2 < line.size()) &&
           (line[close_paren + 2] == 'Z');
}

inline bool wait_until_gone(pid_t pid, std::chrono::milliseconds limit = std::chrono::milliseconds{2000}) {
    const auto give_up_at = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < give_up_at) {
        if (process_gone(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return process_gone(pid);
}

/// Pid written by `echo-tools-mock --pid-file PATH`
inline std::optional<pid_t> read_pid_file(const std::string& path) {
    std::ifstream file(path);
    long pid = 0;
    if ((file >> pid) && (pid > 0)) {
        return static_cast<pid_t>(pid);
    }
    return std::nullopt;
}

}  // namespace mcpenum::testing

#endif  // MCPENUM_TESTS_MOCKS_PROCESS_WATCH_HPP
