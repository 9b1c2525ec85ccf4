#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Deadlines and Cancellation
// ═══════════════════════════════════════════════════════════════════════════
// Every blocking wait in discovery is bounded by a Deadline. A Deadline is
// an absolute steady-clock instant plus a CancellationToken shared with the
// orchestrator, which flips the token when the overall request ceiling is
// reached. Waiters poll both, so either nested limit ends the wait.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>

namespace mcpenum {

using Clock = std::chrono::steady_clock;

class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class Deadline {
public:
    Deadline(Clock::time_point expires_at, CancellationToken token)
        : expires_at_(expires_at)
        , token_(std::move(token))
    {}

    [[nodiscard]] static Deadline after(std::chrono::milliseconds budget,
                                        CancellationToken token = {}) {
        return Deadline(Clock::now() + budget, std::move(token));
    }

    [[nodiscard]] Clock::time_point expires_at() const noexcept {
        return expires_at_;
    }

    [[nodiscard]] const CancellationToken& token() const noexcept {
        return token_;
    }

    /// Whole milliseconds left, rounded up, never negative
    [[nodiscard]] std::chrono::milliseconds remaining() const {
        const auto left = expires_at_ - Clock::now();
        if (left <= Clock::duration::zero()) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::ceil<std::chrono::milliseconds>(left);
    }

    [[nodiscard]] bool expired() const {
        return Clock::now() >= expires_at_;
    }

    [[nodiscard]] bool cancelled() const noexcept {
        return token_.is_cancelled();
    }

    /// Same token, expiring at whichever comes first
    [[nodiscard]] Deadline capped_at(Clock::time_point limit) const {
        return Deadline(std::min(expires_at_, limit), token_);
    }

private:
    Clock::time_point expires_at_;
    CancellationToken token_;
};

}  // namespace mcpenum
