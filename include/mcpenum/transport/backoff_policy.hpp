#ifndef MCPENUM_TRANSPORT_BACKOFF_POLICY_HPP
#define MCPENUM_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before retry number `attempt` (0 = first retry). One policy instance
// is shared by every server of a request, so implementations must be
// thread-safe.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max) * (1 +/- jitter)
//
// Defaults are tuned for discovery, where the whole budget for one server
// is tens of seconds: 200ms, 400ms, 800ms ... capped at 5s.

class ExponentialBackoff final : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{200},
              2.0,
              std::chrono::milliseconds{5'000},
              0.25
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 = no jitter, 0.25 = +/-25%
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, static_cast<double>(attempt));
        const double capped_ms = std::min(delay_ms, static_cast<double>(max_.count()));
        const double jittered_ms = add_jitter(capped_ms);
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, jittered_ms))};
    }

private:
    double add_jitter(double base_value) {
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter == false) {
            return base_value;
        }
        std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return base_value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - retry immediately (tests)
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff final : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace mcpenum

#endif  // MCPENUM_TRANSPORT_BACKOFF_POLICY_HPP
