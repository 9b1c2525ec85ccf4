#ifndef MCPENUM_DISCOVERY_ORCHESTRATOR_HPP
#define MCPENUM_DISCOVERY_ORCHESTRATOR_HPP

#include "mcpenum/deadline.hpp"
#include "mcpenum/discovery/aggregator.hpp"
#include "mcpenum/discovery/strategy_selector.hpp"
#include "mcpenum/model/enumeration.hpp"

#include <asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <vector>

namespace mcpenum {

// ═══════════════════════════════════════════════════════════════════════════
// Orchestrator Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct OrchestratorConfig {
    /// Worker threads, and so the number of servers discovered at once
    std::size_t max_in_flight{8};

    /// Per-server budget when the declaration sets no timeout
    std::chrono::milliseconds default_server_timeout{30'000};

    /// After the overall deadline the request is cancelled; strategies get
    /// this long to wind down before their slot is recorded as Timeout
    std::chrono::milliseconds cancellation_grace{500};

    StatusPolicy status_policy{StatusPolicy::RequireAll};

    OrchestratorConfig& with_max_in_flight(std::size_t count) {
        max_in_flight = count;
        return *this;
    }

    OrchestratorConfig& with_default_server_timeout(std::chrono::milliseconds timeout) {
        default_server_timeout = timeout;
        return *this;
    }

    OrchestratorConfig& with_cancellation_grace(std::chrono::milliseconds grace) {
        cancellation_grace = grace;
        return *this;
    }

    OrchestratorConfig& with_status_policy(StatusPolicy policy) {
        status_policy = policy;
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// DiscoveryOrchestrator
// ═══════════════════════════════════════════════════════════════════════════
// Runs one strategy per server on a fixed worker pool and joins the results
// in declaration order. Exactly one ServerRun comes back per server, whatever
// the strategies do: errors, exceptions and overruns all become failed runs
// of that server only.
//
// Deadlines nest: each server gets min(its own timeout, time left on the
// request). When the request deadline passes, the shared token is cancelled
// and, after cancellation_grace, servers still running are reported as
// Timeout. run() does not wait for them beyond that.
//
// run() may be called repeatedly and from several threads; requests share
// the pool.

class DiscoveryOrchestrator {
public:
    explicit DiscoveryOrchestrator(StrategySet strategies, OrchestratorConfig config = {});
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /// Discover every server and aggregate into a report
    [[nodiscard]] EnumerationReport run(const EnumerationRequest& request);

    /// Discover every server; one run per server, declaration order
    [[nodiscard]] std::vector<ServerRun> collect(const EnumerationRequest& request);

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ServerRun run_server(const ServerDescriptor& descriptor, const Deadline& overall);

    StrategySet strategies_;
    OrchestratorConfig config_;
    asio::thread_pool pool_;
};

}  // namespace mcpenum

#endif  // MCPENUM_DISCOVERY_ORCHESTRATOR_HPP
