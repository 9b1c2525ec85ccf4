#include "mcpenum/discovery/orchestrator.hpp"
#include "mcpenum/log/logger.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <memory>

namespace mcpenum {

namespace {

// Shared with the worker tasks, which may still be winding down after
// collect() has given up on them
struct RequestState {
    RequestState(EnumerationRequest req, Deadline deadline)
        : request(std::move(req))
        , overall(std::move(deadline))
        , slots(request.servers.size())
    {}

    EnumerationRequest request;
    Deadline overall;
    std::vector<std::promise<ServerRun>> slots;
};

ServerRun overall_timeout_run(const ServerDescriptor& descriptor, Clock::time_point started) {
    return ServerRun{
        descriptor.name,
        select_strategy(descriptor.spec),
        tl::unexpected(DiscoveryError::timeout("Overall request timeout exceeded")),
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started)
    };
}

}  // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(StrategySet strategies, OrchestratorConfig config)
    : strategies_(std::move(strategies))
    , config_(config)
    , pool_(std::max<std::size_t>(1, config.max_in_flight))
{}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
    pool_.join();
}

EnumerationReport DiscoveryOrchestrator::run(const EnumerationRequest& request) {
    auto runs = collect(request);
    const AggregationOptions options{request.include_schemas, config_.status_policy};
    auto report = aggregate(std::move(runs), options, utc_timestamp(std::chrono::system_clock::now()));

    get_logger().info_fmt("Enumeration finished: {} ({} of {} servers, {} tools)",
                          to_string(report.status), report.connected_servers,
                          report.total_servers, report.tools.size());
    return report;
}

std::vector<ServerRun> DiscoveryOrchestrator::collect(const EnumerationRequest& request) {
    const auto started = Clock::now();
    const std::size_t count = request.servers.size();

    get_logger().info_fmt("Enumerating {} servers ({}, timeout {}ms)",
                          count,
                          request.parallel_discovery ? "parallel" : "sequential",
                          request.timeout.count());

    auto state = std::make_shared<RequestState>(request, Deadline(started + request.timeout, CancellationToken{}));

    std::vector<std::future<ServerRun>> futures;
    futures.reserve(count);
    for (auto& slot : state->slots) {
        futures.push_back(slot.get_future());
    }

    if (request.parallel_discovery) {
        for (std::size_t i = 0; i < count; ++i) {
            asio::post(pool_, [this, state, i]() {
                state->slots[i].set_value(run_server(state->request.servers[i], state->overall));
            });
        }
    } else {
        asio::post(pool_, [this, state, started]() {
            for (std::size_t i = 0; i < state->slots.size(); ++i) {
                const auto& descriptor = state->request.servers[i];
                const bool out_of_time = state->overall.cancelled() || state->overall.expired();
                if (out_of_time) {
                    state->slots[i].set_value(overall_timeout_run(descriptor, started));
                    continue;
                }
                state->slots[i].set_value(run_server(descriptor, state->overall));
            }
        });
    }

    // Join in declaration order. Once the hard stop passes, cancel once and
    // give every remaining slot until hard stop + grace.
    const auto hard_stop = state->overall.expires_at();
    const auto give_up_at = hard_stop + config_.cancellation_grace;
    bool cancelled = false;

    std::vector<ServerRun> runs;
    runs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto status = futures[i].wait_until(cancelled ? give_up_at : hard_stop);
        if ((status != std::future_status::ready) && (cancelled == false)) {
            get_logger().warn_fmt("Overall timeout of {}ms reached; cancelling outstanding servers",
                                  request.timeout.count());
            state->overall.token().cancel();
            cancelled = true;
            status = futures[i].wait_until(give_up_at);
        }

        if (status == std::future_status::ready) {
            runs.push_back(futures[i].get());
        } else {
            runs.push_back(overall_timeout_run(state->request.servers[i], started));
        }
    }
    return runs;
}

ServerRun DiscoveryOrchestrator::run_server(const ServerDescriptor& descriptor, const Deadline& overall) {
    const auto started = Clock::now();
    const auto kind = select_strategy(descriptor.spec);
    // Clamped before the addition so an oversized budget cannot overflow the clock
    const auto budget = std::min(descriptor.timeout.value_or(config_.default_server_timeout), overall.remaining());
    const Deadline deadline = Deadline(started + budget, overall.token()).capped_at(overall.expires_at());

    get_logger().debug_fmt("Server '{}': {} discovery, budget {}ms",
                           descriptor.name, to_string(kind), deadline.remaining().count());

    DiscoveryResult result;
    try {
        result = strategies_.resolve(kind).discover(descriptor, deadline);
    } catch (const std::exception& e) {
        result = tl::unexpected(DiscoveryError::protocol(std::string("Discovery failed: ") + e.what()));
    } catch (...) {
        result = tl::unexpected(DiscoveryError::protocol("Discovery failed with an unknown exception"));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (result.has_value()) {
        get_logger().info_fmt("Server '{}': {} tools in {}ms", descriptor.name, result->size(), elapsed.count());
    } else {
        get_logger().warn_fmt("Server '{}': {} after {}ms: {}", descriptor.name,
                              to_string(result.error().kind), elapsed.count(), result.error().message);
    }

    return ServerRun{descriptor.name, kind, std::move(result), elapsed};
}

}  // namespace mcpenum
