#pragma once

#include "mcpenum/discovery/strategy.hpp"
#include "mcpenum/transport/backoff_policy.hpp"
#include "mcpenum/transport/http_client.hpp"
#include "mcpenum/transport/retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mcpenum {

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Discovery Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct HttpDiscoveryConfig {
    /// Client info sent in the initialize handshake
    std::string client_name = "mcpenum";
    std::string client_version = "0.1.0";

    /// Capped by the server's remaining deadline
    std::chrono::milliseconds connect_timeout{10'000};

    bool verify_ssl{true};

    /// Retries after the first attempt of each POST. Ignored when
    /// retry_policy is set.
    std::size_t max_retries{2};

    /// Custom retry policy (nullptr = RetryPolicy with max_retries)
    std::shared_ptr<RetryPolicy> retry_policy;

    /// Custom backoff (nullptr = ExponentialBackoff defaults)
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    /// tools/list pages followed before giving up on nextCursor
    std::size_t max_pages{16};

    /// Probe REST listings (GET <url>/tools, /api/tools, ...) when the MCP
    /// endpoint answers initialize with 404 or 405
    bool rest_fallback{true};

    HttpDiscoveryConfig& with_max_retries(std::size_t retries) {
        max_retries = retries;
        return *this;
    }

    HttpDiscoveryConfig& with_verify_ssl(bool verify) {
        verify_ssl = verify;
        return *this;
    }

    HttpDiscoveryConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
        backoff_policy = std::move(policy);
        return *this;
    }

    HttpDiscoveryConfig& with_retry_policy(std::shared_ptr<RetryPolicy> policy) {
        retry_policy = std::move(policy);
        return *this;
    }

    HttpDiscoveryConfig& with_rest_fallback(bool enable) {
        rest_fallback = enable;
        return *this;
    }
};

/// Produces one fresh client per discovered server
using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

// ═══════════════════════════════════════════════════════════════════════════
// HttpDiscoveryStrategy
// ═══════════════════════════════════════════════════════════════════════════
// initialize -> notifications/initialized -> tools/list (paginated) over
// streamable HTTP. Each POST is bounded by the time left on the deadline and
// retried on connection failures, timeouts and 5xx. 4xx is final.

class HttpDiscoveryStrategy final : public IDiscoveryStrategy {
public:
    explicit HttpDiscoveryStrategy(
        HttpDiscoveryConfig config = {},
        HttpClientFactory client_factory = make_http_client
    );

    [[nodiscard]] DiscoveryResult discover(
        const ServerDescriptor& descriptor,
        const Deadline& deadline
    ) override;

private:
    HttpDiscoveryConfig config_;
    HttpClientFactory client_factory_;
    std::shared_ptr<RetryPolicy> retry_policy_;
    std::shared_ptr<IBackoffPolicy> backoff_policy_;
};

}  // namespace mcpenum
