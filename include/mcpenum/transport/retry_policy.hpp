#ifndef MCPENUM_TRANSPORT_RETRY_POLICY_HPP
#define MCPENUM_TRANSPORT_RETRY_POLICY_HPP

#include "mcpenum/transport/http_client.hpp"

#include <cstddef>
#include <set>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *which* failed HTTP exchanges are retried; IBackoffPolicy decides
// how long to wait in between.
//
// Default behavior:
// - Retry on: connection failures, timeouts, any 5xx status
// - Never retry: SSL errors, invalid requests, 4xx statuses
//
// 4xx is always permanent, even if added with with_retryable_status(): a
// rejected token or a wrong path will not fix itself within one request.
//
//   RetryPolicy policy;
//   policy.with_max_attempts(3).with_retry_on_timeout(false);

class RetryPolicy {
public:
    RetryPolicy()
        : max_attempts_(2)
        , retry_on_connection_error_(true)
        , retry_on_timeout_(true)
        , retry_on_server_error_(true)
    {}

    /// Retries after the initial request (0 disables retrying)
    RetryPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    RetryPolicy& with_retry_on_connection_error(bool enable) {
        retry_on_connection_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    /// Toggle the blanket 5xx rule; explicit statuses still apply
    RetryPolicy& with_retry_on_server_error(bool enable) {
        retry_on_server_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retryable_status(int status_code) {
        extra_retryable_statuses_.insert(status_code);
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_attempts_;
    }

    /// @param attempt 0 for the first retry after the initial failure
    [[nodiscard]] bool should_retry(HttpClientError::Code code, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts_);
        if (within_limit == false) {
            return false;
        }

        switch (code) {
            case HttpClientError::Code::ConnectionFailed:
                return retry_on_connection_error_;
            case HttpClientError::Code::Timeout:
                return retry_on_timeout_;
            case HttpClientError::Code::SslError:
            case HttpClientError::Code::InvalidRequest:
            case HttpClientError::Code::Unknown:
                return false;
        }
        return false;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts_);
        if (within_limit == false) {
            return false;
        }
        const bool client_error = (status_code >= 400) && (status_code < 500);
        if (client_error) {
            return false;
        }
        const bool server_error = (status_code >= 500) && (status_code < 600);
        if (server_error && retry_on_server_error_) {
            return true;
        }
        return extra_retryable_statuses_.contains(status_code);
    }

private:
    std::size_t max_attempts_;
    bool retry_on_connection_error_;
    bool retry_on_timeout_;
    bool retry_on_server_error_;
    std::set<int> extra_retryable_statuses_;
};

}  // namespace mcpenum

#endif  // MCPENUM_TRANSPORT_RETRY_POLICY_HPP
