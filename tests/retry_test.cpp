// ─────────────────────────────────────────────────────────────────────────────
// Retry and backoff policy tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpenum/transport/backoff_policy.hpp"
#include "mcpenum/transport/retry_policy.hpp"

using namespace mcpenum;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    CHECK(policy.max_attempts() == 2);
    CHECK(policy.should_retry(HttpClientError::Code::ConnectionFailed, 0));
    CHECK(policy.should_retry(HttpClientError::Code::Timeout, 0));
    CHECK(policy.should_retry(HttpClientError::Code::SslError, 0) == false);
    CHECK(policy.should_retry(HttpClientError::Code::InvalidRequest, 0) == false);
    CHECK(policy.should_retry(HttpClientError::Code::Unknown, 0) == false);
}

TEST_CASE("RetryPolicy respects max attempts", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_attempts(3);

    CHECK(policy.should_retry(HttpClientError::Code::ConnectionFailed, 2));
    CHECK(policy.should_retry(HttpClientError::Code::ConnectionFailed, 3) == false);
    CHECK(policy.should_retry_http_status(503, 2));
    CHECK(policy.should_retry_http_status(503, 3) == false);
}

TEST_CASE("RetryPolicy with zero attempts never retries", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_attempts(0);

    CHECK(policy.should_retry(HttpClientError::Code::ConnectionFailed, 0) == false);
    CHECK(policy.should_retry_http_status(500, 0) == false);
}

TEST_CASE("RetryPolicy HTTP status code handling", "[retry][policy]") {
    RetryPolicy policy;

    CHECK(policy.should_retry_http_status(500, 0));
    CHECK(policy.should_retry_http_status(502, 0));
    CHECK(policy.should_retry_http_status(503, 0));
    CHECK(policy.should_retry_http_status(504, 0));

    CHECK(policy.should_retry_http_status(400, 0) == false);
    CHECK(policy.should_retry_http_status(401, 0) == false);
    CHECK(policy.should_retry_http_status(404, 0) == false);
    CHECK(policy.should_retry_http_status(429, 0) == false);
}

TEST_CASE("RetryPolicy keeps 4xx permanent even when listed", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_retryable_status(429).with_retry_on_server_error(false);

    CHECK(policy.should_retry_http_status(429, 0) == false);
    CHECK(policy.should_retry_http_status(500, 0) == false);

    policy.with_retryable_status(503);
    CHECK(policy.should_retry_http_status(503, 0));
}

TEST_CASE("RetryPolicy builder toggles error classes", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_retry_on_connection_error(false).with_retry_on_timeout(false);

    CHECK(policy.should_retry(HttpClientError::Code::ConnectionFailed, 0) == false);
    CHECK(policy.should_retry(HttpClientError::Code::Timeout, 0) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff without jitter doubles up to the cap", "[retry][backoff]") {
    ExponentialBackoff backoff(100ms, 2.0, 500ms, 0.0);

    CHECK(backoff.next_delay(0) == 100ms);
    CHECK(backoff.next_delay(1) == 200ms);
    CHECK(backoff.next_delay(2) == 400ms);
    CHECK(backoff.next_delay(3) == 500ms);
    CHECK(backoff.next_delay(10) == 500ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff(1000ms, 2.0, 10'000ms, 0.25);

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(0);
        CHECK(delay >= 750ms);
        CHECK(delay <= 1250ms);
    }
}

TEST_CASE("NoBackoff always returns zero", "[retry][backoff]") {
    NoBackoff backoff;
    CHECK(backoff.next_delay(0) == 0ms);
    CHECK(backoff.next_delay(5) == 0ms);
}
