// ─────────────────────────────────────────────────────────────────────────────
// Deadline and CancellationToken Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpenum/deadline.hpp"

#include <thread>

using namespace mcpenum;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken copies share state", "[deadline]") {
    CancellationToken token;
    const CancellationToken copy = token;
    CHECK(copy.is_cancelled() == false);

    token.cancel();
    CHECK(copy.is_cancelled());
}

TEST_CASE("Deadline remaining and expiry", "[deadline]") {
    const auto deadline = Deadline::after(10s);
    CHECK(deadline.expired() == false);
    CHECK(deadline.remaining() > 9s);
    CHECK(deadline.remaining() <= 10s);

    const auto past = Deadline(Clock::now() - 1s, CancellationToken{});
    CHECK(past.expired());
    CHECK(past.remaining() == 0ms);
}

TEST_CASE("Deadline expires after its budget", "[deadline]") {
    const auto deadline = Deadline::after(20ms);
    std::this_thread::sleep_for(30ms);
    CHECK(deadline.expired());
}

TEST_CASE("Deadline capped_at keeps the earlier instant and the token", "[deadline]") {
    CancellationToken token;
    const auto outer = Deadline::after(1s, token);
    const auto inner = Deadline::after(10s, token);

    const auto capped = inner.capped_at(outer.expires_at());
    CHECK(capped.expires_at() == outer.expires_at());

    const auto uncapped = outer.capped_at(inner.expires_at());
    CHECK(uncapped.expires_at() == outer.expires_at());

    token.cancel();
    CHECK(capped.cancelled());
}
