#include <catch2/catch_test_macros.hpp>
#include "runtime/retry_policy.hpp"

#include <cstdint>

using namespace fnrt;
using namespace std::chrono_literals;

namespace {

RetryConfig retry(uint32_t max, BackoffStrategy strategy, std::chrono::milliseconds cap = 60000ms) {
    RetryConfig cfg;
    cfg.max_consecutive_failures = max;
    cfg.backoff = strategy;
    cfg.max_backoff = cap;
    return cfg;
}

} // anonymous namespace

TEST_CASE("RetryPolicy: fixed backoff always waits the interval", "[retry]") {
    RetryPolicy policy(5000ms, retry(0, BackoffStrategy::FIXED));
    CHECK(policy.delay_after(1) == 5000ms);
    CHECK(policy.delay_after(10) == 5000ms);
    CHECK(policy.delay_after(1000) == 5000ms);
}

TEST_CASE("RetryPolicy: exponential backoff doubles up to the cap", "[retry]") {
    RetryPolicy policy(1000ms, retry(0, BackoffStrategy::EXPONENTIAL, 10000ms));
    CHECK(policy.delay_after(0) == 1000ms);
    CHECK(policy.delay_after(1) == 1000ms);
    CHECK(policy.delay_after(2) == 2000ms);
    CHECK(policy.delay_after(3) == 4000ms);
    CHECK(policy.delay_after(4) == 8000ms);
    CHECK(policy.delay_after(5) == 10000ms);
    CHECK(policy.delay_after(64) == 10000ms);
    CHECK(policy.delay_after(UINT32_MAX) == 10000ms);
}

TEST_CASE("RetryPolicy: cap never drops below the interval", "[retry]") {
    RetryPolicy policy(5000ms, retry(0, BackoffStrategy::EXPONENTIAL, 100ms));
    CHECK(policy.delay_after(1) == 5000ms);
    CHECK(policy.delay_after(3) == 5000ms);
}

TEST_CASE("RetryPolicy: zero failures allowed means unbounded", "[retry]") {
    RetryPolicy policy(5000ms, retry(0, BackoffStrategy::FIXED));
    CHECK(policy.unbounded());
    CHECK_FALSE(policy.exhausted(1));
    CHECK_FALSE(policy.exhausted(UINT32_MAX));
}

TEST_CASE("RetryPolicy: bounded budget", "[retry]") {
    RetryPolicy policy(5000ms, retry(3, BackoffStrategy::FIXED));
    CHECK_FALSE(policy.unbounded());
    CHECK(policy.max_failures() == 3);
    CHECK_FALSE(policy.exhausted(2));
    CHECK(policy.exhausted(3));
    CHECK(policy.exhausted(4));
    CHECK(policy.strategy() == BackoffStrategy::FIXED);
}
