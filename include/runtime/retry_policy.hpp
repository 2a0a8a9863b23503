#pragma once

#include "config/config_types.hpp"

#include <chrono>
#include <cstdint>

namespace fnrt {

/**
 * @brief Pacing for consecutive transient store failures
 *
 * FIXED:       every retry waits the poll interval.
 * EXPONENTIAL: interval * 2^(n-1) after the n-th consecutive failure,
 *              capped at max_backoff.
 * A max_consecutive_failures of 0 never gives up.
 */
class RetryPolicy {
public:
    RetryPolicy(std::chrono::milliseconds base_interval, const RetryConfig& config);

    [[nodiscard]] std::chrono::milliseconds delay_after(uint32_t consecutive_failures) const;

    [[nodiscard]] bool exhausted(uint32_t consecutive_failures) const;

    [[nodiscard]] bool unbounded() const { return max_failures_ == 0; }
    [[nodiscard]] uint32_t max_failures() const { return max_failures_; }
    [[nodiscard]] BackoffStrategy strategy() const { return strategy_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_backoff_;
    uint32_t max_failures_;
    BackoffStrategy strategy_;
};

} // namespace fnrt
