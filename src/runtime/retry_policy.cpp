#include "runtime/retry_policy.hpp"

#include <algorithm>

namespace fnrt {

RetryPolicy::RetryPolicy(std::chrono::milliseconds base_interval, const RetryConfig& config)
    : base_(base_interval),
      max_backoff_(std::max(config.max_backoff, base_interval)),
      max_failures_(config.max_consecutive_failures),
      strategy_(config.backoff) {}

std::chrono::milliseconds RetryPolicy::delay_after(uint32_t consecutive_failures) const {
    if (strategy_ == BackoffStrategy::FIXED || consecutive_failures <= 1) {
        return base_;
    }

    // Doubling past 2^32 always exceeds any cap we accept
    const uint32_t shift = consecutive_failures - 1;
    if (shift >= 32) return max_backoff_;

    const auto base_ms = static_cast<uint64_t>(base_.count());
    const uint64_t factor = uint64_t{1} << shift;
    const auto cap_ms = static_cast<uint64_t>(max_backoff_.count());
    if (base_ms != 0 && factor > cap_ms / base_ms) return max_backoff_;
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(base_ms * factor, cap_ms)));
}

bool RetryPolicy::exhausted(uint32_t consecutive_failures) const {
    return max_failures_ != 0 && consecutive_failures >= max_failures_;
}

} // namespace fnrt
