#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fnrt {

// ============================================================================
// Policy enums
// ============================================================================

/**
 * @brief When the change marker (last observed input value) advances
 *
 * ADVANCE_ON_READ:  as soon as a different value is read, so an input whose
 *                   decode/execute/publish failed is not retried until the
 *                   value changes again.
 * RETRY_ON_FAILURE: only after a successful publish, so a failed input is
 *                   processed again on the next cycle.
 */
enum class ChangePolicy {
    ADVANCE_ON_READ,
    RETRY_ON_FAILURE
};

enum class BackoffStrategy {
    FIXED,
    EXPONENTIAL
};

[[nodiscard]] const char* change_policy_to_string(ChangePolicy policy);
[[nodiscard]] std::optional<ChangePolicy> parse_change_policy(const std::string& name);

[[nodiscard]] const char* backoff_strategy_to_string(BackoffStrategy strategy);
[[nodiscard]] std::optional<BackoffStrategy> parse_backoff_strategy(const std::string& name);

// ============================================================================
// Sections
// ============================================================================

struct StoreConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    uint32_t db = 0;
    std::string password;
    std::chrono::milliseconds io_timeout{5000};
};

struct PollConfig {
    std::string input_key = "metrics";
    std::string output_key;                       // required
    std::string handler_path = "/opt/usermodule.so";
    std::chrono::milliseconds poll_interval{5000};
    ChangePolicy change_policy = ChangePolicy::ADVANCE_ON_READ;
};

struct RetryConfig {
    uint32_t max_consecutive_failures = 0;        // 0 = retry forever
    BackoffStrategy backoff = BackoffStrategy::FIXED;
    std::chrono::milliseconds max_backoff{60000};
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// RuntimeConfig - Complete resolved configuration
// ============================================================================

struct RuntimeConfig {
    StoreConfig store;
    PollConfig poll;
    RetryConfig retry;
    LoggingConfig logging;
};

} // namespace fnrt
