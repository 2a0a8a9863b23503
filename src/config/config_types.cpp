#include "config/config_types.hpp"
#include "core/utils.hpp"

namespace fnrt {

const char* change_policy_to_string(ChangePolicy policy) {
    switch (policy) {
        case ChangePolicy::ADVANCE_ON_READ:  return "advance-on-read";
        case ChangePolicy::RETRY_ON_FAILURE: return "retry-on-failure";
    }
    return "unknown";
}

std::optional<ChangePolicy> parse_change_policy(const std::string& name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "advance-on-read" || lower == "advance_on_read") return ChangePolicy::ADVANCE_ON_READ;
    if (lower == "retry-on-failure" || lower == "retry_on_failure") return ChangePolicy::RETRY_ON_FAILURE;
    return std::nullopt;
}

const char* backoff_strategy_to_string(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::FIXED:       return "fixed";
        case BackoffStrategy::EXPONENTIAL: return "exponential";
    }
    return "unknown";
}

std::optional<BackoffStrategy> parse_backoff_strategy(const std::string& name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "fixed") return BackoffStrategy::FIXED;
    if (lower == "exponential") return BackoffStrategy::EXPONENTIAL;
    return std::nullopt;
}

} // namespace fnrt
