#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "plugin/handler.hpp"
#include "runtime/retry_policy.hpp"
#include "runtime/runtime_context.hpp"
#include "store/ikv_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fnrt {

/**
 * @brief How one poll cycle concluded
 */
enum class CycleOutcome {
    UNCHANGED,        // raw value equal to the last observed one
    INPUT_MISSING,    // key changed to absent
    STORE_ERROR,      // GET failed
    DECODE_FAILED,    // not a JSON object
    HANDLER_FAILED,   // handler reported failure or threw
    INVALID_RESULT,   // handler returned something other than an object
    PUBLISHED,        // result written to the output key
    PUBLISH_FAILED    // encode or SET failed
};

[[nodiscard]] const char* cycle_outcome_to_string(CycleOutcome outcome);

// Failure class of an outcome; NONE for outcomes that are not failures
[[nodiscard]] ErrorCategory cycle_outcome_category(CycleOutcome outcome);

struct PollLoopStats {
    uint64_t cycles = 0;
    uint64_t invocations = 0;
    uint64_t published = 0;
    uint64_t store_errors = 0;
    uint64_t decode_errors = 0;
    uint64_t handler_errors = 0;
    uint64_t result_shape_errors = 0;
    uint64_t publish_errors = 0;
};

/**
 * @brief Single-threaded poll / detect / decode / execute / publish loop
 *
 * STARTUP -> POLL -> (UNCHANGED | DECODE) -> (SKIP | EXECUTE)
 *         -> (SKIP | PUBLISH) -> SLEEP -> POLL ...
 *
 * Every failure after startup is logged and ends the cycle; the loop then
 * sleeps and polls again. The handler call has no timeout. Sleep is not
 * interruptible; only process termination stops run() under the default
 * (unbounded) retry policy.
 *
 * Owns the RuntimeContext; the store and handler are borrowed and must
 * outlive the loop.
 */
class PollLoop {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    struct Config {
        std::chrono::milliseconds poll_interval{5000};
        ChangePolicy change_policy = ChangePolicy::ADVANCE_ON_READ;
        RetryConfig retry;
    };

    PollLoop(IKeyValueStore& store,
             IHandler& handler,
             RuntimeContext context,
             Config config,
             SleepFn sleep = {});

    /**
     * @brief Connect to the store once
     * @return false if the connection failed; cycles will keep retrying
     */
    bool start();

    /**
     * @brief Execute one cycle without sleeping
     */
    CycleOutcome run_cycle();

    /**
     * @brief start(), then cycle and sleep forever
     * @return false once consecutive store failures exhaust the retry policy
     */
    [[nodiscard]] bool run();

    // Handler, store keys and policy, as logged when run() starts
    [[nodiscard]] std::string describe() const;

    // Delay run() applies after the most recent cycle
    [[nodiscard]] std::chrono::milliseconds next_delay() const;

    [[nodiscard]] const RuntimeContext& context() const { return context_; }
    [[nodiscard]] const std::optional<std::string>& last_observed() const { return last_observed_; }
    [[nodiscard]] const PollLoopStats& stats() const { return stats_; }
    [[nodiscard]] uint32_t consecutive_store_failures() const { return consecutive_store_failures_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    CycleOutcome process(const std::string& raw);
    [[nodiscard]] bool publish(const HandlerResult& result);

    IKeyValueStore& store_;
    IHandler& handler_;
    RuntimeContext context_;
    Config config_;
    RetryPolicy retry_;
    SleepFn sleep_;

    std::optional<std::string> last_observed_;
    uint32_t consecutive_store_failures_ = 0;
    PollLoopStats stats_;
};

} // namespace fnrt
