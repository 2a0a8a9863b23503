#include "runtime/poll_loop.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <thread>

namespace fnrt {

const char* cycle_outcome_to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::UNCHANGED:      return "unchanged";
        case CycleOutcome::INPUT_MISSING:  return "input_missing";
        case CycleOutcome::STORE_ERROR:    return "store_error";
        case CycleOutcome::DECODE_FAILED:  return "decode_failed";
        case CycleOutcome::HANDLER_FAILED: return "handler_failed";
        case CycleOutcome::INVALID_RESULT: return "invalid_result";
        case CycleOutcome::PUBLISHED:      return "published";
        case CycleOutcome::PUBLISH_FAILED: return "publish_failed";
    }
    return "unknown";
}

ErrorCategory cycle_outcome_category(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::STORE_ERROR:    return ErrorCategory::STORE_ERROR;
        case CycleOutcome::DECODE_FAILED:  return ErrorCategory::DECODE_ERROR;
        case CycleOutcome::HANDLER_FAILED: return ErrorCategory::HANDLER_ERROR;
        case CycleOutcome::INVALID_RESULT: return ErrorCategory::RESULT_SHAPE_ERROR;
        case CycleOutcome::PUBLISH_FAILED: return ErrorCategory::PUBLISH_ERROR;
        case CycleOutcome::UNCHANGED:
        case CycleOutcome::INPUT_MISSING:
        case CycleOutcome::PUBLISHED:
            break;
    }
    return ErrorCategory::NONE;
}

namespace {

// Prefix a cycle failure message with its error category
std::string tagged(CycleOutcome outcome, const std::string& msg) {
    return std::format("[{}] {}", error_category_to_string(cycle_outcome_category(outcome)), msg);
}

} // anonymous namespace

PollLoop::PollLoop(IKeyValueStore& store,
                   IHandler& handler,
                   RuntimeContext context,
                   Config config,
                   SleepFn sleep)
    : store_(store),
      handler_(handler),
      context_(std::move(context)),
      config_(std::move(config)),
      retry_(config_.poll_interval, config_.retry),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

bool PollLoop::start() {
    auto connected = store_.connect();
    if (connected.is_error()) {
        utils::log::warn(std::format("Store {} unavailable at startup: {}; will retry every cycle",
            store_.endpoint(), connected.error_message()));
        return false;
    }
    utils::log::info(std::format("Connected to store {}", store_.endpoint()));
    return true;
}

std::string PollLoop::describe() const {
    return std::format("handler={}, {}, policy={}",
        handler_.name(), context_.describe(), change_policy_to_string(config_.change_policy));
}

std::chrono::milliseconds PollLoop::next_delay() const {
    if (consecutive_store_failures_ > 0) {
        return retry_.delay_after(consecutive_store_failures_);
    }
    return config_.poll_interval;
}

bool PollLoop::run() {
    (void)start();

    utils::log::info(std::format("Runtime started: {}", describe()));

    while (true) {
        const CycleOutcome outcome = run_cycle();

        if (outcome == CycleOutcome::STORE_ERROR && retry_.exhausted(consecutive_store_failures_)) {
            utils::log::error(std::format("Giving up after {} consecutive store failures",
                consecutive_store_failures_));
            return false;
        }

        sleep_(next_delay());
    }
}

// ============================================================================
// Cycle
// ============================================================================

CycleOutcome PollLoop::run_cycle() {
    ++stats_.cycles;

    // POLL
    auto read = store_.get(context_.input_key());
    if (read.is_error()) {
        ++consecutive_store_failures_;
        ++stats_.store_errors;
        const std::string attempt = retry_.unbounded()
            ? std::to_string(consecutive_store_failures_)
            : std::format("{}/{}", consecutive_store_failures_, retry_.max_failures());
        utils::log::error(tagged(CycleOutcome::STORE_ERROR,
            std::format("Failed to read '{}' from store: {}; retrying in {}ms (attempt {})",
                context_.input_key(), read.error_message(), next_delay().count(), attempt)));
        return CycleOutcome::STORE_ERROR;
    }
    consecutive_store_failures_ = 0;

    // Change detection: exact equality, absent == absent
    const std::optional<std::string>& raw = read.value();
    if (raw == last_observed_) {
        return CycleOutcome::UNCHANGED;
    }

    if (!raw) {
        last_observed_.reset();
        utils::log::info(std::format("Input key '{}' is absent; nothing to process",
            context_.input_key()));
        return CycleOutcome::INPUT_MISSING;
    }

    if (config_.change_policy == ChangePolicy::ADVANCE_ON_READ) {
        last_observed_ = raw;
    }

    const CycleOutcome outcome = process(*raw);
    if (outcome == CycleOutcome::PUBLISHED &&
        config_.change_policy == ChangePolicy::RETRY_ON_FAILURE) {
        last_observed_ = raw;
    }
    return outcome;
}

CycleOutcome PollLoop::process(const std::string& raw) {
    // DECODE
    JsonValue payload;
    try {
        payload = JsonValue::parse(raw);
    } catch (const JsonValue::parse_error& e) {
        ++stats_.decode_errors;
        utils::log::warn(tagged(CycleOutcome::DECODE_FAILED,
            std::format("Failed to parse JSON input from key '{}': {} (value: {})",
                context_.input_key(), e.what(), utils::truncate_for_log(raw))));
        return CycleOutcome::DECODE_FAILED;
    }
    if (!payload.is_object()) {
        ++stats_.decode_errors;
        utils::log::warn(tagged(CycleOutcome::DECODE_FAILED,
            std::format("Input on key '{}' is a JSON {}, expected an object",
                context_.input_key(), payload.type_name())));
        return CycleOutcome::DECODE_FAILED;
    }

    // EXECUTE
    ++stats_.invocations;
    utils::Timer timer;
    HandlerResult result;
    try {
        result = handler_.invoke(payload, raw, context_);
    } catch (const std::exception& e) {
        result = HandlerResult::failed(std::format("uncaught exception: {}", e.what()));
    } catch (...) {
        result = HandlerResult::failed("uncaught exception of non-standard type");
    }
    const auto elapsed = timer.elapsed_ms();

    if (!result.is_ok()) {
        ++stats_.handler_errors;
        utils::log::error(tagged(CycleOutcome::HANDLER_FAILED,
            std::format("Exception inside user handler '{}' after {}ms: {}",
                handler_.name(), elapsed.count(), result.error_message)));
        return CycleOutcome::HANDLER_FAILED;
    }

    if (!result.value.is_object()) {
        ++stats_.result_shape_errors;
        utils::log::warn(tagged(CycleOutcome::INVALID_RESULT,
            std::format("Handler return is a JSON {}, not an object; skipping write",
                result.value.type_name())));
        return CycleOutcome::INVALID_RESULT;
    }

    // PUBLISH
    if (!publish(result)) {
        ++stats_.publish_errors;
        return CycleOutcome::PUBLISH_FAILED;
    }

    ++stats_.published;
    utils::log::info(std::format("Processed input and wrote output to key '{}' (handler {}ms)",
        context_.output_key(), elapsed.count()));
    return CycleOutcome::PUBLISHED;
}

bool PollLoop::publish(const HandlerResult& result) {
    // Bytes written by the handler go out exactly as written
    std::string encoded = result.encoded;
    if (encoded.empty()) {
        try {
            encoded = result.value.dump();
        } catch (const JsonValue::serialize_error& e) {
            utils::log::error(tagged(CycleOutcome::PUBLISH_FAILED,
                std::format("Failed to encode handler output: {}", e.what())));
            return false;
        }
    }

    auto written = store_.set(context_.output_key(), encoded);
    if (written.is_error()) {
        utils::log::error(tagged(CycleOutcome::PUBLISH_FAILED,
            std::format("Failed to write handler output to key '{}': {}",
                context_.output_key(), written.error_message())));
        return false;
    }

    context_.mark_executed(utils::now());
    return true;
}

} // namespace fnrt
