#pragma once

#include <optional>
#include <string>

namespace fnrt {

/**
 * @brief Failure classes of the runtime
 *
 * STARTUP_ERROR is fatal (process exits non-zero). Every other category
 * aborts the current poll cycle only.
 */
enum class ErrorCategory {
    NONE,
    STARTUP_ERROR,
    STORE_ERROR,
    DECODE_ERROR,
    HANDLER_ERROR,
    RESULT_SHAPE_ERROR,
    PUBLISH_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:               return "none";
        case ErrorCategory::STARTUP_ERROR:      return "startup";
        case ErrorCategory::STORE_ERROR:        return "store";
        case ErrorCategory::DECODE_ERROR:       return "decode";
        case ErrorCategory::HANDLER_ERROR:      return "handler";
        case ErrorCategory::RESULT_SHAPE_ERROR: return "result_shape";
        case ErrorCategory::PUBLISH_ERROR:      return "publish";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace fnrt
