#pragma once

#include "core/json.hpp"

#include <string>
#include <string_view>

namespace fnrt {

class RuntimeContext;

/**
 * @brief Outcome of one handler invocation
 *
 * FAILED carries the handler's diagnostic. OK carries whatever the handler
 * produced; a null value means it produced nothing. Whether the value is an
 * object is checked by the caller.
 *
 * `encoded` holds the exact bytes a handler wrote, which are published
 * unchanged. It is empty for results built in-process.
 */
struct HandlerResult {
    enum class Status { OK, FAILED };

    Status status = Status::OK;
    JsonValue value;
    std::string encoded;
    std::string error_message;

    static HandlerResult ok(JsonValue v, std::string encoded = {}) {
        HandlerResult r;
        r.value = std::move(v);
        r.encoded = std::move(encoded);
        return r;
    }

    static HandlerResult failed(std::string message) {
        HandlerResult r;
        r.status = Status::FAILED;
        r.error_message = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return status == Status::OK; }
};

/**
 * @brief User-supplied logic invoked once per detected input change
 */
class IHandler {
public:
    virtual ~IHandler() = default;

    /**
     * @param payload     decoded input object
     * @param raw_payload the bytes read from the input key that decode to payload
     */
    [[nodiscard]] virtual HandlerResult invoke(const JsonValue& payload,
                                               std::string_view raw_payload,
                                               RuntimeContext& context) = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace fnrt
