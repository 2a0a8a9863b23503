#pragma once

#include "plugin/handler.hpp"
#include "runtime/runtime_context.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fnrt::test {

// In-process handler (no dlopen needed for unit tests)
class MockHandler : public IHandler {
public:
    using Behavior = std::function<HandlerResult(const JsonValue& payload, RuntimeContext& context)>;

    struct Call {
        std::string payload_json;
        std::string raw_payload;
        std::string input_key;
        std::optional<std::chrono::system_clock::time_point> last_execution_at;
    };

    explicit MockHandler(Behavior behavior = {})
        : behavior_(std::move(behavior)) {}

    [[nodiscard]] HandlerResult invoke(const JsonValue& payload, std::string_view raw_payload,
                                       RuntimeContext& context) override {
        calls.push_back(Call{payload.dump(), std::string(raw_payload), context.input_key(),
                             context.last_execution_at()});
        if (behavior_) return behavior_(payload, context);
        return HandlerResult::ok(payload);
    }

    [[nodiscard]] const std::string& name() const override { return name_; }

    void set_behavior(Behavior behavior) { behavior_ = std::move(behavior); }

    // Returns the given object for every call
    static Behavior returning(JsonValue value) {
        return [value](const JsonValue&, RuntimeContext&) { return HandlerResult::ok(value); };
    }

    std::vector<Call> calls;

private:
    std::string name_ = "mock_handler";
    Behavior behavior_;
};

} // namespace fnrt::test
