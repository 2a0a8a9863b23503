#pragma once

#include "core/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fnrt {

class PollLoop;

/**
 * @brief Runtime metadata handed to the user handler on every invocation
 *
 * Built once at startup from the resolved configuration and the handler
 * file's modification time. The only mutable field is the time of the last
 * successful publish, written by PollLoop alone.
 *
 * The handler modification time is captured for introspection only; it is
 * never compared against the live file (no hot reload).
 */
class RuntimeContext {
public:
    using time_point = std::chrono::system_clock::time_point;

    RuntimeContext(std::string store_host,
                   uint16_t store_port,
                   std::string input_key,
                   std::string output_key,
                   time_point handler_modified_at);

    [[nodiscard]] const std::string& store_host() const { return store_host_; }
    [[nodiscard]] uint16_t store_port() const { return store_port_; }
    [[nodiscard]] const std::string& input_key() const { return input_key_; }
    [[nodiscard]] const std::string& output_key() const { return output_key_; }
    [[nodiscard]] time_point handler_modified_at() const { return handler_modified_at_; }
    [[nodiscard]] std::optional<time_point> last_execution_at() const { return last_execution_at_; }

    // Free-form map reserved for extension; exposed to handlers as JSON text
    [[nodiscard]] const JsonValue& environment() const { return environment_; }
    [[nodiscard]] JsonValue& environment() { return environment_; }

    // One-line description for logs
    [[nodiscard]] std::string describe() const;

private:
    friend class PollLoop;

    void mark_executed(time_point at) { last_execution_at_ = at; }

    std::string store_host_;
    uint16_t store_port_;
    std::string input_key_;
    std::string output_key_;
    time_point handler_modified_at_;
    std::optional<time_point> last_execution_at_;
    JsonValue environment_ = JsonValue::object();
};

} // namespace fnrt
