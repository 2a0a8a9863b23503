#include "runtime/runtime_context.hpp"
#include "core/utils.hpp"

#include <format>

namespace fnrt {

RuntimeContext::RuntimeContext(std::string store_host,
                               uint16_t store_port,
                               std::string input_key,
                               std::string output_key,
                               time_point handler_modified_at)
    : store_host_(std::move(store_host)),
      store_port_(store_port),
      input_key_(std::move(input_key)),
      output_key_(std::move(output_key)),
      handler_modified_at_(handler_modified_at) {}

std::string RuntimeContext::describe() const {
    return std::format("host={}, port={}, input_key={}, output_key={}, handler_mtime={}, last_execution={}",
        store_host_, store_port_, input_key_, output_key_,
        utils::format_timestamp(handler_modified_at_),
        last_execution_at_ ? utils::format_timestamp(*last_execution_at_) : "never");
}

} // namespace fnrt
