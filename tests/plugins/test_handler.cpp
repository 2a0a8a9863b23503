// Handler library used by the loader tests. Behaviour is selected by a
// "mode" member in the payload:
//   (none)    -> {"echo": <payload>, "input_key": ..., "last_execution_at_ms": ...}
//   "throw"   -> throws std::runtime_error
//   "fail"    -> reports failure through output->fail
//   "status"  -> returns a non-zero status without a message
//   "list"    -> writes a JSON array
//   "silent"  -> writes nothing
//   "garbage" -> writes text that is not JSON
//   "double"  -> writes two JSON objects back to back

#include "plugin/plugin_interface.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

bool has_mode(std::string_view payload, std::string_view mode) {
    return payload.find(std::format("\"mode\":\"{}\"", mode)) != std::string_view::npos;
}

void emit(FnrtOutput* output, const std::string& text) {
    output->write(output->sink, text.data(), text.size());
}

} // anonymous namespace

extern "C" {

uint32_t fnrt_handler_api_version() {
    return FNRT_HANDLER_API_VERSION;
}

int handler(const char* payload, size_t payload_len, FnrtContext* context, FnrtOutput* output) {
    const std::string_view body(payload, payload_len);

    if (has_mode(body, "throw")) {
        throw std::runtime_error("test handler asked to throw");
    }
    if (has_mode(body, "fail")) {
        output->fail(output->sink, "test handler asked to fail");
        return FNRT_HANDLER_FAILED;
    }
    if (has_mode(body, "status")) {
        return 42;
    }
    if (has_mode(body, "list")) {
        emit(output, "[1,2,3]");
        return FNRT_HANDLER_OK;
    }
    if (has_mode(body, "silent")) {
        return FNRT_HANDLER_OK;
    }
    if (has_mode(body, "double")) {
        emit(output, "{}{}");
        return FNRT_HANDLER_OK;
    }
    if (has_mode(body, "garbage")) {
        emit(output, "definitely not json");
        return FNRT_HANDLER_OK;
    }

    emit(output, std::format(
        R"({{"echo":{},"input_key":"{}","output_key":"{}","store_port":{},"last_execution_at_ms":{},"handler_modified_at_ms":{},"environment":{}}})",
        body, context->input_key, context->output_key, context->store_port,
        context->last_execution_at_ms, context->handler_modified_at_ms,
        context->environment_json));
    return FNRT_HANDLER_OK;
}

} // extern "C"
