#pragma once

#include <cstddef>
#include <cstdint>

// C ABI for user handler libraries loaded via dlopen/dlsym.
// A handler library exports two symbols:
//
//   uint32_t fnrt_handler_api_version();   // must return FNRT_HANDLER_API_VERSION
//   int handler(const char* payload, size_t payload_len,
//               FnrtContext* context, FnrtOutput* output);
//
// `payload` is the input JSON object text. The handler writes its result
// (a JSON object) through `output->write` and returns FNRT_HANDLER_OK.

extern "C" {

constexpr uint32_t FNRT_HANDLER_API_VERSION = 1;

constexpr int FNRT_HANDLER_OK = 0;
constexpr int FNRT_HANDLER_FAILED = 1;

// Runtime metadata visible to the handler (valid for the duration of a call)
struct FnrtContext {
    const char* store_host;
    int32_t store_port;
    const char* input_key;
    const char* output_key;
    int64_t handler_modified_at_ms;   // ms since epoch
    int64_t last_execution_at_ms;     // ms since epoch, 0 = never executed
    const char* environment_json;     // JSON object text
};

// Result sink owned by the runtime
struct FnrtOutput {
    void* sink;
    void (*write)(void* sink, const char* data, size_t len);
    void (*fail)(void* sink, const char* message);
};

using FnrtHandlerFn = int (*)(const char* payload, size_t payload_len,
                              FnrtContext* context, FnrtOutput* output);
using FnrtApiVersionFn = uint32_t (*)();

} // extern "C"

namespace fnrt::plugin_symbols {

constexpr const char* HANDLER = "handler";
constexpr const char* API_VERSION = "fnrt_handler_api_version";

} // namespace fnrt::plugin_symbols
