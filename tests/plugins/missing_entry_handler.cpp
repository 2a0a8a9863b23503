// Exports the API version but no `handler` entry point.

#include "plugin/plugin_interface.hpp"

extern "C" {

uint32_t fnrt_handler_api_version() {
    return FNRT_HANDLER_API_VERSION;
}

int process(const char*, size_t, FnrtContext*, FnrtOutput*) {
    return FNRT_HANDLER_OK;
}

} // extern "C"
