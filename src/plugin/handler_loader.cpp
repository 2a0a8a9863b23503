#include "plugin/handler_loader.hpp"
#include "runtime/runtime_context.hpp"
#include "core/utils.hpp"

#include <dlfcn.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <optional>

namespace fnrt {

// ============================================================================
// LoadedLibrary
// ============================================================================

LoadedLibrary::LoadedLibrary(std::string path, void* handle)
    : path_(std::move(path)), handle_(handle) {}

LoadedLibrary::~LoadedLibrary() {
    if (handle_) {
        dlclose(handle_);
    }
}

LoadedLibrary::LoadedLibrary(LoadedLibrary&& other) noexcept
    : path_(std::move(other.path_)), handle_(other.handle_) {
    other.handle_ = nullptr;
}

LoadedLibrary& LoadedLibrary::operator=(LoadedLibrary&& other) noexcept {
    if (this != &other) {
        if (handle_) dlclose(handle_);
        path_ = std::move(other.path_);
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

void* LoadedLibrary::resolve(const char* symbol) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, symbol);
}

// ============================================================================
// AbiHandler
// ============================================================================

namespace {

struct OutputCapture {
    std::string data;
    std::optional<std::string> failure;

    static void write(void* sink, const char* bytes, size_t len) {
        if (!sink || !bytes) return;
        static_cast<OutputCapture*>(sink)->data.append(bytes, len);
    }

    static void fail(void* sink, const char* message) {
        if (!sink) return;
        static_cast<OutputCapture*>(sink)->failure =
            message ? std::string(message) : std::string("(no message)");
    }
};

} // anonymous namespace

AbiHandler::AbiHandler(std::string name, FnrtHandlerFn fn,
                       std::unique_ptr<LoadedLibrary> library)
    : name_(std::move(name)), fn_(fn), library_(std::move(library)) {}

HandlerResult AbiHandler::invoke(const JsonValue&, std::string_view raw_payload,
                                 RuntimeContext& context) {
    if (!fn_) {
        return HandlerResult::failed("handler entry point is null");
    }

    std::string environment_text;
    try {
        environment_text = context.environment().dump();
    } catch (const JsonValue::serialize_error& e) {
        return HandlerResult::failed(std::format("cannot marshal handler arguments: {}", e.what()));
    }

    const auto last = context.last_execution_at();
    FnrtContext view{
        context.store_host().c_str(),
        static_cast<int32_t>(context.store_port()),
        context.input_key().c_str(),
        context.output_key().c_str(),
        utils::to_epoch_ms(context.handler_modified_at()),
        last ? utils::to_epoch_ms(*last) : 0,
        environment_text.c_str(),
    };

    OutputCapture capture;
    FnrtOutput output{&capture, &OutputCapture::write, &OutputCapture::fail};

    int rc = FNRT_HANDLER_FAILED;
    // Handlers receive the stored bytes verbatim
    try {
        rc = fn_(raw_payload.data(), raw_payload.size(), &view, &output);
    } catch (const std::exception& e) {
        return HandlerResult::failed(std::format("uncaught exception: {}", e.what()));
    } catch (...) {
        return HandlerResult::failed("uncaught exception of non-standard type");
    }

    if (capture.failure) {
        return HandlerResult::failed(std::format("handler failed (status {}): {}", rc, *capture.failure));
    }
    if (rc != FNRT_HANDLER_OK) {
        return HandlerResult::failed(std::format("handler returned status {}", rc));
    }
    if (capture.data.empty()) {
        return HandlerResult::ok(JsonValue{});
    }

    try {
        auto value = JsonValue::parse(capture.data);
        return HandlerResult::ok(std::move(value), std::move(capture.data));
    } catch (const JsonValue::parse_error& e) {
        return HandlerResult::failed(std::format("handler produced invalid JSON ({}): {}",
            e.what(), utils::truncate_for_log(capture.data)));
    }
}

// ============================================================================
// HandlerLoader
// ============================================================================

HandlerLoader::LoadResult HandlerLoader::load(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return LoadResult::error(std::format("Handler library not found at {}: {}",
            path, std::strerror(errno)));
    }
    if (!S_ISREG(st.st_mode)) {
        return LoadResult::error(std::format("Handler path {} is not a regular file", path));
    }

    const auto modified_at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) +
            std::chrono::nanoseconds(st.st_mtim.tv_nsec)));

    // dlopen the shared library (runs its static initializers)
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        return LoadResult::error(std::format("Failed to load handler library [{}]: {}",
            path, err ? err : "unknown error"));
    }

    auto library = std::make_unique<LoadedLibrary>(path, handle);

    const auto version_fn = reinterpret_cast<FnrtApiVersionFn>(
        library->resolve(plugin_symbols::API_VERSION));
    if (!version_fn) {
        return LoadResult::error(std::format("Handler [{}]: missing {} symbol",
            path, plugin_symbols::API_VERSION));
    }

    const uint32_t api_version = version_fn();
    if (api_version != FNRT_HANDLER_API_VERSION) {
        return LoadResult::error(std::format("Handler [{}]: API version mismatch (got {}, expected {})",
            path, api_version, FNRT_HANDLER_API_VERSION));
    }

    const auto fn = reinterpret_cast<FnrtHandlerFn>(library->resolve(plugin_symbols::HANDLER));
    if (!fn) {
        return LoadResult::error(std::format("Handler [{}]: library must export a '{}' function",
            path, plugin_symbols::HANDLER));
    }

    utils::log::info(std::format("Handler loaded: {} (api v{}, modified {})",
        path, api_version, utils::format_timestamp(modified_at)));

    return LoadResult::ok(std::make_unique<AbiHandler>(path, fn, std::move(library)), modified_at);
}

} // namespace fnrt
