#pragma once

#include "plugin/handler.hpp"
#include "plugin/plugin_interface.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace fnrt {

// RAII wrapper for a loaded shared library
class LoadedLibrary {
public:
    LoadedLibrary(std::string path, void* handle);
    ~LoadedLibrary();

    // Non-copyable, movable
    LoadedLibrary(const LoadedLibrary&) = delete;
    LoadedLibrary& operator=(const LoadedLibrary&) = delete;
    LoadedLibrary(LoadedLibrary&& other) noexcept;
    LoadedLibrary& operator=(LoadedLibrary&& other) noexcept;

    [[nodiscard]] const std::string& path() const { return path_; }

    // Resolve symbol from the shared library
    [[nodiscard]] void* resolve(const char* symbol) const;

private:
    std::string path_;
    void* handle_;
};

/**
 * @brief Adapts a C ABI `handler` entry point to IHandler
 *
 * Passes the raw payload bytes and a FnrtContext view across the boundary and
 * turns the handler's status, output bytes and any escaping C++ exception
 * into a HandlerResult. Keeps the owning library (if any) loaded.
 */
class AbiHandler : public IHandler {
public:
    AbiHandler(std::string name, FnrtHandlerFn fn,
               std::unique_ptr<LoadedLibrary> library = nullptr);

    [[nodiscard]] HandlerResult invoke(const JsonValue& payload,
                                       std::string_view raw_payload,
                                       RuntimeContext& context) override;

    [[nodiscard]] const std::string& name() const override { return name_; }

private:
    std::string name_;
    FnrtHandlerFn fn_;
    std::unique_ptr<LoadedLibrary> library_;
};

/**
 * @brief Startup-only loader for the user handler library
 *
 * No hot reload: the library is opened once and kept for the process
 * lifetime. Loading runs the library's static initializers.
 */
class HandlerLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::unique_ptr<AbiHandler> handler;
        std::chrono::system_clock::time_point modified_at{};

        static LoadResult ok(std::unique_ptr<AbiHandler> h,
                             std::chrono::system_clock::time_point mtime) {
            LoadResult result;
            result.success = true;
            result.handler = std::move(h);
            result.modified_at = mtime;
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Open the library at path and validate its exported entry points
     *
     * Fails if the file is absent, dlopen fails, `handler` is not exported,
     * or `fnrt_handler_api_version` is missing or reports another version.
     */
    [[nodiscard]] static LoadResult load(const std::string& path);
};

} // namespace fnrt
