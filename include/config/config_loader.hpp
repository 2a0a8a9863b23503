#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace fnrt {

// Environment variables read at startup
namespace env {

constexpr const char* REDIS_HOST = "REDIS_HOST";
constexpr const char* REDIS_PORT = "REDIS_PORT";
constexpr const char* REDIS_DB = "REDIS_DB";
constexpr const char* REDIS_PASSWORD = "REDIS_PASSWORD";
constexpr const char* REDIS_INPUT_KEY = "REDIS_INPUT_KEY";
constexpr const char* REDIS_OUTPUT_KEY = "REDIS_OUTPUT_KEY";
constexpr const char* STORE_TIMEOUT_MS = "FNRT_STORE_TIMEOUT_MS";
constexpr const char* HANDLER_PATH = "FNRT_HANDLER_PATH";
constexpr const char* POLL_INTERVAL_MS = "FNRT_POLL_INTERVAL_MS";
constexpr const char* CHANGE_POLICY = "FNRT_CHANGE_POLICY";
constexpr const char* STORE_MAX_RETRIES = "FNRT_STORE_MAX_RETRIES";
constexpr const char* STORE_BACKOFF = "FNRT_STORE_BACKOFF";
constexpr const char* STORE_MAX_BACKOFF_MS = "FNRT_STORE_MAX_BACKOFF_MS";
constexpr const char* LOG_LEVEL = "FNRT_LOG_LEVEL";

} // namespace env

// ============================================================================
// ConfigLoader - defaults, then optional TOML, then environment
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RuntimeConfig config;

        static LoadResult ok(RuntimeConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
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
     * @brief Resolve config from built-in defaults and environment variables
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Load TOML file, then apply environment overrides
     * @param config_path Path to runtime.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load TOML content, then apply environment overrides
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a resolved config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RuntimeConfig& config);
};

} // namespace fnrt
