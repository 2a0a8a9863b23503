#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace fnrt {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

using ErrorList = std::vector<std::string>;

std::optional<int64_t> toml_int(const toml::table& tbl, std::string_view key,
                                std::string_view qualified, ErrorList& errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto v = node.value<int64_t>(); v && node.is_integer()) return *v;
    errors.push_back(std::format("{} must be an integer", qualified));
    return std::nullopt;
}

std::optional<std::string> toml_string(const toml::table& tbl, std::string_view key,
                                       std::string_view qualified, ErrorList& errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto* s = node.as_string()) return std::string(s->get());
    errors.push_back(std::format("{} must be a string", qualified));
    return std::nullopt;
}

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

std::optional<int64_t> env_int(const char* name, ErrorList& errors) {
    const auto raw = env_value(name);
    if (!raw) return std::nullopt;
    const auto parsed = utils::try_parse_int<int64_t>(utils::trim(*raw));
    if (!parsed) {
        errors.push_back(std::format("Invalid {} value: {}", name, *raw));
        return std::nullopt;
    }
    return parsed;
}

// Store v into out when it lies in [lo, hi]; record an error otherwise
template<typename T>
void assign_checked(std::optional<int64_t> v, T& out, int64_t lo, int64_t hi,
                    std::string_view what, ErrorList& errors) {
    if (!v) return;
    if (*v < lo || *v > hi) {
        errors.push_back(std::format("{} must be {}-{}, got {}", what, lo, hi, *v));
        return;
    }
    out = static_cast<T>(*v);
}

void assign_checked_ms(std::optional<int64_t> v, std::chrono::milliseconds& out,
                       int64_t lo, int64_t hi, std::string_view what, ErrorList& errors) {
    int64_t ms = out.count();
    assign_checked(v, ms, lo, hi, what, errors);
    out = std::chrono::milliseconds(ms);
}

constexpr int64_t MAX_DURATION_MS = 24LL * 60 * 60 * 1000;
constexpr int64_t MAX_RETRIES = std::numeric_limits<uint32_t>::max();

// ---- Section extractors ----------------------------------------------------

void extract_store(const toml::table& root, StoreConfig& cfg, ErrorList& errors) {
    const auto* store = root["store"].as_table();
    if (!store) return;
    const auto& s = *store;

    if (auto v = toml_string(s, "host", "store.host", errors)) cfg.host = *v;
    assign_checked(toml_int(s, "port", "store.port", errors), cfg.port, 1, 65535, "store.port", errors);
    assign_checked(toml_int(s, "db", "store.db", errors), cfg.db, 0, 65535, "store.db", errors);
    if (auto v = toml_string(s, "password", "store.password", errors)) cfg.password = *v;
    assign_checked_ms(toml_int(s, "io_timeout_ms", "store.io_timeout_ms", errors),
        cfg.io_timeout, 1, MAX_DURATION_MS, "store.io_timeout_ms", errors);
}

void extract_poll(const toml::table& root, PollConfig& cfg, ErrorList& errors) {
    const auto* runtime = root["runtime"].as_table();
    if (!runtime) return;
    const auto& r = *runtime;

    if (auto v = toml_string(r, "input_key", "runtime.input_key", errors)) cfg.input_key = *v;
    if (auto v = toml_string(r, "output_key", "runtime.output_key", errors)) cfg.output_key = *v;
    if (auto v = toml_string(r, "handler_path", "runtime.handler_path", errors)) cfg.handler_path = *v;
    assign_checked_ms(toml_int(r, "poll_interval_ms", "runtime.poll_interval_ms", errors),
        cfg.poll_interval, 1, MAX_DURATION_MS, "runtime.poll_interval_ms", errors);

    if (auto v = toml_string(r, "change_policy", "runtime.change_policy", errors)) {
        if (auto p = parse_change_policy(*v)) {
            cfg.change_policy = *p;
        } else {
            errors.push_back(std::format("runtime.change_policy: unknown policy '{}'", *v));
        }
    }
}

void extract_retry(const toml::table& root, RetryConfig& cfg, ErrorList& errors) {
    const auto* retry = root["retry"].as_table();
    if (!retry) return;
    const auto& rt = *retry;

    assign_checked(toml_int(rt, "max_consecutive_failures", "retry.max_consecutive_failures", errors),
        cfg.max_consecutive_failures, 0, MAX_RETRIES, "retry.max_consecutive_failures", errors);
    assign_checked_ms(toml_int(rt, "max_backoff_ms", "retry.max_backoff_ms", errors),
        cfg.max_backoff, 1, MAX_DURATION_MS, "retry.max_backoff_ms", errors);

    if (auto v = toml_string(rt, "backoff", "retry.backoff", errors)) {
        if (auto b = parse_backoff_strategy(*v)) {
            cfg.backoff = *b;
        } else {
            errors.push_back(std::format("retry.backoff: unknown strategy '{}'", *v));
        }
    }
}

void extract_logging(const toml::table& root, LoggingConfig& cfg, ErrorList& errors) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return;
    if (auto v = toml_string(*logging, "level", "logging.level", errors)) cfg.level = *v;
}

// ---- Environment overrides -------------------------------------------------

void apply_env_overrides(RuntimeConfig& cfg, ErrorList& errors) {
    if (auto v = env_value(env::REDIS_HOST)) cfg.store.host = *v;
    assign_checked(env_int(env::REDIS_PORT, errors), cfg.store.port, 1, 65535, env::REDIS_PORT, errors);
    assign_checked(env_int(env::REDIS_DB, errors), cfg.store.db, 0, 65535, env::REDIS_DB, errors);
    if (auto v = env_value(env::REDIS_PASSWORD)) cfg.store.password = *v;
    assign_checked_ms(env_int(env::STORE_TIMEOUT_MS, errors), cfg.store.io_timeout,
        1, MAX_DURATION_MS, env::STORE_TIMEOUT_MS, errors);

    if (auto v = env_value(env::REDIS_INPUT_KEY)) cfg.poll.input_key = *v;
    if (auto v = env_value(env::REDIS_OUTPUT_KEY)) cfg.poll.output_key = *v;
    if (auto v = env_value(env::HANDLER_PATH)) cfg.poll.handler_path = *v;
    assign_checked_ms(env_int(env::POLL_INTERVAL_MS, errors), cfg.poll.poll_interval,
        1, MAX_DURATION_MS, env::POLL_INTERVAL_MS, errors);
    if (auto v = env_value(env::CHANGE_POLICY)) {
        if (auto p = parse_change_policy(*v)) {
            cfg.poll.change_policy = *p;
        } else {
            errors.push_back(std::format("Invalid {} value: {}", env::CHANGE_POLICY, *v));
        }
    }

    assign_checked(env_int(env::STORE_MAX_RETRIES, errors), cfg.retry.max_consecutive_failures,
        0, MAX_RETRIES, env::STORE_MAX_RETRIES, errors);
    assign_checked_ms(env_int(env::STORE_MAX_BACKOFF_MS, errors), cfg.retry.max_backoff,
        1, MAX_DURATION_MS, env::STORE_MAX_BACKOFF_MS, errors);
    if (auto v = env_value(env::STORE_BACKOFF)) {
        if (auto b = parse_backoff_strategy(*v)) {
            cfg.retry.backoff = *b;
        } else {
            errors.push_back(std::format("Invalid {} value: {}", env::STORE_BACKOFF, *v));
        }
    }

    if (auto v = env_value(env::LOG_LEVEL)) cfg.logging.level = *v;
}

std::string join_errors(const ErrorList& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

ConfigLoader::LoadResult finish(RuntimeConfig cfg, ErrorList errors) {
    apply_env_overrides(cfg, errors);
    auto problems = ConfigLoader::validate_config(cfg);
    errors.insert(errors.end(), problems.begin(), problems.end());
    if (!errors.empty()) {
        return ConfigLoader::LoadResult::error(
            std::format("Config validation failed: {}", join_errors(errors)));
    }
    return ConfigLoader::LoadResult::ok(std::move(cfg));
}

ConfigLoader::LoadResult from_table(const toml::table& tbl) {
    RuntimeConfig cfg;
    ErrorList errors;
    extract_store(tbl, cfg.store, errors);
    extract_poll(tbl, cfg.poll, errors);
    extract_retry(tbl, cfg.retry, errors);
    extract_logging(tbl, cfg.logging, errors);
    return finish(std::move(cfg), std::move(errors));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    return finish(RuntimeConfig{}, {});
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return from_table(parse_toml_file(config_path));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return from_table(parse_toml_string(toml_content));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RuntimeConfig& config) {
    std::vector<std::string> errors;

    if (config.poll.output_key.empty()) {
        errors.push_back(std::format("{} not set", env::REDIS_OUTPUT_KEY));
    }
    if (config.poll.input_key.empty()) {
        errors.push_back("input key must not be empty");
    }
    if (!config.poll.output_key.empty() && config.poll.output_key == config.poll.input_key) {
        errors.push_back(std::format("output key must differ from input key '{}'", config.poll.input_key));
    }
    if (config.poll.handler_path.empty()) {
        errors.push_back("handler path must not be empty");
    }
    if (config.store.host.empty()) {
        errors.push_back("store host must not be empty");
    }
    if (!utils::in_range<1, 65535>(config.store.port)) {
        errors.push_back(std::format("store port must be 1-65535, got {}", config.store.port));
    }
    if (config.poll.poll_interval.count() <= 0) {
        errors.push_back("poll interval must be positive");
    }
    if (config.retry.backoff == BackoffStrategy::EXPONENTIAL &&
        config.retry.max_backoff < config.poll.poll_interval) {
        errors.push_back(std::format("retry max backoff ({}ms) is below the poll interval ({}ms)",
            config.retry.max_backoff.count(), config.poll.poll_interval.count()));
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("unknown log level '{}'", config.logging.level));
    }

    return errors;
}

} // namespace fnrt
