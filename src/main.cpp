#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "plugin/handler_loader.hpp"
#include "runtime/poll_loop.hpp"
#include "runtime/runtime_context.hpp"
#include "store/redis_store.hpp"

#include <cstdlib>
#include <format>
#include <string>

using namespace fnrt;

namespace {

int startup_failure(const std::string& msg) {
    utils::log::error(std::format("[{}] {}", error_category_to_string(ErrorCategory::STARTUP_ERROR), msg));
    return EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Function runtime starting...");

        // Configuration: optional TOML file, environment always wins
        ConfigLoader::LoadResult config_result;
        if (argc > 1) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", argv[1]));
            config_result = ConfigLoader::load_from_file(argv[1]);
        } else {
            utils::log::info("[1/4] Loading configuration from environment");
            config_result = ConfigLoader::load_from_env();
        }
        if (!config_result.success) {
            return startup_failure(config_result.error_message);
        }
        const RuntimeConfig& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // Handler
        utils::log::info(std::format("[2/4] Loading handler from {}", cfg.poll.handler_path));
        auto loaded = HandlerLoader::load(cfg.poll.handler_path);
        if (!loaded.success) {
            return startup_failure(loaded.error_message);
        }

        RuntimeContext context(cfg.store.host, cfg.store.port,
                               cfg.poll.input_key, cfg.poll.output_key,
                               loaded.modified_at);

        // Store
        utils::log::info(std::format("[3/4] Store: {}:{} (db {}, timeout {}ms)",
            cfg.store.host, cfg.store.port, cfg.store.db, cfg.store.io_timeout.count()));
        RedisStore store(cfg.store);

        PollLoop::Config loop_config;
        loop_config.poll_interval = cfg.poll.poll_interval;
        loop_config.change_policy = cfg.poll.change_policy;
        loop_config.retry = cfg.retry;

        utils::log::info(std::format("[4/4] Polling '{}' every {}ms (store retries: {}, backoff: {})",
            cfg.poll.input_key, cfg.poll.poll_interval.count(),
            cfg.retry.max_consecutive_failures == 0
                ? std::string("unbounded")
                : std::to_string(cfg.retry.max_consecutive_failures),
            backoff_strategy_to_string(cfg.retry.backoff)));

        PollLoop loop(store, *loaded.handler, std::move(context), loop_config);
        if (!loop.run()) {
            return EXIT_FAILURE;
        }

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
