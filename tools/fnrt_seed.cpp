// Seeds a key with a mock metrics object for local runs of the runtime
// and dashboard consumers.
//
//   fnrt_seed [--host H] [--port P] [--db N] [--key K]
//
// Defaults come from REDIS_HOST, REDIS_PORT, REDIS_DB and REDIS_KEY.

#include "core/json.hpp"
#include "core/utils.hpp"
#include "store/redis_store.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace fnrt;

namespace {

struct SeedOptions {
    StoreConfig store;
    std::string key = "metrics";
};

std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

void print_usage(const char* prog) {
    std::cerr << std::format("usage: {} [--host H] [--port P] [--db N] [--key K]\n", prog);
}

std::optional<SeedOptions> parse_args(int argc, char* argv[]) {
    SeedOptions opts;
    opts.store.host = env_or("REDIS_HOST", "localhost");
    std::string port = env_or("REDIS_PORT", "6379");
    std::string db = env_or("REDIS_DB", "0");
    opts.key = env_or("REDIS_KEY", opts.key);

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") return std::nullopt;
        if (i + 1 >= argc) {
            utils::log::error(std::format("Missing value for {}", arg));
            return std::nullopt;
        }
        const std::string value = argv[++i];
        if (arg == "--host") opts.store.host = value;
        else if (arg == "--port") port = value;
        else if (arg == "--db") db = value;
        else if (arg == "--key") opts.key = value;
        else {
            utils::log::error(std::format("Unknown option {}", arg));
            return std::nullopt;
        }
    }

    const auto port_num = utils::try_parse_int<int64_t>(utils::trim(port));
    if (!port_num || !utils::in_range<1, 65535>(*port_num)) {
        utils::log::error(std::format("Invalid port: {}", port));
        return std::nullopt;
    }
    const auto db_num = utils::try_parse_int<int64_t>(utils::trim(db));
    if (!db_num || !utils::in_range<0, 65535>(*db_num)) {
        utils::log::error(std::format("Invalid db index: {}", db));
        return std::nullopt;
    }
    opts.store.port = static_cast<uint16_t>(*port_num);
    opts.store.db = static_cast<uint32_t>(*db_num);
    return opts;
}

JsonValue build_mock_payload() {
    auto payload = JsonValue::object();
    payload.set("percent-network-egress", 100.00);
    payload.set("percent-memory-cache", 100.00);
    payload.set("avg-util-cpu0-60sec", 25.45);
    payload.set("avg-util-cpu1-60sec", 25.89);
    payload.set("avg-util-cpu2-60sec", 0.34);
    payload.set("avg-util-cpu3-60sec", 1.12);
    return payload;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    RedisStore store(opts->store);
    const std::string body = build_mock_payload().dump();
    auto written = store.set(opts->key, body);
    if (written.is_error()) {
        utils::log::error(std::format("Failed to seed '{}': {}", opts->key, written.error_message()));
        return EXIT_FAILURE;
    }

    utils::log::info(std::format("Seeded key '{}' on {} (db {}): {}",
        opts->key, store.endpoint(), opts->store.db, body));
    return EXIT_SUCCESS;
}
