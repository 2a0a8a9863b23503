#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "plugin/handler_loader.hpp"
#include "runtime/runtime_context.hpp"
#include "core/utils.hpp"

#include <string>

using namespace fnrt;
using Catch::Approx;

TEST_CASE("metrics_summary: summarizes mock host metrics", "[handler][example]") {
    auto loaded = HandlerLoader::load(FNRT_METRICS_SUMMARY_PATH);
    REQUIRE(loaded.success);

    RuntimeContext ctx("localhost", 6379, "metrics", "metrics-summary", loaded.modified_at);
    const std::string input = R"({
        "percent-network-egress": 100.0,
        "percent-memory-cache": 75.5,
        "avg-util-cpu0-60sec": 25.4,
        "avg-util-cpu1-60sec": 65.4,
        "avg-util-cpu2-60sec": 20.9,
        "avg-util-cpu3-60sec": 71.5
    })";

    const auto before_ms = utils::to_epoch_ms(utils::now());
    auto result = loaded.handler->invoke(JsonValue::parse(input), input, ctx);
    REQUIRE(result.is_ok());
    REQUIRE(result.value.is_object());

    const auto& out = result.value;
    CHECK(out["cpu_count"].get<int>() == 4);
    CHECK(out["avg_util_cpu_60sec"].get<double>() == Approx(45.8));
    CHECK(out["max_util_cpu_60sec"].get<double>() == Approx(71.5));
    CHECK(out["percent_network_egress"].get<double>() == Approx(100.0));
    CHECK(out["percent_memory_cache"].get<double>() == Approx(75.5));
    CHECK(out["source_key"].get<std::string>() == "metrics");
    CHECK(out["generated_at_ms"].get<int64_t>() >= before_ms);
}

TEST_CASE("metrics_summary: tolerates missing metrics", "[handler][example]") {
    auto loaded = HandlerLoader::load(FNRT_METRICS_SUMMARY_PATH);
    REQUIRE(loaded.success);

    RuntimeContext ctx("localhost", 6379, "metrics", "out", loaded.modified_at);
    const std::string input = R"({"unrelated": "x"})";
    auto result = loaded.handler->invoke(JsonValue::parse(input), input, ctx);
    REQUIRE(result.is_ok());
    CHECK(result.value["cpu_count"].get<int>() == 0);
    CHECK(result.value["avg_util_cpu_60sec"].get<double>() == Approx(0.0));
    CHECK(result.value["percent_network_egress"].get<double>() == Approx(0.0));
}
