// Example handler: summarizes a host metrics object.
//
// Input:  {"avg-util-cpu0-60sec": 25.4, ..., "percent-network-egress": 100.0,
//          "percent-memory-cache": 100.0}
// Output: {"cpu_count": N, "avg_util_cpu_60sec": ..., "max_util_cpu_60sec": ...,
//          "percent_network_egress": ..., "percent_memory_cache": ...,
//          "source_key": "<input key>", "generated_at_ms": ...}

#include "core/json.hpp"
#include "plugin/plugin_interface.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view CPU_PREFIX = "avg-util-cpu";
constexpr std::string_view CPU_SUFFIX = "-60sec";

bool is_cpu_metric(const std::string& key) {
    return key.size() > CPU_PREFIX.size() + CPU_SUFFIX.size() &&
           key.starts_with(CPU_PREFIX) && key.ends_with(CPU_SUFFIX);
}

fnrt::JsonValue summarize(const fnrt::JsonValue& metrics, const FnrtContext& context) {
    int cpu_count = 0;
    double total = 0.0;
    double peak = 0.0;

    for (const auto& [key, value] : metrics.items()) {
        if (!is_cpu_metric(key) || !value.is_number()) continue;
        const double util = value.get<double>();
        total += util;
        peak = cpu_count == 0 ? util : std::max(peak, util);
        ++cpu_count;
    }

    auto summary = fnrt::JsonValue::object();
    summary.set("cpu_count", cpu_count);
    summary.set("avg_util_cpu_60sec", cpu_count > 0 ? total / cpu_count : 0.0);
    summary.set("max_util_cpu_60sec", peak);
    summary.set("percent_network_egress", metrics.value("percent-network-egress", 0.0));
    summary.set("percent_memory_cache", metrics.value("percent-memory-cache", 0.0));
    summary.set("source_key", std::string(context.input_key ? context.input_key : ""));

    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    summary.set("generated_at_ms", static_cast<long long>(now_ms));
    return summary;
}

} // anonymous namespace

extern "C" {

uint32_t fnrt_handler_api_version() {
    return FNRT_HANDLER_API_VERSION;
}

int handler(const char* payload, size_t payload_len, FnrtContext* context, FnrtOutput* output) {
    try {
        const auto metrics = fnrt::JsonValue::parse(std::string_view(payload, payload_len));
        const std::string encoded = summarize(metrics, *context).dump();
        output->write(output->sink, encoded.data(), encoded.size());
        return FNRT_HANDLER_OK;
    } catch (const std::exception& e) {
        output->fail(output->sink, e.what());
        return FNRT_HANDLER_FAILED;
    }
}

} // extern "C"
