// bench/encoding_bench.cpp
// WRP codec benchmarks.

#include <benchmark/benchmark.h>
#include "bench_common.hpp"
#include "encoding.hpp"
#include "router.hpp"

using namespace kratos;
using namespace kratos::encoding;
using namespace kratos_bench;

// --- encode_message_into (reused buffer) ---

static void BM_EncodeMessage(benchmark::State& state) {
    const auto& scenario = SCENARIOS[static_cast<size_t>(state.range(0))];
    auto msg = scenario_message(scenario);

    std::vector<uint8_t> buf;
    buf.reserve(4096);
    for (auto _ : state) {
        buf.clear();
        encode_message_into(buf, msg);
        benchmark::DoNotOptimize(buf.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(msg.payload.size()));
    state.SetLabel(scenario.name);
}

BENCHMARK(BM_EncodeMessage)->DenseRange(0, SCENARIO_COUNT - 1);

// --- decode_message ---

static void BM_DecodeMessage(benchmark::State& state) {
    const auto& scenario = SCENARIOS[static_cast<size_t>(state.range(0))];
    auto frame = encode_message(scenario_message(scenario));

    for (auto _ : state) {
        auto msg = decode_message(frame);
        benchmark::DoNotOptimize(msg.payload.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(frame.size()));
    state.SetLabel(scenario.name);
}

BENCHMARK(BM_DecodeMessage)->DenseRange(0, SCENARIO_COUNT - 1);

// --- decode + dispatch, as the read loop does it ---

static void BM_DecodeAndDispatch(benchmark::State& state) {
    size_t handler_count = static_cast<size_t>(state.range(0));
    auto frame = encode_message(scenario_message(SCENARIOS[1]));

    size_t hits = 0;
    std::vector<HandlerRegistration> registrations;
    for (size_t i = 0; i + 1 < handler_count; i++) {
        registrations.push_back({"/service-" + std::to_string(i) + "$",
                                 [&hits](const Message&) { hits++; }});
    }
    registrations.push_back({"/config", [&hits](const Message&) { hits++; }});
    Router router(std::move(registrations));

    for (auto _ : state) {
        auto msg = decode_message(frame);
        benchmark::DoNotOptimize(router.dispatch(msg));
    }
    benchmark::DoNotOptimize(hits);
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_DecodeAndDispatch)->Arg(1)->Arg(8)->Arg(32);
