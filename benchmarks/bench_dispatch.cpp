#include <benchmark/benchmark.h>
#include "triggerware/dispatch_table.hpp"
#include "triggerware/correlation_table.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace triggerware;

// A table with n polled-query style notify entries and one execute entry
static std::unique_ptr<DispatchTable> make_table(int n_methods) {
    auto table = std::make_unique<DispatchTable>();
    for (int i = 0; i < n_methods; ++i) {
        table->add_method("poll" + std::to_string(i), {nullptr, [](const nlohmann::json& p) {
            benchmark::DoNotOptimize(p);
        }});
    }
    table->add_method("echo", {[](const nlohmann::json& p) -> HandlerResult { return p; }, nullptr});
    return table;
}

static void BM_DispatchCall(benchmark::State& state) {
    auto table = make_table(1);
    JsonRpcMessage msg = JsonRpcRequest{RequestId{int64_t{1}}, "echo", nlohmann::json{{"x", 1}}};

    for (auto _ : state) {
        auto resp = table->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchCall)->MinTime(1.0);

static void BM_DispatchUnknownCall(benchmark::State& state) {
    auto table = make_table(1);
    JsonRpcMessage msg = JsonRpcRequest{RequestId{int64_t{1}}, "not_registered", std::nullopt};

    for (auto _ : state) {
        auto resp = table->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownCall)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto table = make_table(n);

    std::vector<JsonRpcMessage> notes;
    for (int i = 0; i < n; ++i) {
        notes.push_back(JsonRpcNotification{"poll" + std::to_string(i), nlohmann::json{{"handle", i}}});
    }

    size_t i = 0;
    for (auto _ : state) {
        auto resp = table->dispatch(notes[i % notes.size()]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_DispatchNotification)->Arg(1)->Arg(100)->Arg(10000)->MinTime(1.0);

static void BM_AddRemoveMethod(benchmark::State& state) {
    auto table = make_table(100);
    for (auto _ : state) {
        table->add_method("sub0", {nullptr, [](const nlohmann::json&) {}});
        benchmark::DoNotOptimize(table->remove_method("sub0"));
    }
}
BENCHMARK(BM_AddRemoveMethod)->MinTime(1.0);

static void BM_CorrelateCall(benchmark::State& state) {
    CorrelationTable table;
    for (auto _ : state) {
        auto [id, reply] = table.open("bench");
        table.complete(id, JsonRpcResponse{RequestId{id}, nlohmann::json(true), std::nullopt});
        auto resp = reply.get();
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_CorrelateCall)->MinTime(1.0);
