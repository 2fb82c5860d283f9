#include <benchmark/benchmark.h>
#include "triggerware/codec.hpp"
#include "triggerware/error.hpp"
#include "triggerware/json_rpc.hpp"
#include <string>

using namespace triggerware;

static const std::string kSmallRequest =
    R"json({"jsonrpc":"2.0","id":1,"method":"validate","params":["((x) s.t. (p x))","fol","AP5"]})json";

static const std::string kExecuteQuery =
    R"json({"jsonrpc":"2.0","id":42,"method":"execute-query","params":{"query":"((a) s.t. (inflation 1991 1995 a))","language":"fol","namespace":"AP5","limit":100,"timelimit":2.5}})json";

// An execute-query reply carrying n rows of three columns
static std::string make_batch_response(int n) {
    nlohmann::json tuples = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tuples.push_back({1990 + i % 30, "region-" + std::to_string(i), 0.25 * i});
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {
            {"handle", 17},
            {"signature", {
                {{"attribute", "year"}, {"type", "integer"}},
                {{"attribute", "region"}, {"type", "stringcase"}},
                {{"attribute", "rate"}, {"type", "double"}},
            }},
            {"batch", {{"tuples", tuples}, {"exhausted", false}}},
        }},
    };
    return resp.dump();
}

static const std::string kBatchResponse = make_batch_response(1000);

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseExecuteQuery(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kExecuteQuery);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kExecuteQuery.size());
}
BENCHMARK(BM_ParseExecuteQuery)->MinTime(1.0);

static void BM_ParseResultBatch(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kBatchResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kBatchResponse.size());
}
BENCHMARK(BM_ParseResultBatch)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const TwParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

static void BM_SerializeCall(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "next-resultset-batch";
    req.params = nlohmann::json::array({17, 100, nullptr});

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeCall)->MinTime(1.0);

static void BM_SerializeResultBatch(benchmark::State& state) {
    auto msg = Codec::parse(kBatchResponse);

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kBatchResponse.size());
}
BENCHMARK(BM_SerializeResultBatch)->MinTime(1.0);
