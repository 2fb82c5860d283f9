#include <benchmark/benchmark.h>
#include "triggerware/frame_parser.hpp"
#include <algorithm>
#include <string>

using namespace triggerware;

// A delta notification of n added rows, the bulk of what a busy polled
// query puts on the wire.
static std::string make_delta(int n) {
    nlohmann::json added = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        added.push_back({i, "order-" + std::to_string(i), "ships \"today\" {maybe}"});
    }
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", "poll0"},
        {"params", {{"handle", 3}, {"delta", {{"added", added}, {"deleted", nlohmann::json::array()}}}}},
    };
    return msg.dump();
}

static void BM_ParseOneMessagePerRead(benchmark::State& state) {
    const std::string msg = make_delta(static_cast<int>(state.range(0)));
    FrameParser parser;
    for (auto _ : state) {
        parser.feed(msg);
        auto value = parser.next();
        benchmark::DoNotOptimize(value);
    }
    state.SetBytesProcessed(state.iterations() * msg.size());
}
BENCHMARK(BM_ParseOneMessagePerRead)->Arg(1)->Arg(100)->Arg(1000)->MinTime(1.0);

static void BM_ParseConcatenatedMessages(benchmark::State& state) {
    std::string stream;
    for (int i = 0; i < 64; ++i) stream += make_delta(4);

    FrameParser parser;
    for (auto _ : state) {
        parser.feed(stream);
        while (auto value = parser.next()) {
            benchmark::DoNotOptimize(value);
        }
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_ParseConcatenatedMessages)->MinTime(1.0);

// The same message delivered in small socket reads, so most calls to next()
// find an incomplete value.
static void BM_ParseFragmentedMessage(benchmark::State& state) {
    const std::string msg = make_delta(200);
    const size_t chunk = static_cast<size_t>(state.range(0));

    FrameParser parser;
    for (auto _ : state) {
        for (size_t off = 0; off < msg.size(); off += chunk) {
            parser.feed(msg.data() + off, std::min(chunk, msg.size() - off));
            auto value = parser.next();
            benchmark::DoNotOptimize(value);
        }
    }
    state.SetBytesProcessed(state.iterations() * msg.size());
}
BENCHMARK(BM_ParseFragmentedMessage)->Arg(64)->Arg(1024)->Arg(4096)->MinTime(1.0);

static void BM_ScanOnly(benchmark::State& state) {
    const std::string msg = make_delta(1000);
    for (auto _ : state) {
        size_t begin = 0;
        auto end = FrameParser::scan(msg, begin);
        benchmark::DoNotOptimize(end);
    }
    state.SetBytesProcessed(state.iterations() * msg.size());
}
BENCHMARK(BM_ScanOnly)->MinTime(1.0);
