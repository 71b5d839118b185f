#include <benchmark/benchmark.h>
#include "mcpguard/codec.hpp"
#include <string>

using namespace mcpguard;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// tools/call result carrying n text blocks, e.g. a directory listing
static std::string make_large_response(int n) {
    nlohmann::json content = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        content.push_back({
            {"type", "text"},
            {"text", "/srv/data/project/file_" + std::to_string(i) + ".txt  4096 bytes  rw-r--r--"},
            {"annotations", {{"audience", {"user"}}, {"priority", 0.5}}}
        });
    }
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"result", {{"content", content}, {"isError", false}}}
    }.dump();
}

static const std::string kLargeResponse = make_large_response(250);

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto tool = msg.effective_method();
        benchmark::DoNotOptimize(tool);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeMessage)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeLargeMessage(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeMessage)->MinTime(1.0);

static void BM_BlockResponse(benchmark::State& state) {
    auto msg = Codec::parse(kToolCallRequest);
    for (auto _ : state) {
        auto s = Codec::make_block_response(msg, "Tool is blacklisted: get_weather");
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_BlockResponse)->MinTime(1.0);
