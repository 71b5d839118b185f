#include <benchmark/benchmark.h>
#include "mcpguard/line_framer.hpp"
#include <string>

using namespace mcpguard;

static std::string make_stream(int lines) {
    std::string out;
    for (int i = 0; i < lines; ++i) {
        out += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) +
               R"(,"method":"tools/call","params":{"name":"echo","arguments":{"text":"héllo"}}})" "\n";
    }
    return out;
}

static const std::string kStream = make_stream(1000);

// Feed the stream in reads of state.range(0) bytes, as the pipe readers do.
static void BM_FrameChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        LineFramer framer;
        size_t total = 0;
        for (size_t pos = 0; pos < kStream.size(); pos += chunk) {
            framer.append(std::string_view(kStream).substr(pos, chunk));
            total += framer.extract_lines().size();
        }
        benchmark::DoNotOptimize(total);
    }
    state.SetBytesProcessed(state.iterations() * kStream.size());
}
BENCHMARK(BM_FrameChunked)->Arg(64)->Arg(4096)->Arg(65536);

// One oversized message arriving slowly.
static void BM_FrameLargeLine(benchmark::State& state) {
    std::string line = R"({"jsonrpc":"2.0","id":1,"result":{"text":")" +
                       std::string(1 << 20, 'x') + "\"}}\n";
    for (auto _ : state) {
        LineFramer framer;
        for (size_t pos = 0; pos < line.size(); pos += 4096) {
            framer.append(std::string_view(line).substr(pos, 4096));
            auto lines = framer.extract_lines();
            benchmark::DoNotOptimize(lines);
        }
    }
    state.SetBytesProcessed(state.iterations() * line.size());
}
BENCHMARK(BM_FrameLargeLine);
