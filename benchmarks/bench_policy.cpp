#include <benchmark/benchmark.h>
#include "mcpguard/codec.hpp"
#include "mcpguard/guard_rails.hpp"
#include "mcpguard/policy_engine.hpp"
#include <string>

using namespace mcpguard;

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"read_file","arguments":{"path":"/home/user/notes.txt"}}})";

static const std::string kResponse =
    R"({"jsonrpc":"2.0","id":42,"result":{"content":[{"type":"text","text":")" +
    std::string(4096, 'a') + R"("}]}})";

// Trusted server, every mode off: the common fast path.
static void BM_EvaluatePoliciesOff(benchmark::State& state) {
    auto server = ServerIdentity::for_command("fs", "npx", {"-y", "@mcp/server-filesystem"});
    TrustStore trust;
    trust.add(TrustEntry::for_identity(server));
    AuditLog audit;
    LocalDecisionChannel channel(nullptr);
    PolicyEngine engine(PolicyOptions{}, trust, audit, channel);
    auto msg = Codec::parse(kToolCall);

    for (auto _ : state) {
        auto d = engine.evaluate(msg, kToolCall, server, "stdio");
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_EvaluatePoliciesOff);

// Full call-out through guard rails on the local worker.
static void BM_EvaluateGuardRails(benchmark::State& state) {
    auto server = ServerIdentity::for_command("fs", "npx", {"-y", "@mcp/server-filesystem"});
    TrustStore trust;
    trust.add(TrustEntry::for_identity(server));
    AuditLog audit;

    GuardRailsConfig cfg;
    cfg.tool_control = ToolControlMode::Strict;
    cfg.security_detection = SecurityDetectionMode::Block;
    cfg.whitelist.add("fs", "read_file");
    GuardRails rails(cfg);
    LocalDecisionChannel channel(rails.handler());

    PolicyOptions opts;
    opts.tool_control = cfg.tool_control;
    opts.security_detection = cfg.security_detection;
    PolicyEngine engine(opts, trust, audit, channel);
    auto msg = Codec::parse(kToolCall);

    for (auto _ : state) {
        auto d = engine.evaluate(msg, kToolCall, server, "stdio");
        benchmark::DoNotOptimize(d);
    }
    channel.shutdown();
}
BENCHMARK(BM_EvaluateGuardRails);

static void BM_DetectRisks(benchmark::State& state) {
    for (auto _ : state) {
        auto risks = detect_risks(kToolCall);
        benchmark::DoNotOptimize(risks);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_DetectRisks);

static void BM_ScanResponse(benchmark::State& state) {
    TrustStore trust;
    AuditLog audit;
    LocalDecisionChannel channel(nullptr);
    PolicyEngine engine(PolicyOptions{}, trust, audit, channel);

    for (auto _ : state) {
        auto hit = engine.scan_response(kResponse);
        benchmark::DoNotOptimize(hit);
    }
    state.SetBytesProcessed(state.iterations() * kResponse.size());
}
BENCHMARK(BM_ScanResponse);
