#include <benchmark/benchmark.h>
#include "mcpipboy/codec.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/json_rpc.hpp"
#include <string>

using namespace mcpipboy;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"iban","arguments":{"input":"GB82 WEST 1234 5698 7654 32"}}})";

// tools/call reply carrying n generated identifiers
static std::string make_generate_reply(int n) {
    nlohmann::json values = nlohmann::json::array();
    for (int i = 0; i < n; ++i) values.push_back("97803064061" + std::to_string(10 + i % 90));
    nlohmann::json text = {{"result", values}};
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text.dump()}}})}}}
    };
    return resp.dump();
}

static const std::string kLargeReply = make_generate_reply(1000);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeReply);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_ParseLargeReply);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson);

static void BM_SerializeResult(benchmark::State& state) {
    auto reply = make_result(int64_t{7}, nlohmann::json{{"content", nlohmann::json::array(
        {{{"type", "text"}, {"text", R"({"result":"Hello, MCP!"})"}}})}});
    for (auto _ : state) {
        auto s = Codec::serialize(reply);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResult);

static void BM_SerializeLargeReply(benchmark::State& state) {
    auto msg = Codec::parse(kLargeReply);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_SerializeLargeReply);
