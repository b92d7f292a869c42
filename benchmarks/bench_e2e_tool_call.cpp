#include <benchmark/benchmark.h>
#include "mcpipboy/server.hpp"
#include "mcpipboy/tools/builtin_tools.hpp"
#include <chrono>
#include <memory>
#include <string>

using namespace mcpipboy;

// Full line path without a transport: decode, route, execute, encode.
static std::unique_ptr<McpServer> make_server() {
    tools::ToolDependencies deps;
    deps.clock = std::make_shared<FixedClock>(std::chrono::system_clock::from_time_t(1736937000));
    deps.random = std::make_shared<Mt19937Random>(1);
    auto registry = std::make_shared<ToolRegistry>();
    tools::register_builtin_tools(*registry, deps);

    auto server = std::make_unique<McpServer>(McpServer::Options{}, std::move(registry));
    (void)server->handle_line(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})");
    (void)server->handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    return server;
}

static void BM_LineEcho(benchmark::State& state) {
    auto server = make_server();
    const std::string line =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello benchmark"}}})";
    for (auto _ : state) {
        auto reply = server->handle_line(line);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("tools/call echo");
}
BENCHMARK(BM_LineEcho);

static void BM_LineToolsList(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";
    for (auto _ : state) {
        auto reply = server->handle_line(line);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("tools/list");
}
BENCHMARK(BM_LineToolsList);

static void BM_LineTimeParse(benchmark::State& state) {
    auto server = make_server();
    const std::string line =
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"time","arguments":{"input":"3 days ago","timezone":"UTC"}}})";
    for (auto _ : state) {
        auto reply = server->handle_line(line);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("tools/call time");
}
BENCHMARK(BM_LineTimeParse);

static void BM_LinePing(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":4,"method":"ping"})";
    for (auto _ : state) {
        auto reply = server->handle_line(line);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_LinePing);
