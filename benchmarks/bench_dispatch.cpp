#include <benchmark/benchmark.h>
#include "mcpipboy/dispatcher.hpp"
#include "mcpipboy/router.hpp"
#include "mcpipboy/tools/builtin_tools.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace mcpipboy;

static std::shared_ptr<const ToolRegistry> make_registry() {
    tools::ToolDependencies deps;
    deps.clock = std::make_shared<FixedClock>(std::chrono::system_clock::from_time_t(1736937000));
    deps.random = std::make_shared<Mt19937Random>(1);
    auto registry = std::make_shared<ToolRegistry>();
    tools::register_builtin_tools(*registry, deps);
    return registry;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    Router router;
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "prompts/list";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod);

static void BM_DispatchEcho(benchmark::State& state) {
    Dispatcher dispatcher(make_registry());
    const nlohmann::json args = {{"message", "hello benchmark"}};
    for (auto _ : state) {
        auto result = dispatcher.call("echo", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchEcho);

static void BM_DispatchValidationFailure(benchmark::State& state) {
    Dispatcher dispatcher(make_registry());
    const nlohmann::json args = {{"operation", "validate"}};
    for (auto _ : state) {
        auto result = dispatcher.call("imo", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchValidationFailure);

static void BM_DispatchGenerate(benchmark::State& state) {
    Dispatcher dispatcher(make_registry());
    const std::vector<std::string> names = {"imo", "mmsi", "creditcard", "isbn", "ean13", "iban"};
    const nlohmann::json args = {{"operation", "generate"}, {"count", state.range(0)}};
    size_t i = 0;
    for (auto _ : state) {
        auto result = dispatcher.call(names[i++ % names.size()], args);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DispatchGenerate)->Arg(1)->Arg(100);

static void BM_DispatchUuidV5(benchmark::State& state) {
    Dispatcher dispatcher(make_registry());
    const nlohmann::json args = {{"version", "v5"}, {"namespace", "URL"}, {"name", "https://example.com"}};
    for (auto _ : state) {
        auto result = dispatcher.call("uuid", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchUuidV5);
