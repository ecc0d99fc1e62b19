#include <benchmark/benchmark.h>
#include "mcpgate/dispatcher.hpp"
#include "mcpgate/types.hpp"
#include <memory>
#include <string>

using namespace mcpgate;

namespace {

// Registries stay alive for the dispatcher's lifetime
struct Fixture {
    Registries registries;
    Dispatcher dispatcher{{"bench", "1.0"}, default_capabilities(), std::nullopt, registries};

    explicit Fixture(int n_tools) {
        for (int i = 0; i < n_tools; ++i) {
            ToolDefinition def;
            def.name = "tool_" + std::to_string(i);
            registries.tools.add({def, make_tool_handler([](const RequestContext&, const nlohmann::json&) {
                CallToolResult r;
                r.content.push_back(TextContent{"ok"});
                return r;
            })});
        }
        auto init = dispatcher.dispatch(JsonRpcRequest{RequestId{int64_t{0}}, "initialize", std::nullopt});
        benchmark::DoNotOptimize(init);
    }
};

} // namespace

static void BM_MethodLookup(benchmark::State& state) {
    for (auto _ : state) {
        auto kind = method_kind("prompts/get");
        benchmark::DoNotOptimize(kind);
    }
}
BENCHMARK(BM_MethodLookup)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    Fixture fx(static_cast<int>(state.range(0)));
    JsonRpcMessage req = JsonRpcRequest{RequestId{int64_t{1}}, "tools/list", std::nullopt};
    for (auto _ : state) {
        auto resp = fx.dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->Arg(1)->Arg(50)->MinTime(1.0);

static void BM_DispatchToolCall(benchmark::State& state) {
    Fixture fx(50);
    JsonRpcMessage req = JsonRpcRequest{RequestId{int64_t{1}}, "tools/call",
                                        nlohmann::json{{"name", "tool_25"}}};
    for (auto _ : state) {
        auto resp = fx.dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolCall)->MinTime(1.0);

static void BM_DispatchNotInitialized(benchmark::State& state) {
    Registries registries;
    Dispatcher dispatcher({"bench", "1.0"}, default_capabilities(), std::nullopt, registries);
    JsonRpcMessage req = JsonRpcRequest{RequestId{int64_t{1}}, "tools/list", std::nullopt};
    for (auto _ : state) {
        auto resp = dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotInitialized)->MinTime(1.0);
