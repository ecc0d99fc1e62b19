#include <benchmark/benchmark.h>
#include "mcpgate/codec.hpp"
#include "mcpgate/json_rpc.hpp"
#include <string>

using namespace mcpgate;

static const std::string kListRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";

static const std::string kCalculatorCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"calculator","arguments":{"operation":"divide","a":10,"b":4}}})";

// resources/list response with N entries
static std::string make_resource_list(int n) {
    nlohmann::json resources = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        resources.push_back({
            {"uri", "file:///data/records/" + std::to_string(i) + ".json"},
            {"name", "Record " + std::to_string(i)},
            {"description", "Stored record number " + std::to_string(i)},
            {"mimeType", "application/json"}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", "list-1"},
        {"result", {{"resources", resources}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_resource_list(200);

// ---- Parse ----

static void BM_ParseListRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kListRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kListRequest.size());
}
BENCHMARK(BM_ParseListRequest)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCalculatorCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCalculatorCall.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeResponse)->MinTime(1.0);

static void BM_ParseRejectsWrongVersion(benchmark::State& state) {
    const std::string bad = R"({"jsonrpc":"1.0","id":7,"method":"tools/list"})";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.id);
        }
    }
}
BENCHMARK(BM_ParseRejectsWrongVersion)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeToolResult(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(
        RequestId{int64_t{42}},
        {{"content", {{{"type", "text"}, {"text", "2.5"}}}}, {"isError", false}});
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeToolResult)->MinTime(1.0);

static void BM_SerializeLargeResponse(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);
    for (auto _ : state) {
        auto out = Codec::serialize(msg);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeResponse)->MinTime(1.0);
