#include <benchmark/benchmark.h>
#include "mcpgate/registry.hpp"
#include "mcpgate/uri_template.hpp"
#include <string>

using namespace mcpgate;

static void BM_CompileTemplate(benchmark::State& state) {
    for (auto _ : state) {
        auto tmpl = UriTemplate::compile("repo://{owner}/{name}/issues/{number}");
        benchmark::DoNotOptimize(tmpl);
    }
}
BENCHMARK(BM_CompileTemplate)->MinTime(1.0);

static void BM_MatchSinglePlaceholder(benchmark::State& state) {
    auto tmpl = UriTemplate::compile("user://{userId}");
    for (auto _ : state) {
        auto params = tmpl.match("user://123456");
        benchmark::DoNotOptimize(params);
    }
}
BENCHMARK(BM_MatchSinglePlaceholder)->MinTime(1.0);

static void BM_MatchMiss(benchmark::State& state) {
    auto tmpl = UriTemplate::compile("user://{userId}");
    for (auto _ : state) {
        auto params = tmpl.match("user://123456/extra");
        benchmark::DoNotOptimize(params);
    }
}
BENCHMARK(BM_MatchMiss)->MinTime(1.0);

// Worst case: the matching template is registered last
static void BM_RegistryMatchLast(benchmark::State& state) {
    ResourceTemplateRegistry registry;
    auto handler = make_resource_template_handler(
        [](const RequestContext&, const std::string&, const UriParams&) {
            return std::vector<ResourceContent>{};
        });
    const auto n = state.range(0);
    for (int64_t i = 0; i < n; ++i) {
        ResourceTemplate def;
        def.uri_template = "kind" + std::to_string(i) + "://{id}";
        def.name = def.uri_template;
        registry.add({def, UriTemplate::compile(def.uri_template), handler});
    }
    const std::string uri = "kind" + std::to_string(n - 1) + "://abc";
    for (auto _ : state) {
        auto m = registry.match(uri);
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_RegistryMatchLast)->Arg(1)->Arg(16)->Arg(128)->MinTime(1.0);
