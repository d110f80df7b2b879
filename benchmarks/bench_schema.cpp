#include <benchmark/benchmark.h>
#include "toolwire/schema.hpp"
#include <string>

using namespace toolwire;

static const nlohmann::json kFlatSchema = {
    {"type", "object"},
    {"properties", {
        {"name", {{"type", "string"}, {"minLength", 1}, {"maxLength", 64}}},
        {"count", {{"type", "integer"}, {"minimum", 0}}},
        {"mode", {{"type", "string"}, {"enum", {"fast", "safe"}}}}
    }},
    {"required", {"name", "count"}},
    {"additionalProperties", false}
};

static nlohmann::json make_nested_schema() {
    nlohmann::json item = {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"pattern", "^/[a-z/]+$"}}},
            {"size", {{"type", "number"}}}
        }},
        {"required", {"path"}}
    };
    return {
        {"type", "object"},
        {"properties", {{"files", {{"type", "array"}, {"items", item}, {"maxItems", 1000}}}}},
        {"required", {"files"}}
    };
}

static nlohmann::json make_nested_instance(int n) {
    nlohmann::json files = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        files.push_back({{"path", "/srv/data/file"}, {"size", i * 512}});
    }
    return {{"files", files}};
}

static void BM_ValidateFlatValid(benchmark::State& state) {
    const nlohmann::json args = {{"name", "job"}, {"count", 3}, {"mode", "fast"}};
    for (auto _ : state) {
        auto errors = schema::collect_errors(kFlatSchema, args);
        benchmark::DoNotOptimize(errors);
    }
}
BENCHMARK(BM_ValidateFlatValid)->MinTime(1.0);

static void BM_ValidateFlatInvalid(benchmark::State& state) {
    const nlohmann::json args = {{"name", ""}, {"count", -1}, {"mode", "slow"}, {"extra", true}};
    for (auto _ : state) {
        auto errors = schema::collect_errors(kFlatSchema, args);
        benchmark::DoNotOptimize(errors);
    }
}
BENCHMARK(BM_ValidateFlatInvalid)->MinTime(1.0);

static void BM_ValidateNestedArray(benchmark::State& state) {
    const auto schema = make_nested_schema();
    const auto instance = make_nested_instance(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto errors = schema::collect_errors(schema, instance);
        benchmark::DoNotOptimize(errors);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ValidateNestedArray)->Arg(10)->Arg(100)->Arg(1000);
