#include <benchmark/benchmark.h>
#include "toolwire/dispatcher.hpp"
#include "toolwire/registry.hpp"
#include "toolwire/router.hpp"
#include "toolwire/types.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace toolwire;

namespace {

// Counts frames without doing I/O.
class NullTransport : public ITransport {
public:
    void start(FrameCallback) override {}
    void write_frame(std::string_view) override { ++frames; }
    void shutdown() override {}
    bool is_connected() const override { return true; }

    std::atomic<std::size_t> frames{0};
};

// Create a router with N methods registered (returns via unique_ptr to avoid mutex copy)
std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&, RequestContext&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const nlohmann::json&, RequestContext&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

std::shared_ptr<Registry> make_registry() {
    auto reg = std::make_shared<Registry>();
    ToolDefinition td;
    td.name = "get_weather";
    td.input_schema = {
        {"type", "object"},
        {"properties", {
            {"location", {{"type", "string"}, {"minLength", 1}}},
            {"units", {{"type", "string"}, {"enum", {"celsius", "fahrenheit"}}}}
        }},
        {"required", {"location"}}
    };
    reg->register_tool(td, [](const nlohmann::json& args, RequestContext&) {
        return CallToolResult::text("Sunny in " + args.at("location").get<std::string>());
    });
    return reg;
}

} // namespace

static void BM_ResolveAndInvoke(benchmark::State& state) {
    auto router = make_router(1);
    auto ctx = RequestContext::detached(RequestId{int64_t{1}}, "ping");
    const nlohmann::json params = nlohmann::json::object();

    for (auto _ : state) {
        auto resolved = router->resolve("ping");
        auto result = Router::invoke(std::get<RequestHandler>(resolved), params, ctx);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ResolveAndInvoke)->MinTime(1.0);

static void BM_ResolveUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    for (auto _ : state) {
        auto resolved = router->resolve("not_registered_method");
        benchmark::DoNotOptimize(resolved);
    }
}
BENCHMARK(BM_ResolveUnknownMethod)->MinTime(1.0);

static void BM_Resolve100Methods(benchmark::State& state) {
    auto router = make_router(100);
    std::vector<std::string> methods;
    for (int i = 0; i < 100; ++i) methods.push_back("method_" + std::to_string(i));

    size_t i = 0;
    for (auto _ : state) {
        auto resolved = router->resolve(methods[i % 100]);
        benchmark::DoNotOptimize(resolved);
        ++i;
    }
}
BENCHMARK(BM_Resolve100Methods)->MinTime(1.0);

static void BM_RegistryCallTool(benchmark::State& state) {
    auto reg = make_registry();
    auto ctx = RequestContext::detached(RequestId{int64_t{1}}, "tools/call");
    const nlohmann::json args = {{"location", "Warsaw"}, {"units", "celsius"}};

    for (auto _ : state) {
        auto result = reg->call_tool("get_weather", args, ctx);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RegistryCallTool)->MinTime(1.0);

// Full path through the dispatcher: worker thread, response, outbound writer.
static void BM_DispatcherRoundTrip(benchmark::State& state) {
    auto router = make_router(1);
    NullTransport transport;
    OutboundWriter writer(transport);
    writer.start();
    Dispatcher dispatcher(*router, writer);

    int64_t id = 0;
    for (auto _ : state) {
        JsonRpcRequest req{RequestId{++id}, "ping", nlohmann::json::object()};
        dispatcher.submit(req);
        while (dispatcher.pending_count() > 0) std::this_thread::yield();
    }
    dispatcher.drain(std::chrono::seconds(5));
    writer.close();
    state.counters["frames"] = static_cast<double>(transport.frames.load());
}
BENCHMARK(BM_DispatcherRoundTrip)->MinTime(1.0);
