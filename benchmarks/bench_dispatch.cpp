#include <benchmark/benchmark.h>
#include "mcpd/dispatcher.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/server.hpp"
#include "mcpd/tools/builtin.hpp"
#include <memory>
#include <string>

using namespace mcpd;

// Tools log every call; keep the output to the benchmark table.
static const ToolRegistry& builtin_registry() {
    static const ToolRegistry registry = [] {
        init_logging(spdlog::level::off);
        ToolRegistry r;
        register_builtin_tools(r);
        return r;
    }();
    return registry;
}

static void BM_InvokeEcho(benchmark::State& state) {
    Dispatcher dispatcher(builtin_registry());
    for (auto _ : state) {
        auto result = dispatcher.invoke("echotest", R"({"message":"hello"})");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokeEcho);

static void BM_InvokeUnknownTool(benchmark::State& state) {
    Dispatcher dispatcher(builtin_registry());
    for (auto _ : state) {
        auto result = dispatcher.invoke("missing", "{}");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokeUnknownTool);

static void BM_InvokeTimeServerUtc(benchmark::State& state) {
    Dispatcher dispatcher(builtin_registry());
    for (auto _ : state) {
        auto result = dispatcher.invoke("timeserver", R"({"timezone":"UTC"})");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokeTimeServerUtc);

static void BM_HandleToolsCall(benchmark::State& state) {
    McpServer server(builtin_registry());
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echotest"}, {"arguments", {{"message", "hi"}}}};

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleToolsCall);

static void BM_HandleToolsList(benchmark::State& state) {
    McpServer server(builtin_registry());
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_HandleToolsList);

static void BM_HandleFrameEndToEnd(benchmark::State& state) {
    McpServer server(builtin_registry());
    MessageHandler handler = [&server](const JsonRpcMessage& msg) { return server.handle(msg); };
    const std::string raw =
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echotest","arguments":{"message":"frame"}}})";

    for (auto _ : state) {
        auto out = handle_frame(raw, handler);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleFrameEndToEnd);
