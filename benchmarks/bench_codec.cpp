#include <benchmark/benchmark.h>
#include "mcpd/codec.hpp"
#include "mcpd/transport/transport.hpp"
#include "mcpd/utf8.hpp"
#include "mcpd/zoneinfo.hpp"
#include <string>
#include <vector>

using namespace mcpd;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"timeserver","arguments":{"timezone":"Europe/Kyiv"}}})";

// A fetch reply carrying a 64 KiB body.
static std::string make_fetch_reply() {
    std::string text = "URL: http://example.local/\nStatus: 200 OK\nBytes: 65536\n\n";
    text += std::string(65536, 'x');
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"result", {{"content", {{{"type", "text"}, {"text", text}}}}}}
    };
    return resp.dump();
}

static const std::string kFetchReply = make_fetch_reply();

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_DecodeToolCallFrame(benchmark::State& state) {
    for (auto _ : state) {
        auto frame = decode_frame(kToolCall);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_DecodeToolCallFrame);

static void BM_DecodeBatchFrame(benchmark::State& state) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < state.range(0); ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    const std::string raw = batch.dump();
    for (auto _ : state) {
        auto frame = decode_frame(raw);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeBatchFrame)->Arg(10)->Arg(100);

static void BM_RejectMalformedFrame(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        auto frame = decode_frame(bad);
        benchmark::DoNotOptimize(frame);
    }
}
BENCHMARK(BM_RejectMalformedFrame);

static void BM_ParseLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kFetchReply);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kFetchReply.size());
}
BENCHMARK(BM_ParseLargeReply);

static void BM_SerializeLargeReply(benchmark::State& state) {
    auto msg = Codec::parse(kFetchReply);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kFetchReply.size());
}
BENCHMARK(BM_SerializeLargeReply);

static void BM_SanitizeUtf8(benchmark::State& state) {
    std::string body;
    while (body.size() < 65536) body += "Київ \xFF plain ascii text ";
    for (auto _ : state) {
        auto clean = sanitize_utf8(body);
        benchmark::DoNotOptimize(clean);
    }
    state.SetBytesProcessed(state.iterations() * body.size());
}
BENCHMARK(BM_SanitizeUtf8);

static void BM_FormatIso8601(benchmark::State& state) {
    const auto now = std::chrono::system_clock::now();
    for (auto _ : state) {
        auto s = format_iso8601(now, 10800);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FormatIso8601);

static void BM_PosixRuleOffset(benchmark::State& state) {
    const auto rule = TimeZone::parse_posix_rule("EET-2EEST,M3.5.0/3,M10.5.0/4");
    int64_t t = 1700000000;
    for (auto _ : state) {
        auto off = rule.offset_at(t);
        benchmark::DoNotOptimize(off);
        t += 3607;
    }
}
BENCHMARK(BM_PosixRuleOffset);
