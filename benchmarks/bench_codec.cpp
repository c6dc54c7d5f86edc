#include <benchmark/benchmark.h>
#include "ctx7/codec.hpp"
#include "ctx7/error.hpp"
#include "ctx7/json_rpc.hpp"
#include <string>

using namespace ctx7;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kDocsCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get-library-docs",)"
    R"("arguments":{"context7CompatibleLibraryID":"/vercel/next.js","topic":"routing","tokens":10000}}})";

// A get-library-docs reply carrying roughly `kb` kilobytes of documentation.
static std::string make_docs_reply(int kb) {
    std::string text;
    text.reserve(static_cast<size_t>(kb) * 1024);
    while (text.size() < static_cast<size_t>(kb) * 1024) {
        text += "TITLE: App Router\nDESCRIPTION: Define routes with folders.\nCODE:\n```tsx\n"
                "export default function Page() { return <h1>Hello</h1> }\n```\n----------\n";
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 42},
        {"result", {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}}}
    };
    return resp.dump();
}

static const std::string kDocsReply = make_docs_reply(64);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseDocsCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kDocsCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kDocsCall.size());
}
BENCHMARK(BM_ParseDocsCall)->MinTime(1.0);

static void BM_ParseDocsReply(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kDocsReply);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kDocsReply.size());
}
BENCHMARK(BM_ParseDocsReply)->MinTime(1.0);

static void BM_ParseBatchPayload(benchmark::State& state) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 20; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    std::string raw = batch.dump();

    for (auto _ : state) {
        auto payload = Codec::parse_payload(raw);
        benchmark::DoNotOptimize(payload);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseBatchPayload)->MinTime(1.0);

static void BM_RejectMalformed(benchmark::State& state) {
    const std::string bad = R"({"jsonrpc":"2.0","id":1,"method":)";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_RejectMalformed)->MinTime(1.0);

static void BM_SerializeDocsReply(benchmark::State& state) {
    auto msg = Codec::parse(kDocsReply);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kDocsReply.size());
}
BENCHMARK(BM_SerializeDocsReply)->MinTime(1.0);
