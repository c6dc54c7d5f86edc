#include <benchmark/benchmark.h>
#include "ctx7/server.hpp"
#include "ctx7/tool_handlers.hpp"
#include <memory>
#include <optional>
#include <string>

using namespace ctx7;

namespace {

/// Answers instantly so the benchmark measures dispatch and validation only.
class CannedDocsClient : public IDocsClient {
public:
    std::optional<SearchResponse> search(const std::string&) override {
        SearchResponse resp;
        for (int i = 0; i < 10; ++i) {
            SearchResult r;
            r.id = "/org/lib" + std::to_string(i);
            r.name = "Library " + std::to_string(i);
            r.description = "A library that does things";
            r.snippet_count = 100 * i;
            r.star_count = 1000 * i;
            resp.results.push_back(std::move(r));
        }
        return resp;
    }

    std::optional<std::string> fetch(const std::string&, const FetchOptions&) override {
        return std::string(8 * 1024, 'x');
    }
};

class NullEventLogger : public IEventLogger {
public:
    using IEventLogger::log_event;
    void log_event(const std::string&, const nlohmann::json&) override {}
};

struct Fixture {
    Server server;
    DocsToolHandlers handlers;

    Fixture()
        : server(Server::Options{Implementation{"Context7", "1.0.6"}, std::nullopt}),
          handlers(nullptr, TokenPolicy{}, std::make_shared<CannedDocsClient>(),
                   std::make_shared<NullEventLogger>()) {
        handlers.register_tools(server);
    }
};

JsonRpcRequest tool_call(const std::string& name, nlohmann::json args) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", name}, {"arguments", std::move(args)}};
    return req;
}

} // namespace

static void BM_DispatchPing(benchmark::State& state) {
    Fixture f;
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = f.server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    Fixture f;
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = f.server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

static void BM_DispatchResolve(benchmark::State& state) {
    Fixture f;
    auto req = tool_call("resolve-library-id", {{"libraryName", "react"}});

    for (auto _ : state) {
        auto resp = f.server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchResolve)->MinTime(1.0);

static void BM_DispatchDocs(benchmark::State& state) {
    Fixture f;
    auto req = tool_call("get-library-docs",
                         {{"context7CompatibleLibraryID", "/vercel/next.js?folders=app"},
                          {"tokens", "20000"}});

    for (auto _ : state) {
        auto resp = f.server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchDocs)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Fixture f;
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "resources/list";

    for (auto _ : state) {
        auto resp = f.server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);
