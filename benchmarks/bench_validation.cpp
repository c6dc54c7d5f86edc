#include <benchmark/benchmark.h>
#include "ctx7/validation.hpp"
#include <string>

using namespace ctx7;

static void BM_SanitizeLibraryName(benchmark::State& state) {
    const std::string name = "@tanstack/react-query <v5> (hooks) & friends";
    for (auto _ : state) {
        auto s = sanitize_library_name(name);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SanitizeLibraryName)->MinTime(1.0);

static void BM_SanitizeLibraryIdWithFolders(benchmark::State& state) {
    const std::string id = "/vercel/next.js!!?folders=/app/(group)/docs";
    for (auto _ : state) {
        auto s = sanitize_library_id(id);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SanitizeLibraryIdWithFolders)->MinTime(1.0);

static void BM_ValidateResolve(benchmark::State& state) {
    const ConfigSnapshot config;
    const nlohmann::json args = {{"libraryName", "react"}};
    for (auto _ : state) {
        auto v = validate_resolve(args, config);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ValidateResolve)->MinTime(1.0);

static void BM_ValidateDocs(benchmark::State& state) {
    const ConfigSnapshot config;
    const TokenPolicy policy{10000};
    const nlohmann::json args = {
        {"context7CompatibleLibraryID", "/vercel/next.js?folders=app"},
        {"topic", "routing"},
        {"tokens", " 25000 "},
        {"lang", "python"}
    };
    for (auto _ : state) {
        auto v = validate_docs(args, config, policy);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ValidateDocs)->MinTime(1.0);

static void BM_RejectOversizedTokens(benchmark::State& state) {
    const ConfigSnapshot config;
    const TokenPolicy policy{10000};
    const nlohmann::json args = {{"context7CompatibleLibraryID", "/org/lib"}, {"tokens", 500000}};
    for (auto _ : state) {
        auto v = validate_docs(args, config, policy);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_RejectOversizedTokens)->MinTime(1.0);
