// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Parser Benchmarks                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "minisql/sql/lexer.h"
#include "minisql/sql/parser.h"

#include <cstdint>
#include <string>

using namespace minisql::sql;

static void BM_ParseInsertBatch(benchmark::State& state) {
    std::string source;
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        source += "INSERT INTO students VALUES (" + std::to_string(i) + ", 'name', 85.5);\n";
    }
    const auto tokens = Lexer(source).tokenize();

    for (auto _ : state) {
        Parser parser(tokens);
        auto result = parser.parse();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ParseInsertBatch)->Range(8, 4096);

static void BM_ParseDeepCondition(benchmark::State& state) {
    std::string source = "SELECT * FROM t WHERE ";
    for (std::int64_t i = 0; i < state.range(0); ++i) source += "(";
    source += "id = 1";
    for (std::int64_t i = 0; i < state.range(0); ++i) source += ")";
    source += ";";
    const auto tokens = Lexer(source).tokenize();

    for (auto _ : state) {
        Parser parser(tokens);
        auto result = parser.parse();
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ParseDeepCondition)->RangeMultiplier(2)->Range(1, 128);

static void BM_ParseWithRecovery(benchmark::State& state) {
    std::string source;
    for (int i = 0; i < 256; ++i) {
        source += "SELECT name students WHERE id = 1;\n";
        source += "INSERT INTO t VALUES (2, 'x');\n";
    }
    const auto tokens = Lexer(source).tokenize();

    for (auto _ : state) {
        Parser parser(tokens);
        auto result = parser.parse();
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ParseWithRecovery);
