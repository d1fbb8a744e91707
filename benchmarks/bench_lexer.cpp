// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Lexer Benchmarks                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "minisql/sql/lexer.h"

#include <cstdint>
#include <string>

using namespace minisql::sql;

namespace {

std::string make_batch(std::int64_t statements) {
    std::string source = "CREATE TABLE students (id INT, name TEXT, grade FLOAT);\n";
    for (std::int64_t i = 0; i < statements; ++i) {
        source += "INSERT INTO students VALUES (" + std::to_string(i) + ", 'name', 85.5); -- row\n";
    }
    return source;
}

} // namespace

static void BM_LexSingleStatement(benchmark::State& state) {
    const std::string source = "SELECT name, grade FROM students WHERE id = 1 OR grade >= 90.0;";

    for (auto _ : state) {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        benchmark::DoNotOptimize(tokens);
    }
}
BENCHMARK(BM_LexSingleStatement);

static void BM_LexBatch(benchmark::State& state) {
    const std::string source = make_batch(state.range(0));

    for (auto _ : state) {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        benchmark::DoNotOptimize(tokens);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(source.size()));
}
BENCHMARK(BM_LexBatch)->Range(8, 4096);

static void BM_LexWithIllegalCharacters(benchmark::State& state) {
    std::string source;
    for (int i = 0; i < 256; ++i) {
        source += "SELECT @ FROM t $ WHERE id = 1;\n";
    }

    for (auto _ : state) {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        benchmark::DoNotOptimize(tokens);
        benchmark::DoNotOptimize(lexer.diagnostics());
    }
}
BENCHMARK(BM_LexWithIllegalCharacters);
