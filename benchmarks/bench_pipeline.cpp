// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Full Pipeline Benchmarks                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "internal/utils/logger.hpp"
#include "minisql/compiler.h"

#include <cstdint>
#include <string>

static void BM_CompileBatch(benchmark::State& state) {
    std::string source =
        "CREATE TABLE students (id INT, name TEXT, grade FLOAT);\n"
        "CREATE USER ali IDENTIFIED BY 'secret';\n"
        "GRANT SELECT ON students TO ali;\n";
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        source += "INSERT INTO students VALUES (" + std::to_string(i) + ", 'name', 85.5);\n";
        source += "SELECT name FROM students WHERE NOT (id = 1 OR grade < 50.0);\n";
    }

    // The analyzer logs every registered table and grant
    minisql::log::set_level(minisql::log::Level::Off);

    minisql::Compiler compiler;

    for (auto _ : state) {
        auto result = compiler.run(source);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(source.size()));
}
BENCHMARK(BM_CompileBatch)->Range(8, 2048);
