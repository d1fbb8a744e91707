// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Embedded Usage Example                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "minisql/version.hpp"
#include "minisql/compiler.h"
#include "minisql/json.h"

#include <fmt/core.h>
#include <fmt/color.h>

namespace {

constexpr const char* kSource = R"(
CREATE TABLE students (id INT, name TEXT, grade FLOAT);
CREATE USER ali IDENTIFIED BY 'secret';
GRANT SELECT ON students TO ali;

INSERT INTO students VALUES (1, 'Ali', 85.5);
INSERT INTO students VALUES (2, 'Sara', 91.0);

SELECT name, grade FROM students WHERE id = 1 OR id = 2 AND grade > 80.0;
SELECT name students WHERE id = 1;
UPDATE students SET grade = 95.0 WHERE NOT (name = 'Ali');
DELETE FROM students WHERE id = 2;
)";

} // namespace

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== minisql Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", MINISQL_VERSION);
    fmt::print("Build:   {} ({})\n\n", MINISQL_BUILD_TYPE, MINISQL_COMPILER);

    // Configure the pipeline
    minisql::CompilerConfig config;
    config.lexer.error_policy = minisql::sql::LexErrorPolicy::Recover;
    config.parser.max_condition_depth = 64;

    minisql::Compiler compiler(config);
    auto result = compiler.run(kSource);

    fmt::print("Parsed statements:\n");
    for (const auto& statement : result.parse.statements) {
        fmt::print("  {:<13} {}\n", statement.kind_name(), statement.to_string());
    }
    fmt::print("\n");

    fmt::print("Diagnostics:\n");
    for (const auto& diagnostic : result.all_diagnostics()) {
        fmt::print(fg(diagnostic.is_error() ? fmt::color::red : fmt::color::yellow),
            "  {}\n", diagnostic.to_string());
    }
    fmt::print("\n");

    fmt::print("Schema:\n");
    for (const auto& [name, table] : result.analysis.schema) {
        fmt::print("  {} ({} columns)\n", name, table.column_count());
        for (const auto& column : table.columns()) {
            fmt::print("    {:<8} {}\n", column.name, minisql::sql::column_type_name(column.type));
        }
    }
    fmt::print("\n");

    fmt::print("Users:\n");
    for (const auto& [name, user] : result.analysis.users) {
        fmt::print("  {} ({} grants)\n", name, user.grants.size());
    }
    fmt::print("\n");

    nlohmann::json schema = result.analysis.schema;
    fmt::print("Schema as JSON:\n{}\n\n", schema.dump(2));

    if (result.ok()) {
        fmt::print(fg(fmt::color::green), "Done, no errors!\n\n");
        return 0;
    }

    fmt::print(fg(fmt::color::red), "Done, {} error(s)\n\n", result.error_count());
    return 1;
}
