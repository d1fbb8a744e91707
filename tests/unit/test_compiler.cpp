// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Compiler Pipeline Unit Tests                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include <string>

#include "minisql/compiler.h"

using namespace minisql;

namespace {

constexpr const char* kProgram = R"(
-- schema
CREATE TABLE students (id INT, name TEXT, grade FLOAT);
CREATE USER ali IDENTIFIED BY 'secret';
GRANT SELECT ON students TO ali;

## data ##
INSERT INTO students VALUES (1, 'Ali', 85.5);
SELECT name, grade FROM students WHERE id = 1 OR id = 2 AND grade > 80.0;
UPDATE students SET grade = 95.0 WHERE NOT (name = 'Ali');
DELETE FROM students WHERE id = 2;
)";

} // namespace

// ==============================================================================
// Clean runs
// ==============================================================================

TEST(CompilerTest, CleanProgram) {
    Compiler compiler;
    auto result = compiler.run(kProgram);

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.parsed);
    EXPECT_TRUE(result.lexical_diagnostics.empty());
    EXPECT_EQ(result.parse.statements.size(), 7);
    EXPECT_EQ(result.analysis.statements.size(), 7);
    EXPECT_EQ(result.analysis.schema.size(), 1);
    EXPECT_EQ(result.analysis.users.size(), 1);
    EXPECT_EQ(result.error_count(), 0);
    EXPECT_EQ(result.warning_count(), 0);
    EXPECT_TRUE(result.all_diagnostics().empty());
}

TEST(CompilerTest, ParseTreeStaysUnannotated) {
    Compiler compiler;
    auto result = compiler.run(
        "CREATE TABLE t (id INT);\n"
        "DELETE FROM t WHERE id = 1;");

    ASSERT_TRUE(result.ok());

    const auto& parsed = std::get<sql::DeleteStatement>(result.parse.statements[1].node);
    const auto& analyzed = std::get<sql::DeleteStatement>(result.analysis.statements[1].node);

    EXPECT_FALSE(std::get<sql::CompareCondition>(parsed.where_clause->node).resolved_type);
    EXPECT_EQ(std::get<sql::CompareCondition>(analyzed.where_clause->node).resolved_type,
              sql::ColumnType::INT);
}

// ==============================================================================
// Diagnostics across phases
// ==============================================================================

TEST(CompilerTest, SyntaxErrorsDoNotStopAnalysis) {
    Compiler compiler;
    auto result = compiler.run(
        "CREATE TABLE t (id INT, name TEXT);\n"
        "SELECT name t WHERE id = 1;\n"
        "INSERT INTO t VALUES (2, 'x');");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.parse.diagnostics.size(), 1);
    EXPECT_TRUE(result.analysis.ok());
    EXPECT_EQ(result.analysis.statements.size(), 2);
    EXPECT_EQ(result.error_count(), 1);
}

TEST(CompilerTest, DiagnosticsInPhaseOrder) {
    Compiler compiler;
    auto result = compiler.run(
        "CREATE TABLE t (id INT);\n"
        "CREATE USER u IDENTIFIED BY 'p';\n"
        "GRANT SELECT ON t TO u;\n"
        "GRANT SELECT ON t TO u;\n"
        "SELECT $ id FROM t WHERE;\n"
        "INSERT INTO t VALUES ('x');");

    auto all = result.all_diagnostics();
    ASSERT_EQ(all.size(), 4);
    EXPECT_EQ(all[0].phase(), Phase::Lexical);
    EXPECT_EQ(all[1].phase(), Phase::Syntax);
    EXPECT_EQ(all[2].phase(), Phase::Semantic);
    EXPECT_EQ(all[2].severity(), Severity::Warning);
    EXPECT_EQ(all[3].phase(), Phase::Semantic);
    EXPECT_EQ(all[3].code(), ErrorCode::TypeMismatch);

    EXPECT_EQ(result.error_count(), 3);
    EXPECT_EQ(result.warning_count(), 1);
}

TEST(CompilerTest, RecoverPolicyKeepsGoing) {
    Compiler compiler;
    auto result = compiler.run("CREATE TABLE t (id INT); @ SELECT id FROM t;");

    EXPECT_TRUE(result.parsed);
    EXPECT_EQ(result.lexical_diagnostics.size(), 1);
    EXPECT_TRUE(result.parse.ok());
    EXPECT_EQ(result.analysis.statements.size(), 2);
}

TEST(CompilerTest, AbortPolicySkipsLaterPhases) {
    CompilerConfig config;
    config.lexer.error_policy = sql::LexErrorPolicy::Abort;

    Compiler compiler(config);
    auto result = compiler.run("CREATE TABLE t (id INT); @ SELECT id FROM t;");

    EXPECT_FALSE(result.parsed);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.lexical_diagnostics.size(), 1);
    EXPECT_EQ(result.lexical_diagnostics[0].code(), ErrorCode::IllegalCharacter);
    EXPECT_TRUE(result.parse.statements.empty());
    EXPECT_TRUE(result.analysis.schema.empty());
    EXPECT_EQ(result.tokens.back().type, sql::TokenType::END_OF_FILE);
}

TEST(CompilerTest, MaxDepthFromConfig) {
    CompilerConfig config;
    config.parser.max_condition_depth = 1;

    Compiler compiler(config);
    auto result = compiler.run("CREATE TABLE t (id INT); SELECT * FROM t WHERE ((id = 1));");

    ASSERT_EQ(result.parse.diagnostics.size(), 1);
    EXPECT_EQ(result.parse.diagnostics[0].code(), ErrorCode::NestingTooDeep);
}

TEST(CompilerTest, LongConditionChainIsDiagnosed) {
    std::string source = "CREATE TABLE t (id INT);\nSELECT * FROM t WHERE id = 1";
    for (int i = 0; i < 50000; ++i) source += " OR id = 1";
    source += ";\nSELECT id FROM t;";

    Compiler compiler;
    auto result = compiler.run(source);

    ASSERT_TRUE(result.parsed);
    ASSERT_EQ(result.parse.diagnostics.size(), 1);
    EXPECT_EQ(result.parse.diagnostics[0].code(), ErrorCode::NestingTooDeep);
    EXPECT_EQ(result.parse.statements.size(), 2);
    EXPECT_TRUE(result.analysis.ok());
    EXPECT_EQ(result.analysis.statements.size(), 2);
    EXPECT_EQ(result.error_count(), 1);
}

TEST(CompilerTest, ChainAtHeightLimitIsAnalyzed) {
    std::string source = "CREATE TABLE t (id INT);\nSELECT * FROM t WHERE id = 1";
    for (int i = 0; i < 255; ++i) source += " OR id = 1";
    source += ";";

    Compiler compiler;
    auto result = compiler.run(source);

    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.analysis.statements.size(), 2);
    const auto& select = std::get<sql::SelectStatement>(result.analysis.statements[1].node);
    EXPECT_EQ(select.where_clause->height, 256);
}

TEST(CompilerTest, EmptySource) {
    Compiler compiler;
    auto result = compiler.run("");

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.tokens.size(), 1);
    EXPECT_TRUE(result.parse.statements.empty());
}
