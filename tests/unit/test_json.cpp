// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - JSON Export Unit Tests                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "minisql/json.h"

using namespace minisql;
using nlohmann::json;

class JsonExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        result_ = Compiler().run(
            "CREATE TABLE students (id INT, name TEXT, grade FLOAT);\n"
            "CREATE USER ali IDENTIFIED BY 'top-secret';\n"
            "GRANT SELECT ON students TO ali;\n"
            "SELECT name FROM students WHERE NOT (id = 1 OR grade >= 90.5);\n"
            "UPDATE students SET name = 'Bob';");
        ASSERT_TRUE(result_.ok());
    }

    CompilationResult result_;
};

// ==============================================================================
// Building blocks
// ==============================================================================

TEST_F(JsonExportTest, Token) {
    json j = result_.tokens.front();

    EXPECT_EQ(j["type"], "CREATE");
    EXPECT_EQ(j["lexeme"], "CREATE");
    EXPECT_EQ(j["line"], 1);
    EXPECT_EQ(j["column"], 1);
}

TEST_F(JsonExportTest, Diagnostic) {
    Diagnostic diagnostic(Phase::Semantic, ErrorCode::UnknownTable, "Table 'x' not found",
                          SourceLocation{4, 9});
    json j = diagnostic;

    EXPECT_EQ(j["phase"], "Semantic");
    EXPECT_EQ(j["severity"], "error");
    EXPECT_EQ(j["code"], 310);
    EXPECT_EQ(j["kind"], "unknown table");
    EXPECT_EQ(j["location"]["line"], 4);
    EXPECT_EQ(j["location"]["column"], 9);
    EXPECT_EQ(j["text"], "[Line 4, Col 9] Semantic Error: Table 'x' not found");
}

// ==============================================================================
// Statements and conditions
// ==============================================================================

TEST_F(JsonExportTest, CreateTableStatement) {
    json j = result_.parse.statements[0];

    EXPECT_EQ(j["kind"], "CREATE TABLE");
    EXPECT_EQ(j["table"]["name"], "students");
    ASSERT_EQ(j["columns"].size(), 3);
    EXPECT_EQ(j["columns"][2]["name"]["name"], "grade");
    EXPECT_EQ(j["columns"][2]["type"], "FLOAT");
}

TEST_F(JsonExportTest, PasswordIsMasked) {
    json j = result_.parse.statements[1];

    EXPECT_EQ(j["kind"], "CREATE USER");
    EXPECT_EQ(j["user"]["name"], "ali");
    EXPECT_EQ(j["password"], "***");
    EXPECT_EQ(json(result_).dump().find("top-secret"), std::string::npos);
}

TEST_F(JsonExportTest, ConditionTree) {
    json statement = result_.analysis.statements[3];
    const json& where = statement["where"];

    EXPECT_EQ(where["kind"], "not");
    const json& inner = where["operand"];
    EXPECT_EQ(inner["kind"], "or");
    EXPECT_EQ(inner["left"]["kind"], "compare");
    EXPECT_EQ(inner["left"]["column"]["name"], "id");
    EXPECT_EQ(inner["left"]["op"], "=");
    EXPECT_EQ(inner["left"]["resolved_type"], "INT");
    EXPECT_EQ(inner["right"]["op"], ">=");
    EXPECT_EQ(inner["right"]["value"], "90.5");
    EXPECT_EQ(inner["right"]["resolved_type"], "FLOAT");
}

TEST_F(JsonExportTest, UnresolvedConditionInParseTree) {
    json j = result_.parse.statements[3];
    EXPECT_TRUE(j["where"]["operand"]["left"]["resolved_type"].is_null());
}

TEST_F(JsonExportTest, UpdateWithoutWhere) {
    json j = result_.parse.statements[4];

    EXPECT_EQ(j["kind"], "UPDATE");
    ASSERT_EQ(j["assignments"].size(), 1);
    EXPECT_EQ(j["assignments"][0]["value"]["lexeme"], "'Bob'");
    EXPECT_TRUE(j["where"].is_null());
}

// ==============================================================================
// Tables and whole results
// ==============================================================================

TEST_F(JsonExportTest, SchemaAndUsers) {
    json schema = result_.analysis.schema;
    ASSERT_EQ(schema.size(), 1);
    EXPECT_EQ(schema[0]["name"], "students");
    EXPECT_EQ(schema[0]["columns"][0]["name"], "id");
    EXPECT_EQ(schema[0]["columns"][0]["type"], "INT");

    json users = result_.analysis.users;
    ASSERT_EQ(users.size(), 1);
    EXPECT_EQ(users[0]["name"], "ali");
    ASSERT_EQ(users[0]["grants"].size(), 1);
    EXPECT_EQ(users[0]["grants"][0]["privilege"], "SELECT");
    EXPECT_EQ(users[0]["grants"][0]["table"], "students");
    EXPECT_FALSE(users[0].contains("password"));
}

TEST_F(JsonExportTest, WholeResult) {
    json j = result_;

    EXPECT_EQ(j["ok"], true);
    EXPECT_EQ(j["errors"], 0);
    EXPECT_EQ(j["parse"]["statements"].size(), 5);
    EXPECT_EQ(j["analysis"]["validated_statements"].size(), 5);
    EXPECT_TRUE(j["analysis"]["error"].is_null());
    EXPECT_TRUE(j["diagnostics"].empty());
}

TEST(JsonExportAbortTest, AbortedRunHasNoParse) {
    CompilerConfig config;
    config.lexer.error_policy = sql::LexErrorPolicy::Abort;

    json j = Compiler(config).run("SELECT # FROM t;");

    EXPECT_EQ(j["ok"], false);
    EXPECT_TRUE(j["parse"].is_null());
    EXPECT_TRUE(j["analysis"].is_null());
    ASSERT_EQ(j["diagnostics"].size(), 1);
    EXPECT_EQ(j["diagnostics"][0]["phase"], "Lexical");
}
