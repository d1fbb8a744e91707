#include <gtest/gtest.h>
#include "minisql/semantic/catalog.h"

using namespace minisql::semantic;
using minisql::sql::Token;
using minisql::sql::TokenType;

// ============================================================================
// TableSchema / SchemaTable
// ============================================================================

TEST(CatalogTest, ColumnsKeepDeclarationOrder) {
    TableSchema table("students");
    EXPECT_TRUE(table.add_column("zeta", ColumnType::INT));
    EXPECT_TRUE(table.add_column("alpha", ColumnType::TEXT));
    EXPECT_TRUE(table.add_column("mid", ColumnType::FLOAT));

    ASSERT_EQ(table.column_count(), 3);
    EXPECT_EQ(table.columns()[0].name, "zeta");
    EXPECT_EQ(table.columns()[1].name, "alpha");
    EXPECT_EQ(table.columns()[2].name, "mid");
}

TEST(CatalogTest, DuplicateColumnRejected) {
    TableSchema table("t");
    EXPECT_TRUE(table.add_column("id", ColumnType::INT));
    EXPECT_FALSE(table.add_column("id", ColumnType::TEXT));

    ASSERT_EQ(table.column_count(), 1);
    EXPECT_EQ(table.find_column("id")->type, ColumnType::INT);
    EXPECT_EQ(table.find_column("missing"), nullptr);
}

TEST(CatalogTest, SchemaTableLookup) {
    SchemaTable schema;
    EXPECT_TRUE(schema.empty());

    TableSchema students("students");
    students.add_column("id", ColumnType::INT);

    EXPECT_TRUE(schema.add_table(std::move(students)));
    EXPECT_FALSE(schema.add_table(TableSchema("students")));

    ASSERT_TRUE(schema.has_table("students"));
    EXPECT_EQ(schema.find_table("students")->column_count(), 1);
    EXPECT_FALSE(schema.has_table("Students"));
    EXPECT_EQ(schema.size(), 1);

    schema.clear();
    EXPECT_TRUE(schema.empty());
}

// ============================================================================
// UserTable
// ============================================================================

TEST(CatalogTest, UsersAndGrants) {
    UserTable users;

    EXPECT_TRUE(users.add_user("ali", "secret"));
    EXPECT_FALSE(users.add_user("ali", "other"));
    EXPECT_EQ(users.find_user("ali")->password, "secret");

    EXPECT_TRUE(users.grant("ali", "students", Privilege::SELECT));
    EXPECT_TRUE(users.grant("ali", "students", Privilege::INSERT));
    EXPECT_FALSE(users.grant("ali", "students", Privilege::SELECT));
    EXPECT_FALSE(users.grant("nobody", "students", Privilege::SELECT));

    const UserRecord* ali = users.find_user("ali");
    ASSERT_NE(ali, nullptr);
    EXPECT_EQ(ali->grants.size(), 2);
    EXPECT_TRUE(ali->has_grant("students", Privilege::SELECT));
    EXPECT_FALSE(ali->has_grant("students", Privilege::DELETE));
}

// ============================================================================
// Type compatibility
// ============================================================================

TEST(CatalogTest, Assignability) {
    Token integer(TokenType::NUMBER, "42", 1, 1);
    Token decimal(TokenType::NUMBER, "85.5", 1, 1);
    Token trailing_dot(TokenType::NUMBER, "85.", 1, 1);
    Token text(TokenType::STRING, "'Ali'", 1, 1);

    EXPECT_TRUE(is_assignable(ColumnType::INT, integer));
    EXPECT_FALSE(is_assignable(ColumnType::INT, decimal));
    EXPECT_FALSE(is_assignable(ColumnType::INT, trailing_dot));
    EXPECT_FALSE(is_assignable(ColumnType::INT, text));

    EXPECT_TRUE(is_assignable(ColumnType::FLOAT, integer));
    EXPECT_TRUE(is_assignable(ColumnType::FLOAT, decimal));
    EXPECT_TRUE(is_assignable(ColumnType::FLOAT, trailing_dot));
    EXPECT_FALSE(is_assignable(ColumnType::FLOAT, text));

    EXPECT_TRUE(is_assignable(ColumnType::TEXT, text));
    EXPECT_FALSE(is_assignable(ColumnType::TEXT, integer));
}

TEST(CatalogTest, DescribeLiteral) {
    EXPECT_EQ(describe_literal(Token(TokenType::NUMBER, "42", 1, 1)), "INT literal 42");
    EXPECT_EQ(describe_literal(Token(TokenType::NUMBER, "4.2", 1, 1)), "FLOAT literal 4.2");
    EXPECT_EQ(describe_literal(Token(TokenType::STRING, "'Ali'", 1, 1)), "TEXT literal 'Ali'");
}
