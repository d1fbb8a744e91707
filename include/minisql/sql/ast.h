#pragma once

#include "minisql/diagnostic.h"
#include "minisql/sql/token.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace minisql::sql {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ==============================================================================
// Basic vocabulary
// ==============================================================================

enum class ColumnType {
    INT,
    FLOAT,
    TEXT
};

[[nodiscard]] const char* column_type_name(ColumnType type) noexcept;

/// INT / FLOAT / TEXT, any letter case
[[nodiscard]] std::optional<ColumnType> parse_column_type(std::string_view text);

/// Type a literal token carries on its own: NUMBER without '.' is INT,
/// NUMBER with '.' is FLOAT, STRING is TEXT.
[[nodiscard]] std::optional<ColumnType> literal_type(const Token& literal);

enum class CompareOp {
    EQUAL,
    NOT_EQUAL,
    LESS,
    LESS_EQUAL,
    GREATER,
    GREATER_EQUAL
};

[[nodiscard]] const char* compare_op_symbol(CompareOp op) noexcept;

enum class Privilege {
    SELECT,
    INSERT,
    UPDATE,
    DELETE
};

[[nodiscard]] const char* privilege_name(Privilege privilege) noexcept;

// Table, column or user name with its source position
struct Identifier {
    std::string name;
    SourceLocation location;
};

// ==============================================================================
// Conditions (WHERE)
// ==============================================================================

struct Condition;
using ConditionPtr = std::unique_ptr<Condition>;

// column <op> literal
struct CompareCondition {
    Identifier column;
    CompareOp op;
    Token literal;
    std::optional<ColumnType> resolved_type;  // filled in by the analyzer
};

struct AndCondition {
    ConditionPtr left;
    ConditionPtr right;
};

struct OrCondition {
    ConditionPtr left;
    ConditionPtr right;
};

struct NotCondition {
    ConditionPtr operand;
};

struct Condition {
    std::variant<CompareCondition, AndCondition, OrCondition, NotCondition> node;
    SourceLocation location;
    std::size_t height{1};  // levels in this subtree, a comparison is 1

    // Deep copy of the whole subtree
    ConditionPtr clone() const;

    std::string to_string() const;
};

[[nodiscard]] ConditionPtr make_compare(Identifier column, CompareOp op, Token literal);
[[nodiscard]] ConditionPtr make_and(ConditionPtr left, ConditionPtr right);
[[nodiscard]] ConditionPtr make_or(ConditionPtr left, ConditionPtr right);
[[nodiscard]] ConditionPtr make_not(ConditionPtr operand, SourceLocation location);

// ==============================================================================
// Statements
// ==============================================================================

// CREATE TABLE students (id INT, name TEXT);
struct CreateTableStatement {
    struct ColumnDefinition {
        Identifier name;
        ColumnType type;
    };

    Identifier table;
    std::vector<ColumnDefinition> columns;
};

// INSERT INTO students VALUES (1, 'Ali', 85.5);
struct InsertStatement {
    Identifier table;
    std::vector<Token> values;
};

// SELECT * FROM students WHERE id = 1;
struct SelectStatement {
    Identifier table;
    std::vector<Identifier> columns;  // "*" or the column list
    ConditionPtr where_clause;

    bool is_wildcard() const {
        return columns.size() == 1 && columns.front().name == "*";
    }
};

// UPDATE students SET grade = 95.0 WHERE name = 'Ali';
struct UpdateStatement {
    struct Assignment {
        Identifier column;
        Token value;
    };

    Identifier table;
    std::vector<Assignment> assignments;
    ConditionPtr where_clause;
};

// DELETE FROM students WHERE id = 2;
struct DeleteStatement {
    Identifier table;
    ConditionPtr where_clause;
};

// CREATE USER ali IDENTIFIED BY 'secret';
struct CreateUserStatement {
    Identifier username;
    std::string password;  // without quotes
};

// GRANT SELECT ON students TO ali;
struct GrantStatement {
    Privilege privilege;
    Identifier table;
    Identifier user;
};

using StatementNode = std::variant<
    CreateTableStatement,
    InsertStatement,
    SelectStatement,
    UpdateStatement,
    DeleteStatement,
    CreateUserStatement,
    GrantStatement>;

struct Statement {
    StatementNode node;
    SourceLocation location;  // leading keyword

    Statement clone() const;

    const char* kind_name() const;
    std::string to_string() const;
};

} // namespace minisql::sql
