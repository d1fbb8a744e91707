#include "minisql/sql/ast.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace minisql::sql {

const char* column_type_name(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::INT: return "INT";
        case ColumnType::FLOAT: return "FLOAT";
        case ColumnType::TEXT: return "TEXT";
    }
    return "UNKNOWN";
}

std::optional<ColumnType> parse_column_type(std::string_view text) {
    std::string upper(text);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "INT") return ColumnType::INT;
    if (upper == "FLOAT") return ColumnType::FLOAT;
    if (upper == "TEXT") return ColumnType::TEXT;
    return std::nullopt;
}

std::optional<ColumnType> literal_type(const Token& literal) {
    switch (literal.type) {
        case TokenType::NUMBER:
            return literal.lexeme.find('.') == std::string::npos
                ? ColumnType::INT
                : ColumnType::FLOAT;
        case TokenType::STRING:
            return ColumnType::TEXT;
        default:
            return std::nullopt;
    }
}

const char* compare_op_symbol(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::EQUAL: return "=";
        case CompareOp::NOT_EQUAL: return "!=";
        case CompareOp::LESS: return "<";
        case CompareOp::LESS_EQUAL: return "<=";
        case CompareOp::GREATER: return ">";
        case CompareOp::GREATER_EQUAL: return ">=";
    }
    return "?";
}

const char* privilege_name(Privilege privilege) noexcept {
    switch (privilege) {
        case Privilege::SELECT: return "SELECT";
        case Privilege::INSERT: return "INSERT";
        case Privilege::UPDATE: return "UPDATE";
        case Privilege::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

// Condition factories

namespace {

std::size_t joined_height(const Condition& left, const Condition& right) {
    return std::max(left.height, right.height) + 1;
}

} // namespace

ConditionPtr make_compare(Identifier column, CompareOp op, Token literal) {
    SourceLocation location = column.location;
    return std::make_unique<Condition>(Condition{
        CompareCondition{std::move(column), op, std::move(literal), std::nullopt},
        location});
}

ConditionPtr make_and(ConditionPtr left, ConditionPtr right) {
    SourceLocation location = left->location;
    std::size_t height = joined_height(*left, *right);
    return std::make_unique<Condition>(Condition{
        AndCondition{std::move(left), std::move(right)}, location, height});
}

ConditionPtr make_or(ConditionPtr left, ConditionPtr right) {
    SourceLocation location = left->location;
    std::size_t height = joined_height(*left, *right);
    return std::make_unique<Condition>(Condition{
        OrCondition{std::move(left), std::move(right)}, location, height});
}

ConditionPtr make_not(ConditionPtr operand, SourceLocation location) {
    std::size_t height = operand->height + 1;
    return std::make_unique<Condition>(Condition{
        NotCondition{std::move(operand)}, location, height});
}

ConditionPtr Condition::clone() const {
    return std::visit(overloaded{
        [this](const CompareCondition& c) {
            return std::make_unique<Condition>(Condition{c, location, height});
        },
        [this](const AndCondition& c) {
            return std::make_unique<Condition>(Condition{
                AndCondition{c.left->clone(), c.right->clone()}, location, height});
        },
        [this](const OrCondition& c) {
            return std::make_unique<Condition>(Condition{
                OrCondition{c.left->clone(), c.right->clone()}, location, height});
        },
        [this](const NotCondition& c) {
            return std::make_unique<Condition>(Condition{
                NotCondition{c.operand->clone()}, location, height});
        },
    }, node);
}

// Condition: fully parenthesised, e.g. (id = 1 OR (id = 2 AND grade > 80.0))
std::string Condition::to_string() const {
    return std::visit(overloaded{
        [](const CompareCondition& c) {
            return c.column.name + " " + compare_op_symbol(c.op) + " " + c.literal.lexeme;
        },
        [](const AndCondition& c) {
            return "(" + c.left->to_string() + " AND " + c.right->to_string() + ")";
        },
        [](const OrCondition& c) {
            return "(" + c.left->to_string() + " OR " + c.right->to_string() + ")";
        },
        [](const NotCondition& c) {
            return "NOT " + c.operand->to_string();
        },
    }, node);
}

namespace {

ConditionPtr clone_where(const ConditionPtr& where) {
    return where ? where->clone() : nullptr;
}

} // namespace

Statement Statement::clone() const {
    StatementNode copy = std::visit(overloaded{
        [](const SelectStatement& stmt) -> StatementNode {
            return SelectStatement{stmt.table, stmt.columns, clone_where(stmt.where_clause)};
        },
        [](const UpdateStatement& stmt) -> StatementNode {
            return UpdateStatement{stmt.table, stmt.assignments, clone_where(stmt.where_clause)};
        },
        [](const DeleteStatement& stmt) -> StatementNode {
            return DeleteStatement{stmt.table, clone_where(stmt.where_clause)};
        },
        [](const auto& stmt) -> StatementNode { return stmt; },
    }, node);

    return Statement{std::move(copy), location};
}

const char* Statement::kind_name() const {
    return std::visit(overloaded{
        [](const CreateTableStatement&) { return "CREATE TABLE"; },
        [](const InsertStatement&) { return "INSERT"; },
        [](const SelectStatement&) { return "SELECT"; },
        [](const UpdateStatement&) { return "UPDATE"; },
        [](const DeleteStatement&) { return "DELETE"; },
        [](const CreateUserStatement&) { return "CREATE USER"; },
        [](const GrantStatement&) { return "GRANT"; },
    }, node);
}

std::string Statement::to_string() const {
    std::stringstream ss;

    std::visit(overloaded{
        [&ss](const CreateTableStatement& stmt) {
            ss << "CREATE TABLE " << stmt.table.name << " (";
            for (size_t i = 0; i < stmt.columns.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << stmt.columns[i].name.name << " " << column_type_name(stmt.columns[i].type);
            }
            ss << ")";
        },
        [&ss](const InsertStatement& stmt) {
            ss << "INSERT INTO " << stmt.table.name << " VALUES (";
            for (size_t i = 0; i < stmt.values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << stmt.values[i].lexeme;
            }
            ss << ")";
        },
        [&ss](const SelectStatement& stmt) {
            ss << "SELECT ";
            for (size_t i = 0; i < stmt.columns.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << stmt.columns[i].name;
            }
            ss << " FROM " << stmt.table.name;
            if (stmt.where_clause) {
                ss << " WHERE " << stmt.where_clause->to_string();
            }
        },
        [&ss](const UpdateStatement& stmt) {
            ss << "UPDATE " << stmt.table.name << " SET ";
            for (size_t i = 0; i < stmt.assignments.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << stmt.assignments[i].column.name << " = " << stmt.assignments[i].value.lexeme;
            }
            if (stmt.where_clause) {
                ss << " WHERE " << stmt.where_clause->to_string();
            }
        },
        [&ss](const DeleteStatement& stmt) {
            ss << "DELETE FROM " << stmt.table.name;
            if (stmt.where_clause) {
                ss << " WHERE " << stmt.where_clause->to_string();
            }
        },
        [&ss](const CreateUserStatement& stmt) {
            ss << "CREATE USER " << stmt.username.name << " IDENTIFIED BY '***'";
        },
        [&ss](const GrantStatement& stmt) {
            ss << "GRANT " << privilege_name(stmt.privilege) << " ON " << stmt.table.name
               << " TO " << stmt.user.name;
        },
    }, node);

    ss << ";";
    return ss.str();
}

} // namespace minisql::sql
