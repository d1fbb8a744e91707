#include "minisql/semantic/analyzer.h"

#include "internal/utils/logger.hpp"

#include <fmt/format.h>

#include <utility>

namespace minisql::semantic {

using namespace sql;

AnalysisResult SemanticAnalyzer::analyze(std::vector<Statement> statements) {
    schema_.clear();
    users_.clear();
    notices_.clear();

    AnalysisResult result;
    result.statements.reserve(statements.size());

    for (auto& statement : statements) {
        auto status = check_statement(statement);
        if (!status) {
            log::error("Semantic analysis stopped: {}", status.error().to_string());
            result.error = status.error();
            break;
        }
        result.statements.push_back(std::move(statement));
    }

    log::debug("Semantic analysis: {} of {} statements valid, {} tables, {} users",
               result.statements.size(), statements.size(), schema_.size(), users_.size());

    result.schema = std::move(schema_);
    result.users = std::move(users_);
    result.notices = std::move(notices_);

    schema_.clear();
    users_.clear();
    notices_.clear();

    return result;
}

Status SemanticAnalyzer::check_statement(Statement& statement) {
    return std::visit(overloaded{
        [this](CreateTableStatement& stmt) { return check_create_table(stmt); },
        [this](CreateUserStatement& stmt) { return check_create_user(stmt); },
        [this](GrantStatement& stmt) { return check_grant(stmt); },
        [this](InsertStatement& stmt) { return check_insert(stmt); },
        [this](SelectStatement& stmt) { return check_select(stmt); },
        [this](UpdateStatement& stmt) { return check_update(stmt); },
        [this](DeleteStatement& stmt) { return check_delete(stmt); },
    }, statement.node);
}

// ==============================================================================
// DDL / DCL
// ==============================================================================

Status SemanticAnalyzer::check_create_table(const CreateTableStatement& stmt) {
    if (schema_.has_table(stmt.table.name)) {
        return Err(semantic_error(ErrorCode::DuplicateTable,
                                  fmt::format("Table '{}' already exists", stmt.table.name),
                                  stmt.table.location));
    }

    TableSchema table(stmt.table.name);
    for (const auto& column : stmt.columns) {
        if (!table.add_column(column.name.name, column.type)) {
            return Err(semantic_error(
                ErrorCode::DuplicateColumn,
                fmt::format("Duplicate column '{}' in table '{}'", column.name.name, stmt.table.name),
                column.name.location));
        }
    }

    schema_.add_table(std::move(table));
    log::info("Registered table '{}' ({} columns)", stmt.table.name, stmt.columns.size());
    return Ok();
}

Status SemanticAnalyzer::check_create_user(const CreateUserStatement& stmt) {
    if (!users_.add_user(stmt.username.name, stmt.password)) {
        return Err(semantic_error(ErrorCode::DuplicateUser,
                                  fmt::format("User '{}' already exists", stmt.username.name),
                                  stmt.username.location));
    }

    log::info("Registered user '{}'", stmt.username.name);
    return Ok();
}

Status SemanticAnalyzer::check_grant(const GrantStatement& stmt) {
    if (!users_.has_user(stmt.user.name)) {
        return Err(semantic_error(ErrorCode::UnknownUser,
                                  fmt::format("User '{}' not found", stmt.user.name),
                                  stmt.user.location));
    }

    auto table = lookup_table(stmt.table);
    if (!table) return Err(table.error());

    const char* privilege = privilege_name(stmt.privilege);

    if (!users_.grant(stmt.user.name, stmt.table.name, stmt.privilege)) {
        Diagnostic notice(Phase::Semantic, ErrorCode::DuplicateGrant,
                          fmt::format("User '{}' already has {} on '{}'",
                                      stmt.user.name, privilege, stmt.table.name),
                          stmt.user.location, Severity::Warning);
        log::warn(notice.to_string());
        notices_.push_back(std::move(notice));
        return Ok();
    }

    log::info("Granted {} on '{}' to '{}'", privilege, stmt.table.name, stmt.user.name);
    return Ok();
}

// ==============================================================================
// DML
// ==============================================================================

Status SemanticAnalyzer::check_insert(const InsertStatement& stmt) {
    auto lookup = lookup_table(stmt.table);
    if (!lookup) return Err(lookup.error());
    const TableSchema& table = **lookup;

    if (stmt.values.size() != table.column_count()) {
        return Err(semantic_error(
            ErrorCode::ArityMismatch,
            fmt::format("Column count mismatch for table '{}': expected {}, got {}",
                        table.name(), table.column_count(), stmt.values.size()),
            stmt.table.location));
    }

    for (std::size_t i = 0; i < stmt.values.size(); ++i) {
        const ColumnSchema& column = table.columns()[i];
        const Token& value = stmt.values[i];

        if (!is_assignable(column.type, value)) {
            return Err(semantic_error(
                ErrorCode::TypeMismatch,
                fmt::format("Type mismatch at column {}: expected {}, got {}",
                            i + 1, column_type_name(column.type), describe_literal(value)),
                value.location()));
        }
    }

    return Ok();
}

Status SemanticAnalyzer::check_select(SelectStatement& stmt) {
    auto lookup = lookup_table(stmt.table);
    if (!lookup) return Err(lookup.error());
    const TableSchema& table = **lookup;

    if (!stmt.is_wildcard()) {
        for (const auto& column : stmt.columns) {
            auto found = lookup_column(table, column);
            if (!found) return Err(found.error());
        }
    }

    if (stmt.where_clause) {
        return check_condition(*stmt.where_clause, table);
    }
    return Ok();
}

Status SemanticAnalyzer::check_update(UpdateStatement& stmt) {
    auto lookup = lookup_table(stmt.table);
    if (!lookup) return Err(lookup.error());
    const TableSchema& table = **lookup;

    for (const auto& assignment : stmt.assignments) {
        auto found = lookup_column(table, assignment.column);
        if (!found) return Err(found.error());

        const ColumnSchema& column = **found;
        if (!is_assignable(column.type, assignment.value)) {
            return Err(semantic_error(
                ErrorCode::TypeMismatch,
                fmt::format("Type mismatch for column '{}': expected {}, got {}",
                            column.name, column_type_name(column.type),
                            describe_literal(assignment.value)),
                assignment.value.location()));
        }
    }

    if (stmt.where_clause) {
        return check_condition(*stmt.where_clause, table);
    }
    return Ok();
}

Status SemanticAnalyzer::check_delete(DeleteStatement& stmt) {
    auto lookup = lookup_table(stmt.table);
    if (!lookup) return Err(lookup.error());

    if (stmt.where_clause) {
        return check_condition(*stmt.where_clause, **lookup);
    }
    return Ok();
}

// ==============================================================================
// WHERE
// ==============================================================================

Status SemanticAnalyzer::check_condition(Condition& condition, const TableSchema& table) {
    return std::visit(overloaded{
        [&](CompareCondition& c) -> Status {
            auto found = lookup_column(table, c.column);
            if (!found) return Err(found.error());

            const ColumnSchema& column = **found;
            if (!is_assignable(column.type, c.literal)) {
                return Err(semantic_error(
                    ErrorCode::TypeMismatch,
                    fmt::format("Type mismatch in WHERE: column '{}' is {} but compared with {}",
                                column.name, column_type_name(column.type),
                                describe_literal(c.literal)),
                    c.literal.location()));
            }

            c.resolved_type = column.type;
            return Ok();
        },
        [&](AndCondition& c) -> Status {
            auto left = check_condition(*c.left, table);
            if (!left) return left;
            return check_condition(*c.right, table);
        },
        [&](OrCondition& c) -> Status {
            auto left = check_condition(*c.left, table);
            if (!left) return left;
            return check_condition(*c.right, table);
        },
        [&](NotCondition& c) -> Status {
            return check_condition(*c.operand, table);
        },
    }, condition.node);
}

// ==============================================================================
// Lookups
// ==============================================================================

Result<const TableSchema*> SemanticAnalyzer::lookup_table(const Identifier& table) const {
    const TableSchema* schema = schema_.find_table(table.name);
    if (schema == nullptr) {
        return Err<const TableSchema*>(semantic_error(
            ErrorCode::UnknownTable,
            fmt::format("Table '{}' not found", table.name),
            table.location));
    }
    return schema;
}

Result<const ColumnSchema*> SemanticAnalyzer::lookup_column(const TableSchema& table,
                                                            const Identifier& column) const {
    const ColumnSchema* schema = table.find_column(column.name);
    if (schema == nullptr) {
        return Err<const ColumnSchema*>(semantic_error(
            ErrorCode::UnknownColumn,
            fmt::format("Column '{}' not found in table '{}'", column.name, table.name()),
            column.location));
    }
    return schema;
}

Diagnostic SemanticAnalyzer::semantic_error(ErrorCode code, std::string message,
                                            SourceLocation location) {
    return Diagnostic(Phase::Semantic, code, std::move(message), location);
}

} // namespace minisql::semantic
