#pragma once

#include "minisql/diagnostic.h"
#include "minisql/result.h"
#include "minisql/semantic/catalog.h"
#include "minisql/sql/ast.h"

#include <optional>
#include <vector>

namespace minisql::semantic {

struct AnalysisResult {
    // Statements validated before the first semantic error, with resolved
    // types filled into their WHERE comparisons
    std::vector<sql::Statement> statements;

    SchemaTable schema;
    UserTable users;

    // Non-fatal notices (duplicate grants)
    std::vector<Diagnostic> notices;

    // Set when analysis stopped on an error
    std::optional<Diagnostic> error;

    bool ok() const { return !error.has_value(); }
};

/// Walks a statement batch in source order against a schema table and a user
/// table built up along the way. Analysis stops at the first semantic error.
class SemanticAnalyzer {
public:
    SemanticAnalyzer() = default;

    // Tables start empty on every call and are moved into the result
    AnalysisResult analyze(std::vector<sql::Statement> statements);

private:
    Status check_statement(sql::Statement& statement);

    Status check_create_table(const sql::CreateTableStatement& stmt);
    Status check_create_user(const sql::CreateUserStatement& stmt);
    Status check_grant(const sql::GrantStatement& stmt);
    Status check_insert(const sql::InsertStatement& stmt);
    Status check_select(sql::SelectStatement& stmt);
    Status check_update(sql::UpdateStatement& stmt);
    Status check_delete(sql::DeleteStatement& stmt);

    // Recursive WHERE validation, left before right
    Status check_condition(sql::Condition& condition, const TableSchema& table);

    Result<const TableSchema*> lookup_table(const sql::Identifier& table) const;
    Result<const ColumnSchema*> lookup_column(const TableSchema& table,
                                              const sql::Identifier& column) const;

    static Diagnostic semantic_error(ErrorCode code, std::string message, SourceLocation location);

    SchemaTable schema_;
    UserTable users_;
    std::vector<Diagnostic> notices_;
};

} // namespace minisql::semantic
