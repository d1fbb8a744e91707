#include "minisql/json.h"

namespace minisql {

using nlohmann::json;

void to_json(json& j, const SourceLocation& location) {
    j = json{{"line", location.line}, {"column", location.column}};
}

void to_json(json& j, const Diagnostic& diagnostic) {
    j = json{
        {"phase", phase_to_string(diagnostic.phase())},
        {"severity", diagnostic.is_error() ? "error" : "warning"},
        {"code", static_cast<std::uint32_t>(diagnostic.code())},
        {"kind", error_code_to_string(diagnostic.code())},
        {"message", diagnostic.message()},
        {"location", diagnostic.location()},
        {"text", diagnostic.to_string()},
    };
}

void to_json(json& j, const CompilationResult& result) {
    j = json{
        {"ok", result.ok()},
        {"errors", result.error_count()},
        {"warnings", result.warning_count()},
        {"tokens", result.tokens},
        {"diagnostics", result.all_diagnostics()},
    };

    if (result.parsed) {
        j["parse"] = result.parse;
        j["analysis"] = result.analysis;
    } else {
        j["parse"] = nullptr;
        j["analysis"] = nullptr;
    }
}

} // namespace minisql

namespace minisql::sql {

using nlohmann::json;

void to_json(json& j, const Token& token) {
    j = json{
        {"type", token_type_name(token.type)},
        {"lexeme", token.lexeme},
        {"line", token.line},
        {"column", token.column},
    };
}

void to_json(json& j, const Identifier& identifier) {
    j = json{{"name", identifier.name}, {"location", identifier.location}};
}

void to_json(json& j, const Condition& condition) {
    std::visit(overloaded{
        [&j](const CompareCondition& c) {
            j = json{
                {"kind", "compare"},
                {"column", c.column},
                {"op", compare_op_symbol(c.op)},
                {"value", c.literal.lexeme},
                {"value_type", token_type_name(c.literal.type)},
            };
            if (c.resolved_type) {
                j["resolved_type"] = column_type_name(*c.resolved_type);
            } else {
                j["resolved_type"] = nullptr;
            }
        },
        [&j](const AndCondition& c) {
            j = json{{"kind", "and"}, {"left", *c.left}, {"right", *c.right}};
        },
        [&j](const OrCondition& c) {
            j = json{{"kind", "or"}, {"left", *c.left}, {"right", *c.right}};
        },
        [&j](const NotCondition& c) {
            j = json{{"kind", "not"}, {"operand", *c.operand}};
        },
    }, condition.node);

    j["location"] = condition.location;
}

namespace {

json where_to_json(const ConditionPtr& where) {
    if (!where) return nullptr;
    return *where;
}

} // namespace

void to_json(json& j, const Statement& statement) {
    j = json{{"kind", statement.kind_name()}, {"location", statement.location}};

    std::visit(overloaded{
        [&j](const CreateTableStatement& stmt) {
            json columns = json::array();
            for (const auto& column : stmt.columns) {
                columns.push_back({{"name", column.name}, {"type", column_type_name(column.type)}});
            }
            j["table"] = stmt.table;
            j["columns"] = std::move(columns);
        },
        [&j](const InsertStatement& stmt) {
            j["table"] = stmt.table;
            j["values"] = stmt.values;
        },
        [&j](const SelectStatement& stmt) {
            j["table"] = stmt.table;
            j["columns"] = stmt.columns;
            j["wildcard"] = stmt.is_wildcard();
            j["where"] = where_to_json(stmt.where_clause);
        },
        [&j](const UpdateStatement& stmt) {
            json assignments = json::array();
            for (const auto& assignment : stmt.assignments) {
                assignments.push_back({{"column", assignment.column}, {"value", assignment.value}});
            }
            j["table"] = stmt.table;
            j["assignments"] = std::move(assignments);
            j["where"] = where_to_json(stmt.where_clause);
        },
        [&j](const DeleteStatement& stmt) {
            j["table"] = stmt.table;
            j["where"] = where_to_json(stmt.where_clause);
        },
        [&j](const CreateUserStatement& stmt) {
            j["user"] = stmt.username;
            j["password"] = "***";
        },
        [&j](const GrantStatement& stmt) {
            j["privilege"] = privilege_name(stmt.privilege);
            j["table"] = stmt.table;
            j["user"] = stmt.user;
        },
    }, statement.node);
}

void to_json(json& j, const ParseResult& result) {
    j = json{
        {"ok", result.ok()},
        {"statements", result.statements},
        {"diagnostics", result.diagnostics},
    };
}

} // namespace minisql::sql

namespace minisql::semantic {

using nlohmann::json;

void to_json(json& j, const TableSchema& table) {
    json columns = json::array();
    for (const auto& column : table.columns()) {
        columns.push_back({{"name", column.name}, {"type", sql::column_type_name(column.type)}});
    }
    j = json{{"name", table.name()}, {"columns", std::move(columns)}};
}

void to_json(json& j, const SchemaTable& schema) {
    j = json::array();
    for (const auto& [name, table] : schema) {
        j.push_back(table);
    }
}

void to_json(json& j, const UserTable& users) {
    j = json::array();
    for (const auto& [name, record] : users) {
        json grants = json::array();
        for (const auto& permission : record.grants) {
            grants.push_back({{"table", permission.table},
                              {"privilege", sql::privilege_name(permission.privilege)}});
        }
        j.push_back({{"name", name}, {"grants", std::move(grants)}});
    }
}

void to_json(json& j, const AnalysisResult& result) {
    j = json{
        {"ok", result.ok()},
        {"validated_statements", result.statements},
        {"schema", result.schema},
        {"users", result.users},
        {"notices", result.notices},
    };

    if (result.error) {
        j["error"] = *result.error;
    } else {
        j["error"] = nullptr;
    }
}

} // namespace minisql::semantic
