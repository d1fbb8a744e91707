#pragma once

#include "minisql/compiler.h"
#include "minisql/diagnostic.h"
#include "minisql/semantic/analyzer.h"
#include "minisql/semantic/catalog.h"
#include "minisql/sql/ast.h"
#include "minisql/sql/parser.h"
#include "minisql/sql/token.h"

#include <nlohmann/json.hpp>

// nlohmann::json conversions, found through ADL:
//   nlohmann::json j = statement;
// Passwords never appear in the output.

namespace minisql {

void to_json(nlohmann::json& j, const SourceLocation& location);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);
void to_json(nlohmann::json& j, const CompilationResult& result);

} // namespace minisql

namespace minisql::sql {

void to_json(nlohmann::json& j, const Token& token);
void to_json(nlohmann::json& j, const Identifier& identifier);
void to_json(nlohmann::json& j, const Condition& condition);
void to_json(nlohmann::json& j, const Statement& statement);
void to_json(nlohmann::json& j, const ParseResult& result);

} // namespace minisql::sql

namespace minisql::semantic {

void to_json(nlohmann::json& j, const TableSchema& table);
void to_json(nlohmann::json& j, const SchemaTable& schema);
void to_json(nlohmann::json& j, const UserTable& users);
void to_json(nlohmann::json& j, const AnalysisResult& result);

} // namespace minisql::semantic
