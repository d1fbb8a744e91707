#include "minisql/semantic/catalog.h"

#include <algorithm>

namespace minisql::semantic {

bool TableSchema::add_column(std::string name, ColumnType type) {
    if (has_column(name)) return false;
    columns_.push_back({std::move(name), type});
    return true;
}

const ColumnSchema* TableSchema::find_column(const std::string& name) const {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [&name](const ColumnSchema& c) { return c.name == name; });
    return it == columns_.end() ? nullptr : &*it;
}

bool SchemaTable::add_table(TableSchema schema) {
    std::string name = schema.name();
    return tables_.emplace(std::move(name), std::move(schema)).second;
}

const TableSchema* SchemaTable::find_table(const std::string& name) const {
    auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : &it->second;
}

bool UserTable::add_user(const std::string& name, std::string password) {
    return users_.emplace(name, UserRecord{std::move(password), {}}).second;
}

bool UserTable::grant(const std::string& user, const std::string& table, Privilege privilege) {
    auto it = users_.find(user);
    if (it == users_.end()) return false;
    return it->second.grants.insert(Permission{table, privilege}).second;
}

const UserRecord* UserTable::find_user(const std::string& name) const {
    auto it = users_.find(name);
    return it == users_.end() ? nullptr : &it->second;
}

bool is_assignable(ColumnType column, const sql::Token& literal) {
    switch (column) {
        case ColumnType::INT:
            return literal.type == sql::TokenType::NUMBER &&
                   literal.lexeme.find('.') == std::string::npos;
        case ColumnType::FLOAT:
            return literal.type == sql::TokenType::NUMBER;
        case ColumnType::TEXT:
            return literal.type == sql::TokenType::STRING;
    }
    return false;
}

std::string describe_literal(const sql::Token& literal) {
    auto type = sql::literal_type(literal);
    if (!type) return "'" + literal.lexeme + "'";
    return std::string(sql::column_type_name(*type)) + " literal " + literal.lexeme;
}

} // namespace minisql::semantic
