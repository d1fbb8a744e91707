#pragma once

#include "minisql/sql/ast.h"
#include "minisql/sql/token.h"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace minisql::semantic {

using sql::ColumnType;
using sql::Privilege;

// ==============================================================================
// Schema table
// ==============================================================================

struct ColumnSchema {
    std::string name;
    ColumnType type;
};

/// Columns of one table in declaration order.
class TableSchema {
public:
    TableSchema() = default;
    explicit TableSchema(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    const std::vector<ColumnSchema>& columns() const { return columns_; }
    std::size_t column_count() const { return columns_.size(); }

    // false if a column with this name is already present
    bool add_column(std::string name, ColumnType type);

    const ColumnSchema* find_column(const std::string& name) const;
    bool has_column(const std::string& name) const { return find_column(name) != nullptr; }

private:
    std::string name_;
    std::vector<ColumnSchema> columns_;
};

class SchemaTable {
public:
    // false if the table already exists; the schema is not replaced
    bool add_table(TableSchema schema);

    const TableSchema* find_table(const std::string& name) const;
    bool has_table(const std::string& name) const { return find_table(name) != nullptr; }

    std::size_t size() const { return tables_.size(); }
    bool empty() const { return tables_.empty(); }
    void clear() { tables_.clear(); }

    // Iteration in name order
    auto begin() const { return tables_.begin(); }
    auto end() const { return tables_.end(); }

private:
    std::map<std::string, TableSchema> tables_;
};

// ==============================================================================
// User table
// ==============================================================================

struct Permission {
    std::string table;
    Privilege privilege;

    bool operator<(const Permission& other) const {
        if (table != other.table) return table < other.table;
        return privilege < other.privilege;
    }

    bool operator==(const Permission& other) const = default;
};

struct UserRecord {
    std::string password;
    std::set<Permission> grants;

    bool has_grant(const std::string& table, Privilege privilege) const {
        return grants.count(Permission{table, privilege}) > 0;
    }
};

class UserTable {
public:
    // false if the user already exists
    bool add_user(const std::string& name, std::string password);

    // false if the pair was already granted; the set is left unchanged
    bool grant(const std::string& user, const std::string& table, Privilege privilege);

    const UserRecord* find_user(const std::string& name) const;
    bool has_user(const std::string& name) const { return find_user(name) != nullptr; }

    std::size_t size() const { return users_.size(); }
    bool empty() const { return users_.empty(); }
    void clear() { users_.clear(); }

    auto begin() const { return users_.begin(); }
    auto end() const { return users_.end(); }

private:
    std::map<std::string, UserRecord> users_;
};

// ==============================================================================
// Type compatibility
// ==============================================================================

/// INT accepts a NUMBER without a decimal point, FLOAT accepts any NUMBER,
/// TEXT accepts a STRING.
bool is_assignable(ColumnType column, const sql::Token& literal);

/// "INT literal 42", "FLOAT literal 85.5", "TEXT literal 'Ali'"
std::string describe_literal(const sql::Token& literal);

} // namespace minisql::semantic
