#pragma once

#include "minisql/diagnostic.h"
#include "minisql/result.h"
#include "minisql/sql/ast.h"
#include "minisql/sql/token.h"

#include <cstddef>
#include <string>
#include <vector>

namespace minisql::sql {

struct ParserConfig {
    // Maximum nesting of parenthesised WHERE conditions
    std::size_t max_condition_depth{256};
};

struct ParseResult {
    std::vector<Statement> statements;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return diagnostics.empty(); }
};

/// Recursive descent parser with panic-mode recovery.
///
/// A syntax error inside one statement is recorded, the parser skips to the
/// next `;` or statement keyword and carries on, so a single call to parse()
/// returns every well-formed statement of the batch together with every
/// syntax diagnostic.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserConfig config = {});

    // Parses the whole batch of statements
    ParseResult parse();

    // Parses one statement, no recovery
    Result<Statement> parse_statement();

private:
    // Statements
    Result<Statement> parse_create();
    Result<Statement> parse_create_table(SourceLocation location);
    Result<Statement> parse_create_user(SourceLocation location);
    Result<Statement> parse_insert();
    Result<Statement> parse_select();
    Result<Statement> parse_update();
    Result<Statement> parse_delete();
    Result<Statement> parse_grant();

    // WHERE conditions, one function per precedence level
    Result<ConditionPtr> parse_condition();
    Result<ConditionPtr> parse_or_condition();
    Result<ConditionPtr> parse_and_condition();
    Result<ConditionPtr> parse_not_condition();
    Result<ConditionPtr> parse_primary_condition();
    Result<ConditionPtr> parse_comparison();

    Result<Token> parse_literal(const std::string& message);
    Result<Identifier> parse_identifier(const std::string& message);
    Result<CompareOp> parse_compare_op();
    Result<Privilege> parse_privilege();

    // Error recovery
    void synchronize();
    bool is_statement_start(TokenType type) const;

    // Helpers
    const Token& current() const;
    const Token& previous() const;
    const Token& advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    Result<Token> consume(TokenType type, const std::string& message);
    bool is_at_end() const;

    Diagnostic error(const std::string& message) const;
    Diagnostic error(const Token& token, const std::string& message) const;
    Diagnostic nesting_error(SourceLocation location) const;

    std::vector<Token> tokens_;
    ParserConfig config_;
    std::size_t current_{0};
    std::size_t depth_{0};
};

} // namespace minisql::sql
