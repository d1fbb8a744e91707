#include "minisql/sql/parser.h"

#include "internal/utils/logger.hpp"

namespace minisql::sql {

Parser::Parser(std::vector<Token> tokens, ParserConfig config)
    : config_(config) {
    // ILLEGAL tokens are already reported by the lexer
    tokens_.reserve(tokens.size() + 1);
    for (auto& token : tokens) {
        if (token.type != TokenType::ILLEGAL) {
            tokens_.push_back(std::move(token));
        }
    }

    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_FILE) {
        std::size_t line = tokens_.empty() ? 1 : tokens_.back().line;
        std::size_t column = tokens_.empty() ? 1 : tokens_.back().column + tokens_.back().lexeme.size();
        tokens_.emplace_back(TokenType::END_OF_FILE, "", line, column);
    }
}

ParseResult Parser::parse() {
    ParseResult result;

    while (!is_at_end()) {
        auto statement = parse_statement();

        if (statement) {
            result.statements.push_back(std::move(statement).value());
            continue;
        }

        const Diagnostic& diagnostic = statement.error();
        log::debug("Syntax error: {}", diagnostic.to_string());
        result.diagnostics.push_back(diagnostic);

        synchronize();
        log::debug("Parser resynchronized at line {}, column {}",
                   current().line, current().column);
    }

    return result;
}

Result<Statement> Parser::parse_statement() {
    depth_ = 0;

    switch (current().type) {
        case TokenType::CREATE:
            return parse_create();
        case TokenType::INSERT:
            return parse_insert();
        case TokenType::SELECT:
            return parse_select();
        case TokenType::UPDATE:
            return parse_update();
        case TokenType::DELETE:
            return parse_delete();
        case TokenType::GRANT:
            return parse_grant();
        default:
            return Err<Statement>(error(
                "Expected a statement (CREATE, INSERT, SELECT, UPDATE, DELETE, GRANT)"));
    }
}

Result<Statement> Parser::parse_create() {
    SourceLocation location = advance().location();

    if (check(TokenType::TABLE)) {
        return parse_create_table(location);
    }
    if (check(TokenType::USER)) {
        return parse_create_user(location);
    }
    return Err<Statement>(error("Expected 'TABLE' or 'USER' after 'CREATE'"));
}

Result<Statement> Parser::parse_create_table(SourceLocation location) {
    advance(); // TABLE

    auto table = parse_identifier("Expected table name after 'TABLE'");
    if (!table) return Err<Statement>(table.error());

    auto lparen = consume(TokenType::LEFT_PAREN, "Expected '(' after table name");
    if (!lparen) return Err<Statement>(lparen.error());

    CreateTableStatement stmt{std::move(*table), {}};

    // The column list may be empty: CREATE TABLE t ();
    if (!check(TokenType::RIGHT_PAREN)) {
        do {
            auto column = parse_identifier("Expected column name");
            if (!column) return Err<Statement>(column.error());

            auto type_token = consume(TokenType::TYPE,
                                      "Expected data type (INT, FLOAT, TEXT) after column name");
            if (!type_token) return Err<Statement>(type_token.error());

            auto type = parse_column_type(type_token->lexeme);
            if (!type) {
                return Err<Statement>(error(*type_token, "Unknown data type"));
            }

            stmt.columns.push_back({std::move(*column), *type});
        } while (match(TokenType::COMMA));
    }

    auto rparen = consume(TokenType::RIGHT_PAREN, "Expected ')' after column definitions");
    if (!rparen) return Err<Statement>(rparen.error());

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after CREATE TABLE statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{std::move(stmt), location};
}

Result<Statement> Parser::parse_create_user(SourceLocation location) {
    advance(); // USER

    auto username = parse_identifier("Expected user name after 'USER'");
    if (!username) return Err<Statement>(username.error());

    auto identified = consume(TokenType::IDENTIFIED, "Expected 'IDENTIFIED' after user name");
    if (!identified) return Err<Statement>(identified.error());

    auto by = consume(TokenType::BY, "Expected 'BY' after 'IDENTIFIED'");
    if (!by) return Err<Statement>(by.error());

    auto password = consume(TokenType::STRING, "Expected password string after 'IDENTIFIED BY'");
    if (!password) return Err<Statement>(password.error());

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after CREATE USER statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    // String lexemes include the quotes
    const std::string& quoted = password->lexeme;
    std::string text = quoted.size() >= 2 ? quoted.substr(1, quoted.size() - 2) : quoted;

    return Statement{CreateUserStatement{std::move(*username), std::move(text)}, location};
}

Result<Statement> Parser::parse_insert() {
    SourceLocation location = advance().location();

    auto into = consume(TokenType::INTO, "Expected 'INTO' after 'INSERT'");
    if (!into) return Err<Statement>(into.error());

    auto table = parse_identifier("Expected table name after 'INTO'");
    if (!table) return Err<Statement>(table.error());

    auto values = consume(TokenType::VALUES, "Expected 'VALUES' after table name");
    if (!values) return Err<Statement>(values.error());

    auto lparen = consume(TokenType::LEFT_PAREN, "Expected '(' after 'VALUES'");
    if (!lparen) return Err<Statement>(lparen.error());

    InsertStatement stmt{std::move(*table), {}};

    do {
        auto literal = parse_literal("Expected a value (number or string)");
        if (!literal) return Err<Statement>(literal.error());
        stmt.values.push_back(std::move(*literal));
    } while (match(TokenType::COMMA));

    auto rparen = consume(TokenType::RIGHT_PAREN, "Expected ')' after value list");
    if (!rparen) return Err<Statement>(rparen.error());

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after INSERT statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{std::move(stmt), location};
}

Result<Statement> Parser::parse_select() {
    SourceLocation location = advance().location();

    SelectStatement stmt;

    if (match(TokenType::STAR)) {
        // SELECT * selects every column
        stmt.columns.push_back(Identifier{"*", previous().location()});
    } else {
        do {
            auto column = parse_identifier("Expected column name in SELECT list");
            if (!column) return Err<Statement>(column.error());
            stmt.columns.push_back(std::move(*column));
        } while (match(TokenType::COMMA));
    }

    auto from = consume(TokenType::FROM, "Expected 'FROM' after SELECT list");
    if (!from) return Err<Statement>(from.error());

    auto table = parse_identifier("Expected table name after 'FROM'");
    if (!table) return Err<Statement>(table.error());
    stmt.table = std::move(*table);

    if (match(TokenType::WHERE)) {
        auto condition = parse_condition();
        if (!condition) return Err<Statement>(condition.error());
        stmt.where_clause = std::move(*condition);
    }

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after SELECT statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{std::move(stmt), location};
}

Result<Statement> Parser::parse_update() {
    SourceLocation location = advance().location();

    auto table = parse_identifier("Expected table name after 'UPDATE'");
    if (!table) return Err<Statement>(table.error());

    auto set = consume(TokenType::SET, "Expected 'SET' after table name");
    if (!set) return Err<Statement>(set.error());

    UpdateStatement stmt;
    stmt.table = std::move(*table);

    // col1 = val1, col2 = val2, ...
    do {
        auto column = parse_identifier("Expected column name in SET clause");
        if (!column) return Err<Statement>(column.error());

        auto equal = consume(TokenType::EQUAL, "Expected '=' after column name");
        if (!equal) return Err<Statement>(equal.error());

        auto value = parse_literal("Expected a value (number or string) after '='");
        if (!value) return Err<Statement>(value.error());

        stmt.assignments.push_back({std::move(*column), std::move(*value)});
    } while (match(TokenType::COMMA));

    if (match(TokenType::WHERE)) {
        auto condition = parse_condition();
        if (!condition) return Err<Statement>(condition.error());
        stmt.where_clause = std::move(*condition);
    }

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after UPDATE statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{std::move(stmt), location};
}

Result<Statement> Parser::parse_delete() {
    SourceLocation location = advance().location();

    auto from = consume(TokenType::FROM, "Expected 'FROM' after 'DELETE'");
    if (!from) return Err<Statement>(from.error());

    auto table = parse_identifier("Expected table name after 'FROM'");
    if (!table) return Err<Statement>(table.error());

    DeleteStatement stmt{std::move(*table), nullptr};

    if (match(TokenType::WHERE)) {
        auto condition = parse_condition();
        if (!condition) return Err<Statement>(condition.error());
        stmt.where_clause = std::move(*condition);
    }

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after DELETE statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{std::move(stmt), location};
}

Result<Statement> Parser::parse_grant() {
    SourceLocation location = advance().location();

    auto privilege = parse_privilege();
    if (!privilege) return Err<Statement>(privilege.error());

    auto on = consume(TokenType::ON, "Expected 'ON' after privilege");
    if (!on) return Err<Statement>(on.error());

    auto table = parse_identifier("Expected table name after 'ON'");
    if (!table) return Err<Statement>(table.error());

    auto to = consume(TokenType::TO, "Expected 'TO' after table name");
    if (!to) return Err<Statement>(to.error());

    auto user = parse_identifier("Expected user name after 'TO'");
    if (!user) return Err<Statement>(user.error());

    auto semicolon = consume(TokenType::SEMICOLON, "Expected ';' after GRANT statement");
    if (!semicolon) return Err<Statement>(semicolon.error());

    return Statement{GrantStatement{*privilege, std::move(*table), std::move(*user)}, location};
}

// ==============================================================================
// Conditions
// ==============================================================================

Result<ConditionPtr> Parser::parse_condition() {
    return parse_or_condition();
}

// AndCond ( OR AndCond )*
Result<ConditionPtr> Parser::parse_or_condition() {
    auto left = parse_and_condition();
    if (!left) return left;

    ConditionPtr expr = std::move(*left);

    while (match(TokenType::OR)) {
        SourceLocation location = previous().location();
        auto right = parse_and_condition();
        if (!right) return right;
        expr = make_or(std::move(expr), std::move(*right));
        if (expr->height > config_.max_condition_depth) {
            return Err<ConditionPtr>(nesting_error(location));
        }
    }

    return expr;
}

// NotCond ( AND NotCond )*
Result<ConditionPtr> Parser::parse_and_condition() {
    auto left = parse_not_condition();
    if (!left) return left;

    ConditionPtr expr = std::move(*left);

    while (match(TokenType::AND)) {
        SourceLocation location = previous().location();
        auto right = parse_not_condition();
        if (!right) return right;
        expr = make_and(std::move(expr), std::move(*right));
        if (expr->height > config_.max_condition_depth) {
            return Err<ConditionPtr>(nesting_error(location));
        }
    }

    return expr;
}

// NOT Primary | Primary
Result<ConditionPtr> Parser::parse_not_condition() {
    if (check(TokenType::NOT)) {
        SourceLocation location = advance().location();

        auto operand = parse_primary_condition();
        if (!operand) return operand;

        auto negated = make_not(std::move(*operand), location);
        if (negated->height > config_.max_condition_depth) {
            return Err<ConditionPtr>(nesting_error(location));
        }
        return negated;
    }

    return parse_primary_condition();
}

// '(' Condition ')' | Comparison
Result<ConditionPtr> Parser::parse_primary_condition() {
    if (check(TokenType::LEFT_PAREN)) {
        if (depth_ >= config_.max_condition_depth) {
            return Err<ConditionPtr>(nesting_error(current().location()));
        }

        advance();
        ++depth_;

        auto inner = parse_condition();
        if (!inner) return inner;

        auto rparen = consume(TokenType::RIGHT_PAREN, "Expected ')' after condition");
        if (!rparen) return Err<ConditionPtr>(rparen.error());

        --depth_;
        return inner;
    }

    return parse_comparison();
}

// id CompareOp literal
Result<ConditionPtr> Parser::parse_comparison() {
    auto column = parse_identifier("Expected column name in condition");
    if (!column) return Err<ConditionPtr>(column.error());

    auto op = parse_compare_op();
    if (!op) return Err<ConditionPtr>(op.error());

    auto literal = parse_literal("Expected a value (number or string) after comparison operator");
    if (!literal) return Err<ConditionPtr>(literal.error());

    return make_compare(std::move(*column), *op, std::move(*literal));
}

// ==============================================================================
// Terminals
// ==============================================================================

Result<Token> Parser::parse_literal(const std::string& message) {
    if (check(TokenType::NUMBER) || check(TokenType::STRING)) {
        return advance();
    }
    return Err<Token>(error(message));
}

Result<Identifier> Parser::parse_identifier(const std::string& message) {
    auto token = consume(TokenType::IDENTIFIER, message);
    if (!token) return Err<Identifier>(token.error());
    return Identifier{token->lexeme, token->location()};
}

Result<CompareOp> Parser::parse_compare_op() {
    CompareOp op;

    switch (current().type) {
        case TokenType::EQUAL: op = CompareOp::EQUAL; break;
        case TokenType::NOT_EQUAL: op = CompareOp::NOT_EQUAL; break;
        case TokenType::LESS: op = CompareOp::LESS; break;
        case TokenType::LESS_EQUAL: op = CompareOp::LESS_EQUAL; break;
        case TokenType::GREATER: op = CompareOp::GREATER; break;
        case TokenType::GREATER_EQUAL: op = CompareOp::GREATER_EQUAL; break;
        default:
            return Err<CompareOp>(error("Expected comparison operator (=, !=, <, <=, >, >=)"));
    }

    advance();
    return op;
}

Result<Privilege> Parser::parse_privilege() {
    Privilege privilege;

    switch (current().type) {
        case TokenType::SELECT: privilege = Privilege::SELECT; break;
        case TokenType::INSERT: privilege = Privilege::INSERT; break;
        case TokenType::UPDATE: privilege = Privilege::UPDATE; break;
        case TokenType::DELETE: privilege = Privilege::DELETE; break;
        default:
            return Err<Privilege>(error(
                "Expected privilege (SELECT, INSERT, UPDATE, DELETE) after 'GRANT'"));
    }

    advance();
    return privilege;
}

// ==============================================================================
// Panic-mode recovery
// ==============================================================================

// Always consumes at least one token, then stops right after a ';'
// or in front of a token that starts a statement.
void Parser::synchronize() {
    advance();

    while (!is_at_end()) {
        if (previous().type == TokenType::SEMICOLON) return;
        if (is_statement_start(current().type)) return;
        advance();
    }
}

bool Parser::is_statement_start(TokenType type) const {
    switch (type) {
        case TokenType::CREATE:
        case TokenType::INSERT:
        case TokenType::SELECT:
        case TokenType::UPDATE:
        case TokenType::DELETE:
        case TokenType::GRANT:
            return true;
        default:
            return false;
    }
}

// ==============================================================================
// Utility methods
// ==============================================================================

const Token& Parser::current() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ - 1];
}

const Token& Parser::advance() {
    if (is_at_end()) return current();
    current_++;
    return previous();
}

bool Parser::check(TokenType type) const {
    if (is_at_end()) return false;
    return current().type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

Result<Token> Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();
    return Err<Token>(error(message));
}

bool Parser::is_at_end() const {
    return current().type == TokenType::END_OF_FILE;
}

Diagnostic Parser::error(const std::string& message) const {
    return error(current(), message);
}

Diagnostic Parser::error(const Token& token, const std::string& message) const {
    if (token.type == TokenType::END_OF_FILE) {
        return Diagnostic(Phase::Syntax, ErrorCode::UnexpectedEndOfInput,
                          message + " (at end of input)", token.location());
    }
    return Diagnostic(Phase::Syntax, ErrorCode::UnexpectedToken,
                      message + ", but found '" + token.lexeme + "'", token.location());
}

// Bounds both parenthesised nesting and the height of the built tree
Diagnostic Parser::nesting_error(SourceLocation location) const {
    return Diagnostic(Phase::Syntax, ErrorCode::NestingTooDeep,
                      "Condition nesting exceeds " + std::to_string(config_.max_condition_depth) + " levels",
                      location);
}

} // namespace minisql::sql
