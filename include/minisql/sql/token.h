#pragma once

#include "minisql/diagnostic.h"

#include <cstddef>
#include <string>

namespace minisql::sql {

enum class TokenType {
    // Keywords
    SELECT,
    FROM,
    WHERE,
    INSERT,
    INTO,
    VALUES,
    UPDATE,
    SET,
    DELETE,
    CREATE,
    TABLE,
    USER,
    IDENTIFIED,
    BY,
    GRANT,
    ON,
    TO,
    AND,
    OR,
    NOT,

    // INT, FLOAT, TEXT
    TYPE,

    // Operators
    EQUAL,           // =
    NOT_EQUAL,       // != or <>
    LESS,            // <
    LESS_EQUAL,      // <=
    GREATER,         // >
    GREATER_EQUAL,   // >=
    PLUS,            // +
    MINUS,           // -
    STAR,            // *
    SLASH,           // /

    // Delimiters
    LEFT_PAREN,      // (
    RIGHT_PAREN,     // )
    COMMA,           // ,
    SEMICOLON,       // ;

    // Literals
    IDENTIFIER,      // table names, column names, user names
    NUMBER,          // 42, 85.5
    STRING,          // 'text'

    // Special
    ILLEGAL,
    END_OF_FILE
};

[[nodiscard]] const char* token_type_name(TokenType type) noexcept;

struct Token {
    TokenType type;
    std::string lexeme;  // Source text of the token, not normalized
    std::size_t line;
    std::size_t column;

    Token(TokenType t, std::string lex, std::size_t l, std::size_t c)
        : type(t), lexeme(std::move(lex)), line(l), column(c) {}

    bool is_keyword() const {
        return type >= TokenType::SELECT && type <= TokenType::NOT;
    }

    bool is_operator() const {
        return type >= TokenType::EQUAL && type <= TokenType::SLASH;
    }

    bool is_literal() const {
        return type == TokenType::NUMBER || type == TokenType::STRING;
    }

    SourceLocation location() const { return {line, column}; }

    std::string to_string() const;
};

} // namespace minisql::sql
