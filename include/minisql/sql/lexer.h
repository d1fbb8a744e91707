#pragma once

#include "minisql/diagnostic.h"
#include "minisql/sql/token.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace minisql::sql {

/// What the lexer does after reporting an illegal character,
/// an unclosed string or an unterminated block comment.
enum class LexErrorPolicy {
    Recover,  // emit an ILLEGAL token and keep scanning
    Abort,    // stop at the first error
};

struct LexerConfig {
    LexErrorPolicy error_policy{LexErrorPolicy::Recover};
};

class Lexer {
public:
    explicit Lexer(std::string_view source, LexerConfig config = {});

    // Tokenizes the whole input.
    // The returned vector always ends with an END_OF_FILE token.
    std::vector<Token> tokenize();

    // Next token, skipping comments and whitespace
    Token next_token();

    bool has_next() const;

    // Lexical diagnostics collected so far, in source order
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    bool aborted() const { return aborted_; }

private:
    void skip_whitespace();
    void skip_line_comment();
    bool skip_block_comment();

    Token scan_identifier();
    Token scan_number();
    Token scan_string();

    Token make_token(TokenType type) const;
    Token illegal(ErrorCode code, std::string message);

    char current() const;
    char peek_char() const;
    char advance();
    bool match(char expected);

    bool is_at_end() const;
    bool is_alpha(char c) const;
    bool is_digit(char c) const;
    bool is_alphanumeric(char c) const;

    std::string_view source_;
    LexerConfig config_;
    std::size_t start_{0};
    std::size_t current_{0};
    std::size_t line_{1};
    std::size_t column_{1};
    std::size_t start_line_{1};
    std::size_t start_column_{1};
    bool aborted_{false};
    std::vector<Diagnostic> diagnostics_;

    // Keyword table, upper-case keys
    static const std::unordered_map<std::string, TokenType> keywords_;
};

} // namespace minisql::sql
