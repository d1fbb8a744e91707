#include "minisql/sql/lexer.h"

#include <cctype>

namespace minisql::sql {

// Keyword table
const std::unordered_map<std::string, TokenType> Lexer::keywords_ = {
    {"SELECT", TokenType::SELECT},
    {"FROM", TokenType::FROM},
    {"WHERE", TokenType::WHERE},
    {"INSERT", TokenType::INSERT},
    {"INTO", TokenType::INTO},
    {"VALUES", TokenType::VALUES},
    {"UPDATE", TokenType::UPDATE},
    {"SET", TokenType::SET},
    {"DELETE", TokenType::DELETE},
    {"CREATE", TokenType::CREATE},
    {"TABLE", TokenType::TABLE},
    {"USER", TokenType::USER},
    {"IDENTIFIED", TokenType::IDENTIFIED},
    {"BY", TokenType::BY},
    {"GRANT", TokenType::GRANT},
    {"ON", TokenType::ON},
    {"TO", TokenType::TO},
    {"AND", TokenType::AND},
    {"OR", TokenType::OR},
    {"NOT", TokenType::NOT},
    {"INT", TokenType::TYPE},
    {"FLOAT", TokenType::TYPE},
    {"TEXT", TokenType::TYPE}
};

Lexer::Lexer(std::string_view source, LexerConfig config)
    : source_(source), config_(config) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        Token token = next_token();
        bool done = token.type == TokenType::END_OF_FILE;
        tokens.push_back(std::move(token));
        if (done) break;
    }

    return tokens;
}

Token Lexer::next_token() {
    if (aborted_) {
        return Token(TokenType::END_OF_FILE, "", line_, column_);
    }

    char c = '\0';
    while (true) {
        skip_whitespace();

        if (is_at_end()) {
            return Token(TokenType::END_OF_FILE, "", line_, column_);
        }

        start_ = current_;
        start_line_ = line_;
        start_column_ = column_;
        c = advance();

        // Comments: -- to end of line, ## ... ## as a block
        if (c == '-' && match('-')) {
            skip_line_comment();
            continue;
        }
        if (c == '#' && match('#')) {
            if (!skip_block_comment()) {
                diagnostics_.emplace_back(Phase::Lexical, ErrorCode::UnterminatedComment,
                                          "Unterminated multi-line comment",
                                          SourceLocation{start_line_, start_column_});
                if (config_.error_policy == LexErrorPolicy::Abort) {
                    aborted_ = true;
                    return Token(TokenType::END_OF_FILE, "", start_line_, start_column_);
                }
            }
            continue;
        }
        break;
    }

    // Identifiers and keywords
    if (is_alpha(c)) {
        return scan_identifier();
    }

    // Numbers
    if (is_digit(c)) {
        return scan_number();
    }

    // String literals
    if (c == '\'') {
        return scan_string();
    }

    // Operators and punctuation
    switch (c) {
        case '(': return make_token(TokenType::LEFT_PAREN);
        case ')': return make_token(TokenType::RIGHT_PAREN);
        case ',': return make_token(TokenType::COMMA);
        case ';': return make_token(TokenType::SEMICOLON);
        case '+': return make_token(TokenType::PLUS);
        case '-': return make_token(TokenType::MINUS);
        case '*': return make_token(TokenType::STAR);
        case '/': return make_token(TokenType::SLASH);
        case '=': return make_token(TokenType::EQUAL);
        case '<': {
            if (match('=')) {
                return make_token(TokenType::LESS_EQUAL);
            } else if (match('>')) {
                return make_token(TokenType::NOT_EQUAL);
            }
            return make_token(TokenType::LESS);
        }
        case '>': {
            if (match('=')) {
                return make_token(TokenType::GREATER_EQUAL);
            }
            return make_token(TokenType::GREATER);
        }
        case '!': {
            if (match('=')) {
                return make_token(TokenType::NOT_EQUAL);
            }
            break;
        }
        default:
            break;
    }

    return illegal(ErrorCode::IllegalCharacter,
                   std::string("Invalid character '") + c + "'");
}

bool Lexer::has_next() const {
    return !aborted_ && !is_at_end();
}

Token Lexer::scan_identifier() {
    while (is_alphanumeric(current())) {
        advance();
    }

    std::string text(source_.substr(start_, current_ - start_));

    // Keywords are case-insensitive, the lexeme is kept as written
    std::string upper_text = text;
    for (char& ch : upper_text) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }

    auto it = keywords_.find(upper_text);
    if (it != keywords_.end()) {
        return make_token(it->second);
    }

    return make_token(TokenType::IDENTIFIER);
}

Token Lexer::scan_number() {
    while (is_digit(current())) {
        advance();
    }

    // Fractional part; "85." is still a number
    if (current() == '.') {
        advance();
        while (is_digit(current())) {
            advance();
        }
    }

    return make_token(TokenType::NUMBER);
}

Token Lexer::scan_string() {
    // Opening quote already consumed
    while (!is_at_end() && current() != '\'') {
        advance();
    }

    if (is_at_end()) {
        return illegal(ErrorCode::UnterminatedString, "Unclosed string literal");
    }

    // Closing quote
    advance();

    return make_token(TokenType::STRING);
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        switch (current()) {
            case ' ':
            case '\r':
            case '\t':
            case '\n':
                advance();
                break;
            default:
                return;
        }
    }
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && current() != '\n') {
        advance();
    }
}

bool Lexer::skip_block_comment() {
    while (!is_at_end()) {
        if (current() == '#' && peek_char() == '#') {
            advance();
            advance();
            return true;
        }
        advance();
    }
    return false;
}

Token Lexer::make_token(TokenType type) const {
    return Token(type, std::string(source_.substr(start_, current_ - start_)),
                 start_line_, start_column_);
}

Token Lexer::illegal(ErrorCode code, std::string message) {
    diagnostics_.emplace_back(Phase::Lexical, code, std::move(message),
                              SourceLocation{start_line_, start_column_});

    if (config_.error_policy == LexErrorPolicy::Abort) {
        aborted_ = true;
        return Token(TokenType::END_OF_FILE, "", start_line_, start_column_);
    }
    return make_token(TokenType::ILLEGAL);
}

char Lexer::current() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char Lexer::peek_char() const {
    if (current_ + 1 >= source_.length()) return '\0';
    return source_[current_ + 1];
}

char Lexer::advance() {
    char c = source_[current_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (is_at_end()) return false;
    if (current() != expected) return false;

    advance();
    return true;
}

bool Lexer::is_at_end() const {
    return current_ >= source_.length();
}

bool Lexer::is_alpha(char c) const {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool Lexer::is_digit(char c) const {
    return c >= '0' && c <= '9';
}

bool Lexer::is_alphanumeric(char c) const {
    return is_alpha(c) || is_digit(c);
}

const char* token_type_name(TokenType type) noexcept {
    switch (type) {
        case TokenType::SELECT: return "SELECT";
        case TokenType::FROM: return "FROM";
        case TokenType::WHERE: return "WHERE";
        case TokenType::INSERT: return "INSERT";
        case TokenType::INTO: return "INTO";
        case TokenType::VALUES: return "VALUES";
        case TokenType::UPDATE: return "UPDATE";
        case TokenType::SET: return "SET";
        case TokenType::DELETE: return "DELETE";
        case TokenType::CREATE: return "CREATE";
        case TokenType::TABLE: return "TABLE";
        case TokenType::USER: return "USER";
        case TokenType::IDENTIFIED: return "IDENTIFIED";
        case TokenType::BY: return "BY";
        case TokenType::GRANT: return "GRANT";
        case TokenType::ON: return "ON";
        case TokenType::TO: return "TO";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::TYPE: return "TYPE";
        case TokenType::EQUAL: return "EQUAL";
        case TokenType::NOT_EQUAL: return "NOT_EQUAL";
        case TokenType::LESS: return "LESS";
        case TokenType::LESS_EQUAL: return "LESS_EQUAL";
        case TokenType::GREATER: return "GREATER";
        case TokenType::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::LEFT_PAREN: return "LEFT_PAREN";
        case TokenType::RIGHT_PAREN: return "RIGHT_PAREN";
        case TokenType::COMMA: return "COMMA";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::ILLEGAL: return "ILLEGAL";
        case TokenType::END_OF_FILE: return "END_OF_FILE";
    }
    return "UNKNOWN";
}

std::string Token::to_string() const {
    return std::string("Token(") + token_type_name(type) +
           ", '" + lexeme + "', " + std::to_string(line) + ":" +
           std::to_string(column) + ")";
}

} // namespace minisql::sql
