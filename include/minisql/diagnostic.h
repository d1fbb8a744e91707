#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace minisql {

/// 1-based position in the source text. Column 0 means "no finer position".
struct SourceLocation {
    std::size_t line{0};
    std::size_t column{0};

    bool operator==(const SourceLocation&) const = default;
};

enum class Phase : std::uint8_t {
    Lexical,
    Syntax,
    Semantic,
};

enum class Severity : std::uint8_t {
    Error,
    Warning,
};

enum class ErrorCode : std::uint32_t {
    // Lexical
    IllegalCharacter = 100,
    UnterminatedString = 101,
    UnterminatedComment = 102,

    // Syntax
    UnexpectedToken = 200,
    UnexpectedEndOfInput = 201,
    NestingTooDeep = 202,

    // Semantic
    DuplicateTable = 300,
    DuplicateColumn = 301,
    DuplicateUser = 302,
    DuplicateGrant = 303,
    UnknownTable = 310,
    UnknownColumn = 311,
    UnknownUser = 312,
    ArityMismatch = 320,
    TypeMismatch = 321,
};

[[nodiscard]] constexpr const char* phase_to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Lexical: return "Lexical";
        case Phase::Syntax: return "Syntax";
        case Phase::Semantic: return "Semantic";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::IllegalCharacter: return "illegal character";
        case ErrorCode::UnterminatedString: return "unterminated string";
        case ErrorCode::UnterminatedComment: return "unterminated comment";
        case ErrorCode::UnexpectedToken: return "unexpected token";
        case ErrorCode::UnexpectedEndOfInput: return "unexpected end of input";
        case ErrorCode::NestingTooDeep: return "nesting too deep";
        case ErrorCode::DuplicateTable: return "duplicate table";
        case ErrorCode::DuplicateColumn: return "duplicate column";
        case ErrorCode::DuplicateUser: return "duplicate user";
        case ErrorCode::DuplicateGrant: return "duplicate grant";
        case ErrorCode::UnknownTable: return "unknown table";
        case ErrorCode::UnknownColumn: return "unknown column";
        case ErrorCode::UnknownUser: return "unknown user";
        case ErrorCode::ArityMismatch: return "arity mismatch";
        case ErrorCode::TypeMismatch: return "type mismatch";
    }
    return "unknown";
}

/// A positioned message produced by one of the front-end phases.
class Diagnostic {
public:
    Diagnostic(Phase phase, ErrorCode code, std::string message,
               SourceLocation location, Severity severity = Severity::Error)
        : phase_(phase), severity_(severity), code_(code),
          message_(std::move(message)), location_(location) {}

    [[nodiscard]] Phase phase() const noexcept { return phase_; }
    [[nodiscard]] Severity severity() const noexcept { return severity_; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] SourceLocation location() const noexcept { return location_; }
    [[nodiscard]] std::size_t line() const noexcept { return location_.line; }
    [[nodiscard]] std::size_t column() const noexcept { return location_.column; }

    [[nodiscard]] bool is_error() const noexcept { return severity_ == Severity::Error; }

    // [Line L, Col C] Syntax Error: <message>
    [[nodiscard]] std::string to_string() const;

private:
    Phase phase_;
    Severity severity_;
    ErrorCode code_;
    std::string message_;
    SourceLocation location_;
};

} // namespace minisql
