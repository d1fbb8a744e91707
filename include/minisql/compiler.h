#pragma once

#include "minisql/diagnostic.h"
#include "minisql/semantic/analyzer.h"
#include "minisql/sql/lexer.h"
#include "minisql/sql/parser.h"
#include "minisql/sql/token.h"

#include <string_view>
#include <vector>

namespace minisql {

struct CompilerConfig {
    sql::LexerConfig lexer;
    sql::ParserConfig parser;
};

struct CompilationResult {
    std::vector<sql::Token> tokens;
    std::vector<Diagnostic> lexical_diagnostics;
    sql::ParseResult parse;
    semantic::AnalysisResult analysis;

    // False when the lexer aborted and the later phases did not run
    bool parsed{false};

    // Lexical, syntax and semantic diagnostics (notices included),
    // in phase order
    std::vector<Diagnostic> all_diagnostics() const;

    std::size_t error_count() const;
    std::size_t warning_count() const;

    bool ok() const { return error_count() == 0; }
};

/// Lexer -> Parser -> SemanticAnalyzer over one source text.
///
/// Syntax errors do not stop the pipeline: the statements that parsed are
/// still analyzed. A lexer running under LexErrorPolicy::Abort that hits an
/// error ends the run before parsing.
class Compiler {
public:
    explicit Compiler(CompilerConfig config = {}) : config_(config) {}

    CompilationResult run(std::string_view source) const;

    const CompilerConfig& config() const { return config_; }

private:
    CompilerConfig config_;
};

} // namespace minisql
