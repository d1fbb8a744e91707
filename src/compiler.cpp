#include "minisql/compiler.h"

#include "internal/utils/logger.hpp"

#include <algorithm>
#include <utility>

namespace minisql {

std::vector<Diagnostic> CompilationResult::all_diagnostics() const {
    std::vector<Diagnostic> all;
    all.reserve(lexical_diagnostics.size() + parse.diagnostics.size() +
                analysis.notices.size() + 1);

    all.insert(all.end(), lexical_diagnostics.begin(), lexical_diagnostics.end());
    all.insert(all.end(), parse.diagnostics.begin(), parse.diagnostics.end());
    all.insert(all.end(), analysis.notices.begin(), analysis.notices.end());
    if (analysis.error) {
        all.push_back(*analysis.error);
    }
    return all;
}

std::size_t CompilationResult::error_count() const {
    auto diagnostics = all_diagnostics();
    return static_cast<std::size_t>(std::count_if(
        diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.is_error(); }));
}

std::size_t CompilationResult::warning_count() const {
    auto diagnostics = all_diagnostics();
    return diagnostics.size() - error_count();
}

CompilationResult Compiler::run(std::string_view source) const {
    CompilationResult result;

    // Lexical analysis
    sql::Lexer lexer(source, config_.lexer);
    result.tokens = lexer.tokenize();
    result.lexical_diagnostics = lexer.diagnostics();

    log::debug("Lexer produced {} tokens, {} diagnostics",
               result.tokens.size(), result.lexical_diagnostics.size());

    if (lexer.aborted()) {
        log::warn("Lexer aborted, skipping parse and semantic analysis");
        return result;
    }

    // Syntax analysis
    sql::Parser parser(result.tokens, config_.parser);
    result.parse = parser.parse();
    result.parsed = true;

    log::debug("Parser produced {} statements, {} diagnostics",
               result.parse.statements.size(), result.parse.diagnostics.size());

    // Semantic analysis works on its own copy; the parse tree stays as parsed
    std::vector<sql::Statement> statements;
    statements.reserve(result.parse.statements.size());
    for (const auto& statement : result.parse.statements) {
        statements.push_back(statement.clone());
    }

    semantic::SemanticAnalyzer analyzer;
    result.analysis = analyzer.analyze(std::move(statements));

    return result;
}

} // namespace minisql
