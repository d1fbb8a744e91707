#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

// Third-party includes
#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project includes
#include "driver/app_config.hpp"
#include "internal/utils/logger.hpp"
#include "minisql/compiler.h"
#include "minisql/json.h"
#include "minisql/version.hpp"

namespace fs = std::filesystem;

using minisql::driver::AppConfig;

namespace {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_DIAGNOSTICS = 1;
constexpr int EXIT_IO_FAILURE = 2;

} // namespace

// ============================================================================
// Utility Functions
// ============================================================================
bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;

    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return !file.bad();
}

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file << content;
    return file.good();
}

std::string format_tokens(const std::vector<minisql::sql::Token>& tokens) {
    std::string out = fmt::format("{:<6}{:<8}{:<16}{}\n", "LINE", "COLUMN", "TYPE", "LEXEME");
    out += std::string(48, '-') + "\n";
    for (const auto& token : tokens) {
        out += fmt::format("{:<6}{:<8}{:<16}{}\n",
                           token.line, token.column,
                           minisql::sql::token_type_name(token.type), token.lexeme);
    }
    return out;
}

std::string format_diagnostics(const std::vector<minisql::Diagnostic>& diagnostics) {
    std::string out;
    for (const auto& diagnostic : diagnostics) {
        out += diagnostic.to_string();
        out += '\n';
    }
    if (out.empty()) out = "No errors.\n";
    return out;
}

// Writes <output_dir>/run_YYYY-MM-DD_HH-MM-SS/, the path goes to run_dir
bool write_report(const AppConfig& config,
                  const minisql::CompilationResult& result,
                  fs::path& run_dir) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    run_dir = fs::path(config.output_dir) /
              fmt::format("run_{:%Y-%m-%d_%H-%M-%S}", fmt::localtime(now));

    std::error_code ec;
    fs::create_directories(run_dir, ec);
    if (ec) {
        spdlog::error("Cannot create report directory {}: {}", run_dir.string(), ec.message());
        return false;
    }

    nlohmann::json parse_tree = nullptr;
    nlohmann::json analysis = nullptr;
    if (result.parsed) {
        parse_tree = result.parse;
        analysis = result.analysis;
    }

    bool ok = write_file(run_dir / "tokens.txt", format_tokens(result.tokens)) &&
              write_file(run_dir / "parse_tree.json", parse_tree.dump(2)) &&
              write_file(run_dir / "analysis.json", analysis.dump(2)) &&
              write_file(run_dir / "diagnostics.txt", format_diagnostics(result.all_diagnostics()));

    if (!ok) {
        spdlog::error("Failed to write report files to {}", run_dir.string());
    }
    return ok;
}

void print_summary(const AppConfig& config, const minisql::CompilationResult& result) {
    if (config.quiet) return;

    fmt::print("minisql {}: {}\n", MINISQL_VERSION, config.input_file);
    fmt::print("  Tokens:     {}\n", result.tokens.size());

    if (result.parsed) {
        fmt::print("  Statements: {} parsed, {} validated\n",
                   result.parse.statements.size(), result.analysis.statements.size());
        fmt::print("  Tables:     {}\n", result.analysis.schema.size());
        fmt::print("  Users:      {}\n", result.analysis.users.size());
    } else {
        fmt::print("  Lexing aborted, nothing parsed\n");
    }

    for (const auto& diagnostic : result.all_diagnostics()) {
        auto style = diagnostic.is_error()
            ? fmt::fg(fmt::color::red)
            : fmt::fg(fmt::color::yellow);
        fmt::print(style, "{}\n", diagnostic.to_string());
    }

    if (result.ok()) {
        fmt::print(fmt::fg(fmt::color::green), "No errors.\n");
    } else {
        fmt::print("{} error(s), {} warning(s)\n", result.error_count(), result.warning_count());
    }
}

// ============================================================================
// Main Application Logic
// ============================================================================
int run_application(const AppConfig& config) {
    spdlog::info("minisql v{} ({} with {})", MINISQL_VERSION, MINISQL_BUILD_TYPE, MINISQL_COMPILER);

    std::string source;
    if (!read_file(config.input_file, source)) {
        spdlog::critical("Cannot read input file: {}", config.input_file);
        return EXIT_IO_FAILURE;
    }

    spdlog::info("Read {} bytes from {}", source.size(), config.input_file);

    minisql::Compiler compiler(config.to_compiler_config());
    auto result = compiler.run(source);

    print_summary(config, result);

    if (!config.no_report) {
        fs::path run_dir;
        if (!write_report(config, result, run_dir)) {
            return EXIT_IO_FAILURE;
        }
        if (!config.quiet) {
            fmt::print("Report written to {}\n", run_dir.string());
        }
    }

    return result.ok() ? EXIT_CLEAN : EXIT_DIAGNOSTICS;
}

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    AppConfig config;

    CLI::App app{"minisqlc - static SQL checker"};

    app.add_option("input", config.input_file,
        "SQL source file")
        ->capture_default_str();

    app.add_option("-o,--output-dir", config.output_dir,
        "Directory for run reports")
        ->envname("MINISQL_OUTPUT_DIR");

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("MINISQL_CONFIG");

    app.add_option("--lex-errors", config.lex_errors,
        "Lexical error policy")
        ->check(CLI::IsMember({"recover", "abort"}))
        ->envname("MINISQL_LEX_ERRORS");

    app.add_option("--max-depth", config.max_depth,
        "Maximum nesting of parenthesised WHERE conditions")
        ->check(CLI::PositiveNumber);

    // Logging options
    app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error)")
        ->envname("MINISQL_LOG_LEVEL");

    app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("MINISQL_LOG_FILE");

    app.add_flag("--no-report", config.no_report,
        "Do not write the run directory");

    app.add_flag("-q,--quiet", config.quiet,
        "Suppress the console summary");

    app.add_flag_callback("--version", []() {
        std::cout << "minisql version " << MINISQL_VERSION << std::endl;
        std::cout << "Build type: " << MINISQL_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << MINISQL_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    CLI11_PARSE(app, argc, argv);

    // Load config file
    if (!config.config_file.empty()) {
        std::string error;
        if (!config.load_from_file(config.config_file, error)) {
            std::cerr << "Failed to load config: " << error << std::endl;
            return EXIT_IO_FAILURE;
        }
    }

    minisql::log::init(config.log_file, minisql::log::level_from_string(config.log_level));

    try {
        int code = run_application(config);
        spdlog::shutdown();
        return code;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_IO_FAILURE;
    }
}
