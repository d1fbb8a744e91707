#pragma once

#include <cstddef>
#include <string>

#include "minisql/compiler.h"

namespace minisql::driver {

// ============================================================================
// Configuration Structure
// ============================================================================
struct AppConfig {
    std::string input_file = "input.txt";
    std::string output_dir = "output";
    std::string config_file = "";

    // Compiler settings
    std::string lex_errors = "recover";
    std::size_t max_depth = 256;

    // Logging settings
    std::string log_level = "warn";
    std::string log_file = "";

    bool no_report = false;
    bool quiet = false;

    // Reads key = value lines. On failure `error` names the file or the bad key
    // and the fields read before it keep their new values.
    bool load_from_file(const std::string& path, std::string& error);

    CompilerConfig to_compiler_config() const;
};

} // namespace minisql::driver
