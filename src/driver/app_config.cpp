#include "driver/app_config.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace minisql::driver {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

bool parse_depth(const std::string& value, std::size_t& out) {
    std::size_t parsed = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc() || ptr != end || parsed == 0) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

bool AppConfig::load_from_file(const std::string& path, std::string& error) {
    if (!fs::exists(path)) {
        error = fmt::format("Config file not found: {}", path);
        return false;
    }

    std::ifstream file(path);
    if (!file) {
        error = fmt::format("Cannot open config file: {}", path);
        return false;
    }

    std::string line;
    std::size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (key == "output_dir") {
            output_dir = value;
        } else if (key == "lex_errors") {
            if (value != "recover" && value != "abort") {
                error = fmt::format("{}:{}: lex_errors must be 'recover' or 'abort', got '{}'",
                                    path, line_number, value);
                return false;
            }
            lex_errors = value;
        } else if (key == "max_depth") {
            if (!parse_depth(value, max_depth)) {
                error = fmt::format("{}:{}: max_depth must be a positive integer, got '{}'",
                                    path, line_number, value);
                return false;
            }
        } else if (key == "log_level") {
            log_level = value;
        } else if (key == "log_file") {
            log_file = value;
        } else if (key == "no_report") {
            no_report = (value == "true" || value == "1");
        }
    }

    return true;
}

CompilerConfig AppConfig::to_compiler_config() const {
    CompilerConfig config;
    config.lexer.error_policy = lex_errors == "abort"
        ? sql::LexErrorPolicy::Abort
        : sql::LexErrorPolicy::Recover;
    config.parser.max_condition_depth = max_depth;
    return config;
}

} // namespace minisql::driver
