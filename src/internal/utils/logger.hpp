// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Logger Header                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace minisql::log {

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Parses "trace", "debug", "info", "warn", "error", "critical", "off".
/// Unknown names map to Info.
Level level_from_string(std::string_view name);

/// Installs the "minisql" logger as spdlog default: colored console sink,
/// plus a file sink when log_file is not empty.
void init(const std::string& log_file, Level level = Level::Info);

void set_level(Level level);

void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

template<typename... Args>
void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    debug(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void info(fmt::format_string<Args...> fmt, Args&&... args) {
    info(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    warn(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void error(fmt::format_string<Args...> fmt, Args&&... args) {
    error(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

} // namespace minisql::log
