// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  minisql - Logger Implementation                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/utils/logger.hpp"
#include "minisql/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <vector>

namespace minisql::log {

namespace {

spdlog::level::level_enum to_spdlog(Level level) {
    return static_cast<spdlog::level::level_enum>(level);
}

void log_impl(Level level, std::string_view message) {
#if MINISQL_ENABLE_LOGGING
    spdlog::default_logger_raw()->log(to_spdlog(level), "{}", message);
#else
    (void)level;
    (void)message;
#endif
}

} // anonymous namespace

Level level_from_string(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off") return Level::Off;
    return Level::Info;
}

void init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(to_spdlog(level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("minisql", sinks.begin(), sinks.end());
        logger->set_level(log_file.empty() ? to_spdlog(level) : spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        spdlog::set_level(to_spdlog(level));
    }
}

void set_level(Level level) {
    spdlog::set_level(to_spdlog(level));
}

void debug(std::string_view message) {
    log_impl(Level::Debug, message);
}

void info(std::string_view message) {
    log_impl(Level::Info, message);
}

void warn(std::string_view message) {
    log_impl(Level::Warn, message);
}

void error(std::string_view message) {
    log_impl(Level::Error, message);
}

} // namespace minisql::log
