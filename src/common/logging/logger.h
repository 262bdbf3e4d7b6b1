#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace blobxfer::logging {

enum class LogLevel { trace, debug, info, warn, error, critical, off };

// Install the default spdlog logger used by the LOG_* macros.
// A colored stdout sink is added when `console` is set; a file sink is added
// when `log_file` is non-empty. If the file cannot be opened and `console` is
// off, logging falls back to stderr. With neither, logging goes nowhere.
void configure_logging(LogLevel level, bool console, const std::string& log_file = {});

// Change the level of the current default logger.
void set_level(LogLevel level);

spdlog::level::level_enum to_spdlog_level(LogLevel level);

}  // namespace blobxfer::logging

// Call-site macros. SPDLOG_ACTIVE_LEVEL (set by the build) strips levels at
// compile time; the runtime level is applied by configure_logging().
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
