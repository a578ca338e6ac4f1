/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Initializes and owns the process-wide spdlog logger. The curses renderer
 * owns the terminal while it runs, so the console sink is optional and the
 * rotating log file is the primary output.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace cal {

class Logger {
public:
    static void init(std::string_view appName = "cmus-auto-lyrics",
                     bool debug = false,
                     bool console = true);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Macros for convenient logging with source location
// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(cal::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(cal::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(cal::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(cal::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(cal::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(cal::Logger::get(), __VA_ARGS__)

} // namespace cal
