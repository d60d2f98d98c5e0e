/*
 * logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup for rota

**************************************************/

#ifndef ROTA_LOG_LOGGER_HPP
#define ROTA_LOG_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace rota::log {

/**
 * @brief Enum representing different log levels.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6,
    UNKNOWN = 7
};

/**
 * @brief Convert log level to string.
 */
auto logLevelToString(LogLevel level) -> std::string_view;

/**
 * @brief Convert string to log level.
 *
 * Matching is case-insensitive and accepts short forms ("W", "ERR").
 * Unrecognized input yields LogLevel::UNKNOWN.
 */
auto stringToLogLevel(std::string_view levelStr) -> LogLevel;

/**
 * @brief Logging configuration applied by initLogging().
 */
struct LogSettings {
    std::string loggerName = "rota";
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";
    std::string file;  ///< Also log to this file when not empty.

    /**
     * @brief Reads <prefix>LOG_LEVEL and <prefix>LOG_FILE on top of the
     * defaults.
     * @throws std::invalid_argument if LOG_LEVEL is not a known level
     */
    static auto fromEnvironment(std::string_view prefix = "ROTA_")
        -> LogSettings;
};

/**
 * @brief Creates the console (and optional file) logger described by
 * settings and makes it the spdlog default logger.
 * @return The installed logger
 * @throws std::invalid_argument if settings.level is UNKNOWN
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
auto initLogging(const LogSettings& settings)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace rota::log

#endif  // ROTA_LOG_LOGGER_HPP
