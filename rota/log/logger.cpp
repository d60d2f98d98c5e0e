/*
 * logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-08-19

Description: spdlog setup for rota

**************************************************/

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rota::log {

namespace {
auto toSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
        default:
            throw std::invalid_argument("Cannot install an UNKNOWN log level");
    }
}
}  // namespace

auto logLevelToString(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

auto stringToLogLevel(std::string_view levelStr) -> LogLevel {
    std::string level(levelStr);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (level == "TRACE" || level == "T")
        return LogLevel::TRACE;
    if (level == "DEBUG" || level == "D")
        return LogLevel::DEBUG;
    if (level == "INFO" || level == "I")
        return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING" || level == "W")
        return LogLevel::WARN;
    if (level == "ERROR" || level == "ERR" || level == "E")
        return LogLevel::ERROR;
    if (level == "CRITICAL" || level == "CRIT" || level == "C" ||
        level == "FATAL")
        return LogLevel::CRITICAL;
    if (level == "OFF")
        return LogLevel::OFF;

    return LogLevel::UNKNOWN;
}

auto LogSettings::fromEnvironment(std::string_view prefix) -> LogSettings {
    LogSettings settings;
    const std::string base(prefix);

    if (const char* value = std::getenv((base + "LOG_LEVEL").c_str())) {
        settings.level = stringToLogLevel(value);
        if (settings.level == LogLevel::UNKNOWN) {
            throw std::invalid_argument(base + "LOG_LEVEL has unknown level '" +
                                        value + "'");
        }
    }
    if (const char* value = std::getenv((base + "LOG_FILE").c_str())) {
        settings.file = value;
    }
    return settings;
}

auto initLogging(const LogSettings& settings)
    -> std::shared_ptr<spdlog::logger> {
    const auto level = toSpdlogLevel(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!settings.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            settings.file, false));
    }

    auto logger = std::make_shared<spdlog::logger>(
        settings.loggerName, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(settings.pattern);

    spdlog::drop(settings.loggerName);
    spdlog::set_default_logger(logger);
    logger->debug("Logging initialized at level {}",
                  logLevelToString(settings.level));
    return logger;
}

}  // namespace rota::log
