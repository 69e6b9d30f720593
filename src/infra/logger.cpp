/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the diagnostic logging utility.
 *
 * @details
 * Formats each entry with an ISO 8601-like timestamp, a severity tag and an
 * ANSI color, and writes it to the standard error stream.
 */

#include "logview/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace logview::infra {

// Silent unless the configuration lowers the threshold.
LogLevel Logger::threshold_ = LogLevel::OFF;

void Logger::set_level(LogLevel level)
{
    threshold_ = level;
}

LogLevel Logger::level()
{
    return threshold_;
}

bool Logger::enabled(LogLevel level)
{
    return level != LogLevel::OFF && level >= threshold_;
}

/**
 * @brief Dispatches a formatted log entry to `stderr`.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the entry if it is below the threshold.
 * 2. **Chronometry**: Captures the current system clock and formats it.
 * 3. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time, &local);

    auto& stream = std::cerr;

    // Formatting: [YYYY-MM-DD HH:MM:SS]
    stream << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        // Gray (Dimmed)
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    case LogLevel::OFF:
        return;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace logview::infra
