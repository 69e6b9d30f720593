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
 * @file logger.hpp
 * @brief Diagnostic logging facility for logview.
 *
 * @details
 * This header declares the `Logger` class, the reporting interface for the
 * tool's own diagnostics. Standard output carries the rendered log lines, so
 * every diagnostic is written to `stderr` and filtered by a process-wide
 * severity threshold that is `OFF` unless configured otherwise.
 */

#pragma once

#include <string>

namespace logview::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., per-line decisions).
    DEBUG, ///< Diagnostic information intended for troubleshooting.
    INFO,  ///< Nominal operational events (e.g., run summary).
    WARN,  ///< Non-blocking anomalies.
    ERROR, ///< Recoverable runtime errors.
    FATAL, ///< Critical failures terminating the process.
    OFF    ///< Threshold only: suppresses every message.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide diagnostics.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to `stderr`.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * Messages below the active threshold are discarded.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * logview::infra::Logger::log(LogLevel::DEBUG, "Input: 3 lines dropped.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     * @param level The new threshold. `LogLevel::OFF` silences the logger.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the active threshold.
    static LogLevel level();

    /// @brief True if a message of the given severity would be written.
    static bool enabled(LogLevel level);

  private:
    /// @brief Active severity threshold.
    static LogLevel threshold_;
};

} // namespace logview::infra
