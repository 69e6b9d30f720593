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
 * @file config.hpp
 * @brief Runtime settings resolved from the process environment.
 *
 * @details
 * logview takes no flags and reads no files for configuration. The only
 * knobs are the conventional terminal-color variables (`CLICOLOR`,
 * `CLICOLOR_FORCE`, `NO_COLOR`) and `LOGVIEW_LOG`, which lowers the
 * diagnostic threshold of `infra::Logger`.
 */

#pragma once

#include "logview/infra/logger.hpp"

#include <functional>
#include <optional>
#include <string>

namespace logview::infra {

/**
 * @struct Config
 * @brief Immutable snapshot of the settings for one run.
 */
struct Config {
    /// @brief Emit ANSI escape sequences on stdout.
    bool colorize = true;

    /// @brief Diagnostic threshold applied to `Logger`.
    LogLevel log_level = LogLevel::OFF;

    /// @brief Environment lookup; returns `std::nullopt` for unset variables.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Resolves the configuration from the real process environment.
     *
     * Terminal detection uses `isatty(STDOUT_FILENO)`.
     */
    static Config from_env();

    /**
     * @brief Resolves the configuration from an arbitrary lookup.
     *
     * **Color Resolution Order:**
     * 1. `CLICOLOR_FORCE` set and not `"0"`: color on.
     * 2. `NO_COLOR` set (any value): color off.
     * 3. Otherwise color is on only if `CLICOLOR` is not `"0"` and
     *    `stdout_is_tty` is true.
     *
     * @param env Variable lookup.
     * @param stdout_is_tty Whether standard output is attached to a terminal.
     */
    static Config resolve(const EnvLookup& env, bool stdout_is_tty);

    /**
     * @brief Parses a diagnostic level name (`trace` ... `fatal`, `off`).
     *
     * Case-insensitive; surrounding whitespace is ignored.
     *
     * @return std::nullopt for unknown names.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);
};

} // namespace logview::infra
