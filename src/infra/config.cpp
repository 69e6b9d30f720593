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
 * @file config.cpp
 * @brief Environment-driven configuration resolution.
 */

#include "logview/infra/config.hpp"

#include "logview/infra/string.hpp"

#include <cstdlib>
#include <unistd.h>

namespace logview::infra {

Config Config::from_env()
{
    auto lookup = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
    return resolve(lookup, isatty(STDOUT_FILENO) == 1);
}

Config Config::resolve(const EnvLookup& env, bool stdout_is_tty)
{
    Config config;

    auto force = env("CLICOLOR_FORCE");
    auto no_color = env("NO_COLOR");
    auto clicolor = env("CLICOLOR");

    if (force && *force != "0") {
        config.colorize = true;
    } else if (no_color) {
        config.colorize = false;
    } else {
        bool allowed = !clicolor || *clicolor != "0";
        config.colorize = allowed && stdout_is_tty;
    }

    if (auto level_name = env("LOGVIEW_LOG")) {
        config.log_level = parse_level(*level_name).value_or(LogLevel::OFF);
    }

    return config;
}

std::optional<LogLevel> Config::parse_level(const std::string& name)
{
    const std::string key = String::to_lower(String::trim(name));

    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;
    if (key == "off")
        return LogLevel::OFF;
    return std::nullopt;
}

} // namespace logview::infra
