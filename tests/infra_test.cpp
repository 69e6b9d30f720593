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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (String, Config, Logger).
 */

#include "logview/infra/config.hpp"
#include "logview/infra/logger.hpp"
#include "logview/infra/string.hpp"
#include "framework.hpp"

#include <map>
#include <string>

using logview::infra::Config;
using logview::infra::Logger;
using logview::infra::LogLevel;
using logview::infra::String;

namespace {

/// @brief Builds an environment lookup backed by a fixed map.
Config::EnvLookup fake_env(std::map<std::string, std::string> vars)
{
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 */
void test_string_trim()
{
    ASSERT_EQ(String::trim("   hello logview   "), std::string("hello logview"));
    ASSERT_EQ(String::trim("  \t\n  \r "), std::string(""));
    ASSERT_EQ(String::trim("x"), std::string("x"));
}

/**
 * @brief Validates the UTF-8 checker against well-formed and broken input.
 *
 * Scenarios verified:
 * - ASCII, 2-, 3- and 4-byte sequences are accepted.
 * - Lone continuation bytes, overlongs, surrogates, out-of-range code
 *   points and truncated sequences are rejected.
 */
void test_string_utf8_validation()
{
    ASSERT_TRUE(String::is_valid_utf8(""));
    ASSERT_TRUE(String::is_valid_utf8("plain ascii"));
    ASSERT_TRUE(String::is_valid_utf8("caf\xC3\xA9"));           // é
    ASSERT_TRUE(String::is_valid_utf8("\xE2\x82\xAC"));          // €
    ASSERT_TRUE(String::is_valid_utf8("\xF0\x9F\x98\x80"));      // 😀
    ASSERT_TRUE(String::is_valid_utf8("\xF4\x8F\xBF\xBF"));      // U+10FFFF

    ASSERT_FALSE(String::is_valid_utf8("\x80"));                 // lone continuation
    ASSERT_FALSE(String::is_valid_utf8("\xC0\xAF"));             // overlong '/'
    ASSERT_FALSE(String::is_valid_utf8("\xE0\x80\xAF"));         // overlong 3-byte
    ASSERT_FALSE(String::is_valid_utf8("\xED\xA0\x80"));         // surrogate U+D800
    ASSERT_FALSE(String::is_valid_utf8("\xF4\x90\x80\x80"));     // above U+10FFFF
    ASSERT_FALSE(String::is_valid_utf8("abc\xE2\x82"));          // truncated
    ASSERT_FALSE(String::is_valid_utf8("\xFF"));
}

/**
 * @brief Verifies centering counts code points, not bytes.
 */
void test_string_center()
{
    ASSERT_EQ(String::center("info", 5), std::string("info "));
    ASSERT_EQ(String::center("ok", 5), std::string(" ok  "));
    ASSERT_EQ(String::center("a", 5), std::string("  a  "));
    ASSERT_EQ(String::center("", 5), std::string("     "));
    ASSERT_EQ(String::center("error", 5), std::string("error"));
    ASSERT_EQ(String::center("critical", 5), std::string("critical"));

    // Two code points, four bytes: padded as a 2-character label.
    ASSERT_EQ(String::char_count("\xC3\xA9\xC3\xA9"), static_cast<size_t>(2));
    ASSERT_EQ(String::center("\xC3\xA9\xC3\xA9", 5), std::string(" \xC3\xA9\xC3\xA9  "));
}

/**
 * @brief Checks the color decision order of the terminal variables.
 */
void test_config_color_resolution()
{
    // Terminal, nothing set: colored.
    ASSERT_TRUE(Config::resolve(fake_env({}), true).colorize);
    // Pipe, nothing set: plain.
    ASSERT_FALSE(Config::resolve(fake_env({}), false).colorize);
    // NO_COLOR wins over a terminal.
    ASSERT_FALSE(Config::resolve(fake_env({{"NO_COLOR", ""}}), true).colorize);
    // CLICOLOR=0 disables.
    ASSERT_FALSE(Config::resolve(fake_env({{"CLICOLOR", "0"}}), true).colorize);
    // CLICOLOR_FORCE wins over everything, even a pipe and NO_COLOR.
    ASSERT_TRUE(
        Config::resolve(fake_env({{"CLICOLOR_FORCE", "1"}, {"NO_COLOR", "1"}}), false).colorize);
    // CLICOLOR_FORCE=0 is ignored.
    ASSERT_FALSE(Config::resolve(fake_env({{"CLICOLOR_FORCE", "0"}}), false).colorize);
}

/**
 * @brief Checks diagnostic level parsing from `LOGVIEW_LOG`.
 */
void test_config_log_level()
{
    ASSERT_TRUE(Config::resolve(fake_env({}), false).log_level == LogLevel::OFF);
    ASSERT_TRUE(Config::resolve(fake_env({{"LOGVIEW_LOG", " Debug "}}), false).log_level ==
                LogLevel::DEBUG);
    ASSERT_TRUE(Config::resolve(fake_env({{"LOGVIEW_LOG", "verbose"}}), false).log_level ==
                LogLevel::OFF);
    ASSERT_TRUE(Config::parse_level("WARN") == LogLevel::WARN);
    ASSERT_FALSE(Config::parse_level("loud").has_value());
}

/**
 * @brief Verifies the logger threshold gates each severity.
 */
void test_logger_threshold()
{
    const LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::OFF);
    ASSERT_FALSE(Logger::enabled(LogLevel::FATAL));

    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::ERROR));
    ASSERT_FALSE(Logger::enabled(LogLevel::OFF));

    Logger::set_level(saved);
}
