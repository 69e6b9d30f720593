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
 * @file line_reader.cpp
 * @brief Implementation of the sequential line source.
 */

#include "logview/io/line_reader.hpp"

#include "logview/infra/logger.hpp"
#include "logview/infra/string.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace logview::io {

LineReader::LineReader(const std::string& path) : path_(path)
{
    std::error_code ec;
    if (fs::is_directory(path_, ec)) {
        throw IoError("Input: '" + path_ + "' is a directory");
    }

    // Binary mode keeps "\r\n" intact so the terminator handling below is
    // identical on every platform.
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        throw IoError("Input: cannot open '" + path_ + "' for reading");
    }
}

/**
 * @brief Reads physical lines until one passes the encoding check.
 *
 * Implementation Strategy:
 * 1. `std::getline` consumes up to and including the next `\n`.
 * 2. A `\r` is stripped only when a `\n` actually terminated the line.
 * 3. Invalid UTF-8 is dropped and the scan moves on to the next line.
 */
bool LineReader::next(std::string& line)
{
    std::string buffer;

    while (std::getline(file_, buffer)) {
        position_++;

        // eof() after a successful getline means no '\n' was found.
        bool terminated = !file_.eof();
        if (terminated && !buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }

        if (!infra::String::is_valid_utf8(buffer)) {
            dropped_++;
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Input: skipping line " + std::to_string(position_) +
                                   " (invalid UTF-8)");
            continue;
        }

        line = std::move(buffer);
        return true;
    }

    if (file_.bad()) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Input: read error on '" + path_ + "' after line " +
                               std::to_string(position_));
    }
    return false;
}

} // namespace logview::io
