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
 * @file line_reader.hpp
 * @brief Forward-only line source over a single input file.
 *
 * @details
 * This header declares the `LineReader` class, which owns the input file
 * handle for the duration of a run and hands out one text line at a time.
 * Lines that are not valid UTF-8 never reach the caller.
 */

#pragma once

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

namespace logview::io {

/**
 * @class IoError
 * @brief Raised when the input path cannot be opened for reading.
 */
class IoError : public std::runtime_error {
  public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class LineReader
 * @brief Sequential, single-pass reader of newline-delimited text.
 *
 * @details
 * The sequence is consumed exactly once, top to bottom; there is no rewind.
 * The stream is closed when the reader is destroyed.
 */
class LineReader {
  public:
    /**
     * @brief Opens the file for reading.
     *
     * @param path Filesystem path of the log file.
     * @throws IoError If the path does not exist, names a directory, or
     * cannot be opened.
     */
    explicit LineReader(const std::string& path);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * @brief Produces the next line of the file.
     *
     * The terminating `\n` (and a `\r` right before it) is removed. Lines
     * containing invalid UTF-8 are skipped and counted in `dropped()`.
     *
     * @param[out] line Receives the line text on success.
     * @return true If a line was produced.
     * @return false At end of file or after an unrecoverable read error.
     */
    bool next(std::string& line);

    /// @brief Number of lines skipped because of invalid encoding.
    std::size_t dropped() const { return dropped_; }

  private:
    std::string path_;
    std::ifstream file_;
    std::size_t position_ = 0; ///< 1-based number of the last physical line read.
    std::size_t dropped_ = 0;
};

} // namespace logview::io
