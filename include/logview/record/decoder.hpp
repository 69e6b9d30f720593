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
 * @file decoder.hpp
 * @brief Best-effort JSON decoder for log lines.
 *
 * @details
 * This header declares the `Decoder` class, which turns one line of text
 * into a `LogRecord` when the line is a JSON document of the expected shape.
 * A failed decode is not an error: the caller prints the line unchanged.
 */

#pragma once

#include "logview/record/log_record.hpp"

#include <optional>
#include <string>

namespace logview::record {

/**
 * @class Decoder
 * @brief A static adapter from raw JSON text to `LogRecord`.
 */
class Decoder {
  public:
    /**
     * @brief Attempts to decode a single log line.
     *
     * **Accepted Shapes:**
     * - An object with string `level`, `message` and `timestamp`, plus the
     *   optional `file` (string), `line` (32-bit integer, written without
     *   fraction or exponent) and `metadata`
     *   (any value). `null` counts as absent. Unknown keys are ignored;
     *   a known key given twice rejects the line.
     * - An array of exactly six elements in the order
     *   `[level, message, timestamp, file, line, metadata]`.
     *
     * The line must be strict JSON (`JsonScanner`); trailing non-whitespace
     * text after the value rejects it.
     *
     * @param line One line of input, without its terminator.
     * @return std::optional<LogRecord> The record, or `std::nullopt` if the
     * line does not have the expected shape.
     *
     * @code
     * auto rec = Decoder::decode(R"({"level":"info","message":"up","timestamp":"t"})");
     * if (rec) { ... }
     * @endcode
     */
    static std::optional<LogRecord> decode(const std::string& line);
};

} // namespace logview::record
