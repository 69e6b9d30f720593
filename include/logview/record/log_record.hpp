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
 * @file log_record.hpp
 * @brief In-memory shape of one decoded log line.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace logview::record {

/**
 * @struct LogRecord
 * @brief A structured log entry, alive for exactly one input line.
 *
 * @details
 * `source_file` and `source_line` are decoded independently but are only
 * meaningful together; see `has_source()`. `metadata` holds the JSON text
 * of the value exactly as it appeared in the line, and is empty when the
 * field was absent or `null`.
 */
struct LogRecord {
    std::string level;
    std::string message;
    std::string timestamp;
    std::optional<std::string> source_file;
    std::optional<std::int32_t> source_line;
    std::optional<std::string> metadata;

    /// @brief True only when both halves of the source location are present.
    bool has_source() const { return source_file.has_value() && source_line.has_value(); }
};

} // namespace logview::record
