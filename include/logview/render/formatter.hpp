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
 * @file formatter.hpp
 * @brief Layout of a decoded record as one display line.
 *
 * @details
 * This header declares the `Formatter` class, which composes the localized
 * timestamp, centered level label, optional source location, message and
 * metadata into a single string, and applies severity coloring on top.
 */

#pragma once

#include "logview/record/log_record.hpp"
#include "logview/render/color.hpp"

#include <cstddef>
#include <string>

namespace logview::render {

/**
 * @class Formatter
 * @brief Stateless renderer for `LogRecord` values.
 */
class Formatter {
  public:
    /// @brief Width the level label is centered in.
    static constexpr std::size_t kLevelWidth = 5;

    /**
     * @param painter Controls whether ANSI sequences are emitted.
     */
    explicit Formatter(Painter painter) : painter_(painter) {}

    /**
     * @brief Lays out a record without severity coloring.
     *
     * **Layouts:**
     * - With source: `<time>|<level>|<file>:<line>: <message> <metadata>`
     * - Without:     `<time>|<level>: <message> <metadata>`
     *
     * `<time>` is painted magenta, `<file>` and `<line>` blue. The
     * separator before `<metadata>` is always emitted, even when the
     * metadata renders empty.
     *
     * @param record The decoded record.
     * @return std::string The display line, without trailing newline.
     */
    std::string format(const record::LogRecord& record) const;

    /**
     * @brief Lays out a record and paints it with its level color.
     *
     * Unrecognised levels keep the default styling; the time and source
     * emphasis from `format` is kept either way.
     */
    std::string render_line(const record::LogRecord& record) const;

  private:
    Painter painter_;
};

} // namespace logview::render
