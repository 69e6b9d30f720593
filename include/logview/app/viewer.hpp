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
 * @file viewer.hpp
 * @brief The read-decode-render-print pipeline.
 *
 * @details
 * This header declares the `Viewer` class, which drives one pass over an
 * input file: every line is either rendered as a record or echoed verbatim,
 * in input order. No state is carried from one line to the next.
 */

#pragma once

#include "logview/infra/config.hpp"
#include "logview/render/formatter.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace logview::app {

/**
 * @struct Summary
 * @brief Line counters for one run.
 */
struct Summary {
    bool opened = false;         ///< The input file could be opened.
    std::size_t lines = 0;       ///< Lines written to the output.
    std::size_t records = 0;     ///< Lines rendered as records.
    std::size_t passthrough = 0; ///< Lines echoed verbatim.
    std::size_t dropped = 0;     ///< Lines skipped for invalid encoding.
};

/**
 * @class Viewer
 * @brief Renders a log file to an output stream.
 */
class Viewer {
  public:
    /**
     * @param config Run settings (coloring).
     * @param out Destination for rendered lines, normally `std::cout`.
     */
    Viewer(const infra::Config& config, std::ostream& out);

    /**
     * @brief Processes the file at `path` from top to bottom.
     *
     * An input that cannot be opened produces no output and no error; the
     * failure is only visible through the diagnostic log and
     * `Summary::opened`.
     *
     * @param path Filesystem path of the log file.
     * @return Summary Counters describing the run.
     */
    Summary run(const std::string& path);

    /**
     * @brief Renders one input line.
     *
     * @param line Line text without terminator.
     * @param[out] decoded Set to true if the line was a record.
     * @return std::string The display text, or `line` itself when it does
     * not decode.
     */
    std::string display(const std::string& line, bool& decoded) const;

  private:
    render::Formatter formatter_;
    std::ostream& out_;
};

} // namespace logview::app
