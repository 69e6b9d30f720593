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
 * @file viewer.cpp
 * @brief Implementation of the rendering pipeline.
 *
 * @details
 * file -> line -> decode attempt -> format -> colorize -> print.
 */

#include "logview/app/viewer.hpp"

#include "logview/infra/logger.hpp"
#include "logview/io/line_reader.hpp"
#include "logview/record/decoder.hpp"

namespace logview::app {

Viewer::Viewer(const infra::Config& config, std::ostream& out)
    : formatter_(render::Painter(config.colorize)), out_(out)
{
}

std::string Viewer::display(const std::string& line, bool& decoded) const
{
    auto parsed = record::Decoder::decode(line);
    decoded = parsed.has_value();
    if (!parsed) {
        return line;
    }
    return formatter_.render_line(*parsed);
}

/**
 * @brief Runs the pipeline over one file.
 *
 * Operational Logic:
 * 1. **Open**: `IoError` ends the run quietly with an empty summary.
 * 2. **Stream**: Each produced line is rendered and written immediately,
 *    so output order always matches input order.
 * 3. **Report**: Counters are logged at INFO once the file is exhausted.
 */
Summary Viewer::run(const std::string& path)
{
    Summary summary;

    try {
        io::LineReader reader(path);
        summary.opened = true;

        std::string line;
        while (reader.next(line)) {
            bool decoded = false;
            out_ << display(line, decoded) << '\n';

            summary.lines++;
            if (decoded) {
                summary.records++;
            } else {
                summary.passthrough++;
                infra::Logger::log(infra::LogLevel::TRACE,
                                   "Render: passthrough line " + std::to_string(summary.lines));
            }
        }
        summary.dropped = reader.dropped();
    } catch (const io::IoError& e) {
        infra::Logger::log(infra::LogLevel::DEBUG, e.what());
        return summary;
    }

    out_.flush();

    infra::Logger::log(infra::LogLevel::INFO,
                       "Render: " + std::to_string(summary.lines) + " lines (" +
                           std::to_string(summary.records) + " records, " +
                           std::to_string(summary.passthrough) + " passthrough, " +
                           std::to_string(summary.dropped) + " dropped)");
    return summary;
}

} // namespace logview::app
