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
 * @file formatter.cpp
 * @brief Implementation of the record line layout.
 */

#include "logview/render/formatter.hpp"

#include "logview/infra/string.hpp"
#include "logview/render/metadata.hpp"
#include "logview/render/timestamp.hpp"

namespace logview::render {

std::string Formatter::format(const record::LogRecord& record) const
{
    const std::string time = painter_.paint(Timestamp::to_local(record.timestamp), Color::Magenta);
    const std::string level = infra::String::center(record.level, kLevelWidth);
    const std::string meta = Metadata::to_string(record.metadata);

    std::string out = time;
    out += '|';
    out += level;

    if (record.has_source()) {
        out += '|';
        out += painter_.paint(*record.source_file, Color::Blue);
        out += ':';
        out += painter_.paint(std::to_string(*record.source_line), Color::Blue);
    }

    out += ": ";
    out += record.message;
    out += ' ';
    out += meta;
    return out;
}

std::string Formatter::render_line(const record::LogRecord& record) const
{
    return painter_.paint(format(record), color_for_level(record.level));
}

} // namespace logview::render
