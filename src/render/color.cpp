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
 * @file color.cpp
 * @brief Implementation of the severity color table and ANSI painter.
 */

#include "logview/render/color.hpp"

#include <array>
#include <utility>

namespace logview::render {

namespace {

/// @brief Recognised severity labels. Anything else renders uncolored.
const std::array<std::pair<const char*, Color>, 4> kLevelColors = {{
    {"info", Color::Green},
    {"warn", Color::Yellow},
    {"error", Color::Red},
    {"debug", Color::Cyan},
}};

const char* const kReset = "\033[0m";

} // namespace

Color color_for_level(const std::string& level)
{
    for (const auto& entry : kLevelColors) {
        if (level == entry.first) {
            return entry.second;
        }
    }
    return Color::None;
}

const char* ansi_code(Color color)
{
    switch (color) {
    case Color::Red:
        return "31";
    case Color::Green:
        return "32";
    case Color::Yellow:
        return "33";
    case Color::Blue:
        return "34";
    case Color::Magenta:
        return "35";
    case Color::Cyan:
        return "36";
    case Color::None:
        break;
    }
    return "";
}

std::string Painter::paint(const std::string& text, Color color) const
{
    if (!enabled_ || color == Color::None) {
        return text;
    }

    const std::string style = std::string("\033[") + ansi_code(color) + "m";
    const std::string reset = kReset;

    std::string out = style;
    out.reserve(text.size() + style.size() + reset.size());

    // Re-apply the outer style after each nested reset.
    std::size_t start = 0;
    std::size_t found = text.find(reset);
    while (found != std::string::npos) {
        std::size_t end = found + reset.size();
        out.append(text, start, end - start);
        out.append(style);
        start = end;
        found = text.find(reset, start);
    }
    out.append(text, start, std::string::npos);

    out.append(reset);
    return out;
}

} // namespace logview::render
