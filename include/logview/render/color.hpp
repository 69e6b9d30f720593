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
 * @file color.hpp
 * @brief Severity-to-color lookup and ANSI painting.
 *
 * @details
 * Colors form a small closed set. The severity vocabulary is a fixed table:
 * adding a level is a data change in `color.cpp`, not a new type.
 */

#pragma once

#include <string>

namespace logview::render {

/**
 * @enum Color
 * @brief Terminal foreground colors used by the renderer.
 */
enum class Color {
    None,    ///< Default terminal styling.
    Red,     ///< `error`
    Green,   ///< `info`
    Yellow,  ///< `warn`
    Blue,    ///< Source location emphasis.
    Magenta, ///< Timestamp emphasis.
    Cyan     ///< `debug`
};

/**
 * @brief Maps a level label to its color.
 *
 * Comparison is exact and case-sensitive: `"info"` is green, `"INFO"` is
 * not colored.
 *
 * @param level The decoded `level` field.
 * @return Color The associated color, or `Color::None`.
 */
Color color_for_level(const std::string& level);

/**
 * @brief ANSI SGR foreground code for a color (e.g. `"31"`), empty for `None`.
 */
const char* ansi_code(Color color);

/**
 * @class Painter
 * @brief Wraps text in ANSI color sequences when coloring is enabled.
 */
class Painter {
  public:
    /// @param enabled When false, `paint` returns its input unchanged.
    explicit Painter(bool enabled) : enabled_(enabled) {}

    /**
     * @brief Colors a span of text.
     *
     * Output: `ESC[<code>m` + text + `ESC[0m`. Every reset already inside
     * `text` is followed by `ESC[<code>m` so the outer color resumes after
     * a nested, separately colored span.
     *
     * @param text The text to color.
     * @param color Target color; `Color::None` leaves the text untouched.
     */
    std::string paint(const std::string& text, Color color) const;

  private:
    bool enabled_;
};

} // namespace logview::render
