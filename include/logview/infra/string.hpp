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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` covering trimming, UTF-8 validation and the width-aware
 * padding used when laying out rendered log lines.
 */

#pragma once

#include <cstddef>
#include <string>

namespace logview::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if the
     * input consists solely of whitespace.
     *
     * @code
     * std::string clean = logview::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Lower-cases the ASCII letters of a string.
     */
    static std::string to_lower(const std::string& s);

    /**
     * @brief Checks that a byte sequence is well-formed UTF-8.
     *
     * Rejects overlong encodings, UTF-16 surrogates (U+D800..U+DFFF), code
     * points above U+10FFFF and truncated multi-byte sequences.
     *
     * @param s The bytes to inspect.
     * @return true If every byte belongs to a valid UTF-8 sequence.
     */
    static bool is_valid_utf8(const std::string& s);

    /**
     * @brief Counts Unicode scalar values in UTF-8 text.
     *
     * Continuation bytes (`10xxxxxx`) are not counted, so the result equals
     * the number of code points for valid input.
     */
    static std::size_t char_count(const std::string& s);

    /**
     * @brief Centers text within a fixed character width.
     *
     * Pads with spaces on both sides; when the padding is odd, the extra
     * space goes to the right. Text already `width` characters or longer
     * is returned untouched, never truncated.
     *
     * @param s The text to center.
     * @param width Target width in characters (Unicode scalar values).
     * @return std::string The padded text.
     *
     * @code
     * String::center("warn", 5);  // "warn "
     * String::center("info", 5);  // "info "
     * String::center("ok", 5);    // " ok  "
     * @endcode
     */
    static std::string center(const std::string& s, std::size_t width);
};

} // namespace logview::infra
