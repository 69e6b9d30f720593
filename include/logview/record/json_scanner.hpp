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
 * @file json_scanner.hpp
 * @brief Strict JSON grammar check for one line of text.
 *
 * @details
 * cJSON is lenient: it takes raw control characters inside strings, leading
 * zeros and any byte up to 0x20 as whitespace. `JsonScanner` runs first and
 * only lets RFC 8259 documents through. It also reports where the direct
 * children of the root container sit in the text, so a value can be kept
 * exactly as written.
 */

#pragma once

#include <string_view>
#include <vector>

namespace logview::record {

/**
 * @class JsonScanner
 * @brief A static, allocation-light RFC 8259 validator.
 */
class JsonScanner {
  public:
    /// @brief Deepest accepted nesting of arrays and objects.
    static constexpr int kMaxDepth = 128;

    /**
     * @brief Validates `text` as exactly one JSON value.
     *
     * **Rejected:**
     * - Control characters (below 0x20) inside strings, unknown escapes and
     *   unpaired UTF-16 surrogates in `\u` escapes.
     * - Numbers with leading zeros, a bare `.` or exponent, or a magnitude
     *   that overflows a double.
     * - Whitespace other than space, tab, LF and CR.
     * - Nesting deeper than `kMaxDepth`, and anything after the value.
     *
     * @param text The candidate document.
     * @param[out] members On success, the text of each member value (object)
     * or element (array) of the root, in document order. Empty for a scalar.
     * The views point into `text`.
     * @return true If `text` is a complete, valid JSON document.
     */
    static bool scan(std::string_view text, std::vector<std::string_view>& members);

    /**
     * @brief True if a number token was written without fraction or exponent.
     */
    static bool is_integer_literal(std::string_view token);
};

} // namespace logview::record
