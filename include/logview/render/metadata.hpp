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
 * @file metadata.hpp
 * @brief Single-line rendering of a record's metadata value.
 */

#pragma once

#include <optional>
#include <string>

namespace logview::render {

/**
 * @class Metadata
 * @brief Serializes the optional metadata value for display.
 */
class Metadata {
  public:
    /**
     * @brief Produces compact JSON text for the metadata value.
     *
     * Whitespace between tokens is removed; everything else (member order,
     * number spelling, string escapes) is kept exactly as written, so
     * `1.0` stays `1.0` and 64-bit identifiers keep every digit.
     *
     * @param metadata Valid JSON text of the value, or empty when absent.
     * @return std::string e.g. `{"user":"ana","attempt":2}`.
     */
    static std::string to_string(const std::optional<std::string>& metadata);
};

} // namespace logview::render
