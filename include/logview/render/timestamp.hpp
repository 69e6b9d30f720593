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
 * @file timestamp.hpp
 * @brief RFC 3339 timestamp parsing and local-time rendering.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace logview::render {

/**
 * @struct Instant
 * @brief A parsed RFC 3339 date-time reduced to a UTC instant.
 */
struct Instant {
    std::int64_t epoch_seconds = 0; ///< Seconds since 1970-01-01T00:00:00Z.
    int millis = 0;                 ///< Truncated sub-second part, 0..999.
    bool leap_second = false;       ///< Input second field was 60.
};

/**
 * @class Timestamp
 * @brief Best-effort normalizer for record timestamps.
 */
class Timestamp {
  public:
    /**
     * @brief Parses an RFC 3339 date-time with an explicit offset.
     *
     * **Accepted Grammar:**
     * `YYYY-MM-DD (T|t| ) HH:MM:SS [.fraction] (Z|z|+HH:MM|-HH:MM)`
     *
     * Calendar fields are range-checked (including leap years); the
     * fraction may have any number of digits and is truncated to
     * milliseconds.
     *
     * @param text The candidate timestamp.
     * @return std::optional<Instant> The instant, or `std::nullopt` if the
     * text does not match the grammar.
     */
    static std::optional<Instant> parse_rfc3339(const std::string& text);

    /**
     * @brief Renders an instant in the host time zone.
     *
     * Layout: `YYYY-MM-DDTHH:MM:SS.mmm+HH:MM`, with `Z` in place of the
     * offset when the local offset is zero.
     */
    static std::string format_local(const Instant& instant);

    /**
     * @brief Converts a record timestamp to local time.
     *
     * @param text The `timestamp` field as decoded.
     * @return std::string The localized rendering, or `text` unchanged when
     * it is not a valid RFC 3339 date-time.
     *
     * @code
     * // With TZ=CET-1:
     * Timestamp::to_local("2024-01-01T00:00:00Z");  // "2024-01-01T01:00:00.000+01:00"
     * Timestamp::to_local("yesterday");             // "yesterday"
     * @endcode
     */
    static std::string to_local(const std::string& text);
};

} // namespace logview::render
