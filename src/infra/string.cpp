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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "logview/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace logview::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    // 1. Prefix Scan: Locate the first character that is NOT a whitespace.
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    // 2. Suffix Scan: Locate the final character that is NOT a whitespace.
    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * @brief Validates UTF-8 with a single forward scan.
 *
 * The lead byte fixes the sequence length and the admissible range of the
 * first continuation byte; the remaining continuation bytes must all be
 * in `0x80..0xBF`.
 */
bool String::is_valid_utf8(const std::string& s)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t size = s.size();
    std::size_t i = 0;

    while (i < size) {
        unsigned char lead = bytes[i];

        if (lead < 0x80) {
            i++;
            continue;
        }

        std::size_t length = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3;
            lo = 0xA0; // overlong
        } else if (lead == 0xED) {
            length = 3;
            hi = 0x9F; // surrogates
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            length = 3;
        } else if (lead == 0xF0) {
            length = 4;
            lo = 0x90; // overlong
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else if (lead == 0xF4) {
            length = 4;
            hi = 0x8F; // above U+10FFFF
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }
        if (bytes[i + 1] < lo || bytes[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k < length; k++) {
            if (bytes[i + k] < 0x80 || bytes[i + k] > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

std::size_t String::char_count(const std::string& s)
{
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string String::center(const std::string& s, std::size_t width)
{
    const std::size_t count = char_count(s);
    if (count >= width) {
        return s;
    }

    const std::size_t pad = width - count;
    const std::size_t left = pad / 2;
    const std::size_t right = pad - left;

    std::string out;
    out.reserve(s.size() + pad);
    out.append(left, ' ');
    out.append(s);
    out.append(right, ' ');
    return out;
}

} // namespace logview::infra
