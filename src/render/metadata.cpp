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
 * @file metadata.cpp
 * @brief Implementation of the metadata renderer.
 */

#include "logview/render/metadata.hpp"

namespace logview::render {

std::string Metadata::to_string(const std::optional<std::string>& metadata)
{
    if (!metadata) {
        return "";
    }

    // Compact: drop insignificant whitespace, copy string literals untouched.
    std::string out;
    out.reserve(metadata->size());

    bool in_string = false;
    bool escaped = false;
    for (char c : *metadata) {
        if (in_string) {
            out += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            continue;
        }
        if (c == '"') {
            in_string = true;
        }
        out += c;
    }
    return out;
}

} // namespace logview::render
