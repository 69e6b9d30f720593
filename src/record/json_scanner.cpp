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
 * @file json_scanner.cpp
 * @brief Implementation of the strict JSON grammar check.
 *
 * @details
 * A recursive-descent pass over the bytes with one cursor. Nothing is
 * materialized; strings and numbers are only checked, never decoded.
 */

#include "logview/record/json_scanner.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace logview::record {

namespace {

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool is_whitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

class Cursor {
  public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }

    /// @brief Current byte, or NUL past the end (NUL never starts a token).
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_whitespace()
    {
        while (!at_end() && is_whitespace(text_[pos_])) {
            pos_++;
        }
    }

    /**
     * @brief Consumes one value. `members` is non-null only for the root.
     */
    bool value(int depth, std::vector<std::string_view>* members)
    {
        switch (peek()) {
        case '{':
            return object(depth + 1, members);
        case '[':
            return array(depth + 1, members);
        case '"':
            return string();
        case 't':
            return literal("true");
        case 'f':
            return literal("false");
        case 'n':
            return literal("null");
        default:
            return number();
        }
    }

  private:
    bool member(int depth, std::vector<std::string_view>* members)
    {
        std::size_t start = pos_;
        if (!value(depth, nullptr)) {
            return false;
        }
        if (members != nullptr) {
            members->push_back(text_.substr(start, pos_ - start));
        }
        return true;
    }

    bool object(int depth, std::vector<std::string_view>* members)
    {
        if (depth > JsonScanner::kMaxDepth) {
            return false;
        }
        pos_++;
        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return true;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"' || !string()) {
                return false;
            }
            skip_whitespace();
            if (peek() != ':') {
                return false;
            }
            pos_++;
            skip_whitespace();
            if (!member(depth, members)) {
                return false;
            }
            skip_whitespace();
            if (peek() == ',') {
                pos_++;
            } else if (peek() == '}') {
                pos_++;
                return true;
            } else {
                return false;
            }
        }
    }

    bool array(int depth, std::vector<std::string_view>* members)
    {
        if (depth > JsonScanner::kMaxDepth) {
            return false;
        }
        pos_++;
        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return true;
        }

        while (true) {
            skip_whitespace();
            if (!member(depth, members)) {
                return false;
            }
            skip_whitespace();
            if (peek() == ',') {
                pos_++;
            } else if (peek() == ']') {
                pos_++;
                return true;
            } else {
                return false;
            }
        }
    }

    bool string()
    {
        pos_++;
        while (!at_end()) {
            unsigned char c = static_cast<unsigned char>(text_[pos_++]);
            if (c == '"') {
                return true;
            }
            if (c < 0x20) {
                return false;
            }
            if (c == '\\' && !escape()) {
                return false;
            }
        }
        return false;
    }

    bool escape()
    {
        if (at_end()) {
            return false;
        }
        switch (text_[pos_++]) {
        case '"':
        case '\\':
        case '/':
        case 'b':
        case 'f':
        case 'n':
        case 'r':
        case 't':
            return true;
        case 'u':
            break;
        default:
            return false;
        }

        int unit = 0;
        if (!hex4(unit)) {
            return false;
        }
        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return false;
        }
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // A high surrogate must be followed by an escaped low surrogate.
            if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
                return false;
            }
            pos_ += 2;
            int low = 0;
            if (!hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                return false;
            }
        }
        return true;
    }

    bool hex4(int& out)
    {
        if (pos_ + 4 > text_.size()) {
            return false;
        }
        int value = 0;
        for (int i = 0; i < 4; i++) {
            int digit = hex_value(text_[pos_++]);
            if (digit < 0) {
                return false;
            }
            value = value * 16 + digit;
        }
        out = value;
        return true;
    }

    /**
     * @brief `-? (0 | [1-9][0-9]*) (.[0-9]+)? ([eE][+-]?[0-9]+)?`
     */
    bool number()
    {
        std::size_t start = pos_;

        if (peek() == '-') {
            pos_++;
        }
        if (peek() == '0') {
            pos_++;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) {
                pos_++;
            }
        } else {
            return false;
        }

        if (peek() == '.') {
            pos_++;
            if (!is_digit(peek())) {
                return false;
            }
            while (is_digit(peek())) {
                pos_++;
            }
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') {
                pos_++;
            }
            if (!is_digit(peek())) {
                return false;
            }
            while (is_digit(peek())) {
                pos_++;
            }
        }

        // Magnitudes past the double range (e.g. 1e999) have no value.
        const std::string token(text_.substr(start, pos_ - start));
        return !std::isinf(std::strtod(token.c_str(), nullptr));
    }

    bool literal(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word) {
            return false;
        }
        pos_ += word.size();
        return true;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace

bool JsonScanner::scan(std::string_view text, std::vector<std::string_view>& members)
{
    members.clear();

    Cursor cursor(text);
    cursor.skip_whitespace();
    if (!cursor.value(0, &members)) {
        members.clear();
        return false;
    }
    cursor.skip_whitespace();
    if (!cursor.at_end()) {
        members.clear();
        return false;
    }
    return true;
}

bool JsonScanner::is_integer_literal(std::string_view token)
{
    return !token.empty() && token.find_first_of(".eE") == std::string_view::npos;
}

} // namespace logview::record
