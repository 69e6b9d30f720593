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
 * @file timestamp.cpp
 * @brief Implementation of the RFC 3339 normalizer.
 *
 * @details
 * The parser is a single left-to-right pass over fixed-width fields; no
 * regular expressions and no locale-dependent `std::get_time`. Conversion to
 * the host time zone goes through `localtime_r`, which honors `TZ`.
 */

#include "logview/render/timestamp.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logview::render {

namespace {

/**
 * @brief Reads exactly `count` ASCII digits starting at `pos`.
 */
bool read_digits(const std::string& s, std::size_t pos, std::size_t count, int& out)
{
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; i++) {
        char c = s[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month)
{
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 *
 * Era-based civil-to-days conversion; exact for every year.
 */
std::int64_t days_from_civil(int year, int month, int day)
{
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace

/**
 * @brief Parses `YYYY-MM-DDTHH:MM:SS[.f+](Z|±HH:MM)`.
 *
 * Field positions 0..18 are fixed; the fraction and the offset follow.
 */
std::optional<Instant> Timestamp::parse_rfc3339(const std::string& text)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, 0, 4, year) || text.size() < 20 || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }

    char sep = text[10];
    if (sep != 'T' && sep != 't' && sep != ' ') {
        return std::nullopt;
    }

    if (!read_digits(text, 11, 2, hour) || text[13] != ':' || !read_digits(text, 14, 2, minute) ||
        text[16] != ':' || !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int millis = 0;

    if (pos < text.size() && text[pos] == '.') {
        pos++;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            // Only the first three digits contribute; the rest is truncated.
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            digits++;
            pos++;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t d = digits; d < 3; d++) {
            millis *= 10;
        }
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    int offset_seconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        pos++;
    } else if (zone == '+' || zone == '-') {
        int off_hour = 0, off_minute = 0;
        if (!read_digits(text, pos + 1, 2, off_hour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, off_minute)) {
            return std::nullopt;
        }
        if (off_hour > 23 || off_minute > 59) {
            return std::nullopt;
        }
        offset_seconds = (off_hour * 3600 + off_minute * 60) * (zone == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    Instant instant;
    instant.leap_second = (second == 60);
    const int effective_second = instant.leap_second ? 59 : second;
    instant.epoch_seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 +
                            minute * 60 + effective_second - offset_seconds;
    instant.millis = millis;
    return instant;
}

/**
 * @brief Formats an instant using the host zone rules (`TZ`).
 */
std::string Timestamp::format_local(const Instant& instant)
{
    std::time_t raw = static_cast<std::time_t>(instant.epoch_seconds);
    std::tm local{};
    if (localtime_r(&raw, &local) == nullptr) {
        // Out of range for the platform time_t conversion: stay in UTC.
        gmtime_r(&raw, &local);
        local.tm_gmtoff = 0;
    }

    if (instant.leap_second) {
        local.tm_sec = 60;
    }

    std::ostringstream out;
    out << std::setfill('0');

    const long year = static_cast<long>(local.tm_year) + 1900;
    if (year < 0) {
        out << '-' << std::setw(4) << -year;
    } else if (year > 9999) {
        out << '+' << year;
    } else {
        out << std::setw(4) << year;
    }

    out << '-' << std::setw(2) << (local.tm_mon + 1) << '-' << std::setw(2) << local.tm_mday
        << 'T' << std::setw(2) << local.tm_hour << ':' << std::setw(2) << local.tm_min << ':'
        << std::setw(2) << local.tm_sec << '.' << std::setw(3) << instant.millis;

    const long offset = local.tm_gmtoff;
    if (offset == 0) {
        out << 'Z';
    } else {
        const long magnitude = std::labs(offset);
        out << (offset < 0 ? '-' : '+') << std::setw(2) << magnitude / 3600 << ':'
            << std::setw(2) << (magnitude % 3600) / 60;
    }

    return out.str();
}

std::string Timestamp::to_local(const std::string& text)
{
    auto instant = parse_rfc3339(text);
    if (!instant) {
        return text;
    }
    return format_local(*instant);
}

} // namespace logview::render
