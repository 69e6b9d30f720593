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
 * @file decoder.cpp
 * @brief Implementation of the log line decoder.
 *
 * @details
 * Every line first goes through `JsonScanner`, so only strict JSON reaches
 * cJSON. cJSON then unescapes the string fields. The decoder walks the
 * top-level container itself instead of using `cJSON_GetObjectItem`, because
 * the latter matches keys case-insensitively and silently takes the first of
 * duplicated keys.
 */

#include "logview/record/decoder.hpp"

#include "logview/record/json_scanner.hpp"

#include <cJSON.h>
#include <cstring>
#include <limits>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace logview::record {

namespace {

/**
 * @struct JsonDeleter
 * @brief Releases a parsed cJSON tree.
 */
struct JsonDeleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/// @brief A parsed member together with its source text.
struct Slot {
    const cJSON* node = nullptr;
    std::string_view text;
};

/// @brief The recognised members of one document.
struct FieldSlots {
    Slot level;
    Slot message;
    Slot timestamp;
    Slot file;
    Slot line;
    Slot metadata;
};

bool is_absent(const Slot& slot)
{
    return slot.node == nullptr || cJSON_IsNull(slot.node);
}

bool read_string(const Slot& slot, std::string& out)
{
    if (!cJSON_IsString(slot.node) || slot.node->valuestring == nullptr) {
        return false;
    }
    out = slot.node->valuestring;
    return true;
}

bool read_optional_string(const Slot& slot, std::optional<std::string>& out)
{
    if (is_absent(slot)) {
        out.reset();
        return true;
    }
    std::string value;
    if (!read_string(slot, value)) {
        return false;
    }
    out = std::move(value);
    return true;
}

/**
 * @brief Accepts integer literals that fit in a signed 32-bit integer.
 *
 * `12.0` and `1.2e1` are floats in JSON and are rejected even though their
 * value is integral.
 */
bool read_optional_int32(const Slot& slot, std::optional<std::int32_t>& out)
{
    if (is_absent(slot)) {
        out.reset();
        return true;
    }
    if (!cJSON_IsNumber(slot.node) || !JsonScanner::is_integer_literal(slot.text)) {
        return false;
    }

    double value = slot.node->valuedouble;
    if (value < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
        value > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        return false;
    }
    out = static_cast<std::int32_t>(value);
    return true;
}

/**
 * @brief Binds object members to slots by exact key.
 * @return false If a recognised key occurs more than once.
 */
bool collect_object(const cJSON* object, const std::vector<std::string_view>& texts,
                    FieldSlots& slots)
{
    std::size_t index = 0;
    for (const cJSON* item = object->child; item != nullptr; item = item->next, index++) {
        if (index >= texts.size()) {
            return false;
        }
        if (item->string == nullptr) {
            continue;
        }

        Slot* slot = nullptr;
        if (std::strcmp(item->string, "level") == 0) {
            slot = &slots.level;
        } else if (std::strcmp(item->string, "message") == 0) {
            slot = &slots.message;
        } else if (std::strcmp(item->string, "timestamp") == 0) {
            slot = &slots.timestamp;
        } else if (std::strcmp(item->string, "file") == 0) {
            slot = &slots.file;
        } else if (std::strcmp(item->string, "line") == 0) {
            slot = &slots.line;
        } else if (std::strcmp(item->string, "metadata") == 0) {
            slot = &slots.metadata;
        } else {
            continue;
        }

        if (slot->node != nullptr) {
            return false;
        }
        slot->node = item;
        slot->text = texts[index];
    }
    return index == texts.size();
}

/**
 * @brief Binds the positional form `[level, message, timestamp, file, line, metadata]`.
 */
bool collect_array(const cJSON* array, const std::vector<std::string_view>& texts,
                   FieldSlots& slots)
{
    if (texts.size() != 6 || cJSON_GetArraySize(array) != 6) {
        return false;
    }

    Slot* order[6] = {&slots.level, &slots.message, &slots.timestamp,
                      &slots.file,  &slots.line,    &slots.metadata};
    const cJSON* item = array->child;
    for (std::size_t i = 0; i < 6 && item != nullptr; i++, item = item->next) {
        order[i]->node = item;
        order[i]->text = texts[i];
    }
    return true;
}

} // namespace

/**
 * @brief Decodes a line into a `LogRecord`.
 *
 * Pipeline:
 * 1. **Screen**: `JsonScanner` rejects anything that is not strict JSON and
 *    records the source text of each top-level member.
 * 2. **Parse**: `cJSON_ParseWithOpts` with a required terminator.
 * 3. **Bind**: Map members (object) or elements (array) to field slots.
 * 4. **Convert**: Type-check every slot; metadata is kept as written.
 */
std::optional<LogRecord> Decoder::decode(const std::string& line)
{
    std::vector<std::string_view> texts;
    if (!JsonScanner::scan(line, texts)) {
        return std::nullopt;
    }

    JsonPtr root(cJSON_ParseWithOpts(line.c_str(), nullptr, 1));
    if (!root) {
        return std::nullopt;
    }

    FieldSlots slots;
    bool bound = false;
    if (cJSON_IsObject(root.get())) {
        bound = collect_object(root.get(), texts, slots);
    } else if (cJSON_IsArray(root.get())) {
        bound = collect_array(root.get(), texts, slots);
    }
    if (!bound) {
        return std::nullopt;
    }

    LogRecord record;
    if (!read_string(slots.level, record.level) || !read_string(slots.message, record.message) ||
        !read_string(slots.timestamp, record.timestamp)) {
        return std::nullopt;
    }
    if (!read_optional_string(slots.file, record.source_file) ||
        !read_optional_int32(slots.line, record.source_line)) {
        return std::nullopt;
    }

    if (!is_absent(slots.metadata)) {
        record.metadata = std::string(slots.metadata.text);
    }

    return record;
}

} // namespace logview::record
