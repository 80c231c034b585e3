/**
 * dbstream/record.hpp - Record model and its mapping to backend rows
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * A record is (sequence, payload, session metadata). Metadata travels as a
 * single JSON object column. decode() fails loudly on anything it cannot
 * account for instead of defaulting missing fields.
 *
 * Example:
 *
 *   auto row = dbstream::encode("hello\n", {{"hostname", "box"}});
 *   // ... storage appends row, later scans it back with a sequence ...
 *   dbstream::Record rec = dbstream::decode(scanned_row);
 */

#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbstream {

using json = nlohmann::json;

// ============================================================================
// Record Types
// ============================================================================

struct Record {
    Sequence sequence = 0;
    std::string payload;
    SessionMetadata metadata;
};

/**
 * Native row shape exchanged with a StoragePort: column names plus nullable
 * text values, in matching order.
 */
struct BackendRow {
    std::vector<std::string> columns;
    std::vector<std::optional<std::string>> values;

    void set(const std::string& name, std::optional<std::string> value) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) {
                values[i] = std::move(value);
                return;
            }
        }
        columns.push_back(name);
        values.push_back(std::move(value));
    }

    // nullptr if the column is absent; a disengaged optional if it is NULL
    const std::optional<std::string>* find(std::string_view name) const {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) return &values[i];
        }
        return nullptr;
    }

    size_t size() const { return columns.size(); }
};

// ============================================================================
// Text Validation
// ============================================================================

inline bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

// ============================================================================
// Metadata Column
// ============================================================================

inline std::string encode_metadata(const SessionMetadata& metadata) {
    json obj = json::object();
    for (const auto& [key, value] : metadata) {
        if (!is_valid_utf8(key)) {
            throw EncodingError("metadata key is not valid UTF-8 text");
        }
        if (!is_valid_utf8(value)) {
            throw EncodingError("metadata value for '" + key + "' is not valid UTF-8 text");
        }
        obj[key] = value;
    }
    return obj.dump();
}

inline SessionMetadata decode_metadata(const std::string& text) {
    json obj = json::parse(text, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        throw CorruptRecordError("metadata column is not a JSON object");
    }
    SessionMetadata out;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_string()) {
            throw CorruptRecordError("metadata value for '" + it.key() + "' is not a string");
        }
        out.emplace(it.key(), it.value().get<std::string>());
    }
    return out;
}

// ============================================================================
// Encode / Decode
// ============================================================================

/**
 * Build the row to append. The sequence column is left out: storage assigns it.
 * @throws EncodingError if payload or metadata is not valid UTF-8
 */
inline BackendRow encode(std::string_view payload, const SessionMetadata& metadata) {
    if (!is_valid_utf8(payload)) {
        throw EncodingError("payload is not valid UTF-8 text");
    }
    BackendRow row;
    row.set(column::payload, std::string(payload));
    row.set(column::metadata, encode_metadata(metadata));
    return row;
}

inline Sequence parse_sequence(const std::string& text) {
    Sequence value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw CorruptRecordError("sequence '" + text + "' is not a non-negative integer");
    }
    return value;
}

/**
 * Turn a scanned row back into a Record.
 * A NULL metadata value decodes as empty metadata (rows inserted by
 * producers that record no writer context); an absent column does not.
 * @throws CorruptRecordError on missing columns, NULL sequence/payload,
 *         a malformed sequence or malformed metadata
 */
inline Record decode(const BackendRow& row) {
    const auto* seq = row.find(column::sequence);
    const auto* payload = row.find(column::payload);
    const auto* metadata = row.find(column::metadata);

    if (!seq) throw CorruptRecordError("row has no sequence column");
    if (!payload) throw CorruptRecordError("row has no payload column");
    if (!metadata) throw CorruptRecordError("row has no metadata column");
    if (!seq->has_value()) throw CorruptRecordError("row has a NULL sequence");

    Record rec;
    rec.sequence = parse_sequence(**seq);
    if (!payload->has_value()) {
        throw CorruptRecordError("row " + **seq + " has a NULL payload");
    }
    rec.payload = **payload;
    if (metadata->has_value()) {
        rec.metadata = decode_metadata(**metadata);
    }
    return rec;
}

} // namespace dbstream
