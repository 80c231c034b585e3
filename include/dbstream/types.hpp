/**
 * dbstream/types.hpp - Core types shared by the stream, cursor and storage layers
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace dbstream {

// ============================================================================
// Sequence and Metadata
// ============================================================================

// Assigned by storage at insert time. Defines the total write order.
using Sequence = std::uint64_t;

// Writer context attached to every record, e.g. hostname, pid, session_ts.
using SessionMetadata = std::map<std::string, std::string>;

using log_func_t = std::function<void(const std::string& msg)>;

// ============================================================================
// Stream Mode
// ============================================================================

enum class Mode {
    read,
    write,
    read_write
};

inline const char* mode_name(Mode m) {
    switch (m) {
        case Mode::read:       return "read";
        case Mode::write:      return "write";
        case Mode::read_write: return "read-write";
    }
    return "read";
}

inline bool mode_readable(Mode m) {
    return m == Mode::read || m == Mode::read_write;
}

inline bool mode_writable(Mode m) {
    return m == Mode::write || m == Mode::read_write;
}

// ============================================================================
// Cursor Persistence
// ============================================================================

enum class CursorPersistence {
    ephemeral,  // in-memory, discarded on close
    stored      // kept in <table>_cursors behind the same connection
};

// ============================================================================
// Physical Column Names
// ============================================================================

/**
 * Physical column names of the backing table. Scans alias them to the
 * canonical names below, so decoding never depends on the physical schema.
 */
struct ColumnNames {
    std::string sequence = "sequence";
    std::string payload = "payload";
    std::string metadata = "metadata";
};

namespace column {
inline constexpr const char* sequence = "sequence";
inline constexpr const char* payload = "payload";
inline constexpr const char* metadata = "metadata";
} // namespace column

} // namespace dbstream
