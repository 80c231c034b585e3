/**
 * dbstream/storage.hpp - Storage port required by the stream core
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * The stream depends only on these interfaces. SqliteStorage is the bundled
 * implementation; anything offering ordered insert and ordered range scan
 * over one table can stand in.
 */

#pragma once

#include "record.hpp"
#include "types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace dbstream {

// ============================================================================
// Row Scan
// ============================================================================

/**
 * Lazy, ascending, finite scan over rows. Rows are produced one per next();
 * the scan reflects the table as of the call that created it and may or may
 * not include rows appended while it is being stepped.
 */
class RowScan {
public:
    virtual ~RowScan() = default;

    // Advance to the next row. Returns false at end of scan.
    virtual bool next() = 0;

    // Current row; valid after next() returned true.
    virtual const BackendRow& row() const = 0;
};

// ============================================================================
// Cursor Store
// ============================================================================

// Durable reader positions. Positions stored here never regress.
class CursorStore {
public:
    virtual ~CursorStore() = default;

    virtual std::optional<Sequence> load(const std::string& reader) = 0;
    virtual void save(const std::string& reader, Sequence sequence) = 0;
};

// ============================================================================
// Storage Port
// ============================================================================

class StoragePort {
public:
    virtual ~StoragePort() = default;

    /**
     * Insert one row. The sequence is assigned atomically with the insert;
     * no two appends ever receive the same sequence.
     * @return the assigned sequence
     */
    virtual Sequence append(const BackendRow& row) = 0;

    /**
     * Scan rows with sequence strictly greater than `after` (all rows when
     * `after` is empty), ascending. `limit` of 0 means unlimited.
     */
    virtual std::unique_ptr<RowScan> scan_from(std::optional<Sequence> after,
                                               size_t limit = 0) = 0;

    // Highest sequence present, or empty if the table has no rows.
    virtual std::optional<Sequence> max_sequence() = 0;

    // Commit anything buffered. Autocommit backends only check they are open.
    virtual void flush() {}

    // Release the connection. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Persistent cursor store, or nullptr when positions are in-memory only.
    virtual CursorStore* cursor_store() { return nullptr; }

    virtual const std::string& table() const = 0;
};

} // namespace dbstream
