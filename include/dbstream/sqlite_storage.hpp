/**
 * dbstream/sqlite_storage.hpp - SQLite implementation of the storage port
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * The backing table must already exist. Its sequence column has to be the
 * INTEGER PRIMARY KEY so SQLite assigns it on insert; the connection is owned
 * exclusively, which makes sqlite3_last_insert_rowid the assigned sequence.
 *
 * Provisioning (done once, outside the stream):
 *
 *   dbstream::Database db("events.db");
 *   dbstream::provision(db, "stdout_stream");
 *
 *   dbstream::SqliteStorage storage({"events.db"}, "stdout_stream");
 *   auto seq = storage.append(dbstream::encode("hello\n", {}));
 */

#pragma once

#include "database.hpp"
#include "errors.hpp"
#include "record.hpp"
#include "storage.hpp"
#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dbstream {

// ============================================================================
// Options
// ============================================================================

struct SqliteOptions {
    std::string path;
    bool create_if_missing = false;  // create the database file, never the table
    int busy_timeout_ms = 5000;
};

// ============================================================================
// SQL Helpers
// ============================================================================

inline std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char ch : name) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

inline std::string cursor_table_name(const std::string& table) {
    return table + "_cursors";
}

inline std::string create_table_sql(const std::string& table,
                                    const ColumnNames& columns = {}) {
    return "CREATE TABLE IF NOT EXISTS " + quote_identifier(table) + " (" +
           quote_identifier(columns.sequence) + " INTEGER PRIMARY KEY AUTOINCREMENT, " +
           quote_identifier(columns.payload) + " TEXT NOT NULL, " +
           quote_identifier(columns.metadata) + " TEXT)";
}

inline std::string create_cursor_table_sql(const std::string& table) {
    return "CREATE TABLE IF NOT EXISTS " + quote_identifier(cursor_table_name(table)) +
           " (reader TEXT PRIMARY KEY, sequence INTEGER NOT NULL, updated_at INTEGER NOT NULL)";
}

/**
 * Create the stream table (and optionally its cursor table).
 * Not used by the stream itself; tables are provisioned before a stream opens.
 * @return false on failure; see db.last_error()
 */
inline bool provision(Database& db, const std::string& table,
                      const ColumnNames& columns = {}, bool with_cursor_table = false) {
    if (db.exec(create_table_sql(table, columns)) != SQLITE_OK) {
        return false;
    }
    if (with_cursor_table && db.exec(create_cursor_table_sql(table)) != SQLITE_OK) {
        return false;
    }
    return true;
}

namespace detail {

inline bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

/**
 * Map a failing SQLite call onto the error taxonomy.
 * "no such table" means the table vanished; everything else is treated as
 * the backend being unavailable (busy, locked, I/O, corrupt file, closed).
 */
[[noreturn]] inline void throw_sqlite_error(const std::string& table, const char* what,
                                            int rc, const std::string& msg) {
    if (starts_with(msg, "no such table")) {
        throw TableMissingError("table '" + table + "' does not exist (" + msg + ")");
    }
    throw StorageUnavailableError(std::string(what) + " on '" + table + "' failed: " +
                                  msg + " [" + sqlite3_errstr(rc) + "]");
}

// Schema lookups report failure through last_rc(); "absent" is not a failure.
inline void check_lookup(const Database& db, const std::string& table, const char* what) {
    if (db.last_rc() != SQLITE_OK) {
        throw_sqlite_error(table, what, db.last_rc(), db.last_error());
    }
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail

// ============================================================================
// Scan
// ============================================================================

class SqliteScan : public RowScan {
public:
    SqliteScan(Statement stmt, std::string table)
        : stmt_(std::move(stmt)), table_(std::move(table)) {}

    bool next() override {
        int rc = stmt_.step();
        if (rc == SQLITE_DONE) {
            return false;
        }
        if (rc != SQLITE_ROW) {
            detail::throw_sqlite_error(table_, "scan", rc, sqlite3_errmsg(stmt_.db()));
        }
        int n = stmt_.column_count();
        row_.columns.resize(n);
        row_.values.resize(n);
        for (int i = 0; i < n; ++i) {
            row_.columns[i] = stmt_.column_name(i);
            row_.values[i] = stmt_.column_text(i);
        }
        return true;
    }

    const BackendRow& row() const override { return row_; }

private:
    Statement stmt_;
    std::string table_;
    BackendRow row_;
};

// ============================================================================
// Cursor Store
// ============================================================================

/**
 * Reader positions in <table>_cursors on the stream's own connection.
 * Upserts keep the larger sequence, so a stored position never regresses
 * even when two processes share a reader identity.
 */
class SqliteCursorStore : public CursorStore {
public:
    SqliteCursorStore(Database& db, std::string table)
        : db_(db), table_(cursor_table_name(table)) {
        bool exists = db_.table_exists(table_);
        detail::check_lookup(db_, table_, "cursor table lookup");
        if (!exists) {
            throw TableMissingError("cursor table '" + table_ + "' does not exist");
        }
    }

    std::optional<Sequence> load(const std::string& reader) override {
        Statement stmt = db_.prepare("SELECT sequence FROM " + quote_identifier(table_) +
                                     " WHERE reader = ?");
        if (!stmt.valid()) {
            detail::throw_sqlite_error(table_, "cursor load", db_.last_rc(), db_.last_error());
        }
        stmt.bind_text(1, reader);
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            detail::throw_sqlite_error(table_, "cursor load", rc, sqlite3_errmsg(db_.handle()));
        }
        int64_t value = stmt.column_int64(0);
        if (value < 0) {
            throw CorruptRecordError("stored cursor for '" + reader + "' is negative");
        }
        return static_cast<Sequence>(value);
    }

    void save(const std::string& reader, Sequence sequence) override {
        Statement stmt = db_.prepare(
            "INSERT INTO " + quote_identifier(table_) + " (reader, sequence, updated_at) "
            "VALUES (?, ?, CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)) "
            "ON CONFLICT(reader) DO UPDATE SET "
            "sequence = MAX(sequence, excluded.sequence), updated_at = excluded.updated_at");
        if (!stmt.valid()) {
            detail::throw_sqlite_error(table_, "cursor save", db_.last_rc(), db_.last_error());
        }
        stmt.bind_text(1, reader);
        stmt.bind_int64(2, static_cast<int64_t>(sequence));
        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            detail::throw_sqlite_error(table_, "cursor save", rc, sqlite3_errmsg(db_.handle()));
        }
    }

private:
    Database& db_;
    std::string table_;
};

// ============================================================================
// Storage
// ============================================================================

class SqliteStorage : public StoragePort {
public:
    /**
     * Open the database and check the table.
     * @throws StorageUnavailableError if the database cannot be opened
     * @throws TableMissingError if the table, one of its columns, or (with
     *         stored cursors) the cursor table is missing
     */
    SqliteStorage(SqliteOptions options, std::string table, ColumnNames columns = {},
                  CursorPersistence cursors = CursorPersistence::ephemeral)
        : options_(std::move(options)), table_(std::move(table)), columns_(std::move(columns)) {
        int flags = SQLITE_OPEN_READWRITE;
        if (options_.create_if_missing) {
            flags |= SQLITE_OPEN_CREATE;
        }
        if (!db_.open(options_.path.c_str(), flags)) {
            throw StorageUnavailableError("cannot open database '" + options_.path + "': " +
                                          db_.last_error());
        }
        int rc = db_.set_busy_timeout(options_.busy_timeout_ms);
        if (rc != SQLITE_OK) {
            detail::throw_sqlite_error(table_, "busy_timeout", rc, sqlite3_errmsg(db_.handle()));
        }

        check_schema();
        if (cursors == CursorPersistence::stored) {
            cursor_store_ = std::make_unique<SqliteCursorStore>(db_, table_);
        }
    }

    // Members release in reverse order: cursor statements, insert, connection.
    ~SqliteStorage() override = default;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    // ========================================================================
    // StoragePort
    // ========================================================================

    Sequence append(const BackendRow& row) override {
        ensure_open();

        const auto* payload = row.find(column::payload);
        if (!payload || !payload->has_value()) {
            throw EncodingError("row to append has no payload");
        }
        const auto* metadata = row.find(column::metadata);

        if (!insert_.valid()) {
            insert_ = db_.prepare("INSERT INTO " + quote_identifier(table_) + " (" +
                                  quote_identifier(columns_.payload) + ", " +
                                  quote_identifier(columns_.metadata) + ") VALUES (?, ?)");
            if (!insert_.valid()) {
                detail::throw_sqlite_error(table_, "append", db_.last_rc(), db_.last_error());
            }
        }

        insert_.bind_text(1, **payload);
        if (metadata && metadata->has_value()) {
            insert_.bind_text(2, **metadata);
        } else {
            insert_.bind_null(2);
        }

        int rc = insert_.step();
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db_.handle());
            insert_.reset();
            detail::throw_sqlite_error(table_, "append", rc, msg);
        }
        auto rowid = db_.last_insert_rowid();
        insert_.reset();
        return static_cast<Sequence>(rowid);
    }

    std::unique_ptr<RowScan> scan_from(std::optional<Sequence> after,
                                       size_t limit = 0) override {
        ensure_open();

        std::string seq = quote_identifier(columns_.sequence);
        std::string sql = "SELECT " + seq + " AS " + column::sequence + ", " +
                          quote_identifier(columns_.payload) + " AS " + column::payload + ", " +
                          quote_identifier(columns_.metadata) + " AS " + column::metadata +
                          " FROM " + quote_identifier(table_);
        if (after) {
            sql += " WHERE " + seq + " > ?";
        }
        sql += " ORDER BY " + seq + " ASC";
        if (limit > 0) {
            sql += " LIMIT ?";
        }

        Statement stmt = db_.prepare(sql);
        if (!stmt.valid()) {
            detail::throw_sqlite_error(table_, "scan", db_.last_rc(), db_.last_error());
        }
        int idx = 1;
        if (after) {
            stmt.bind_int64(idx++, static_cast<int64_t>(*after));
        }
        if (limit > 0) {
            stmt.bind_int64(idx++, static_cast<int64_t>(limit));
        }
        return std::make_unique<SqliteScan>(std::move(stmt), table_);
    }

    std::optional<Sequence> max_sequence() override {
        ensure_open();

        Statement stmt = db_.prepare("SELECT MAX(" + quote_identifier(columns_.sequence) +
                                     ") FROM " + quote_identifier(table_));
        if (!stmt.valid()) {
            detail::throw_sqlite_error(table_, "max_sequence", db_.last_rc(), db_.last_error());
        }
        int rc = stmt.step();
        if (rc != SQLITE_ROW) {
            detail::throw_sqlite_error(table_, "max_sequence", rc, sqlite3_errmsg(db_.handle()));
        }
        if (stmt.column_is_null(0)) {
            return std::nullopt;
        }
        int64_t value = stmt.column_int64(0);
        if (value < 0) {
            throw CorruptRecordError("table '" + table_ + "' holds a negative sequence");
        }
        return static_cast<Sequence>(value);
    }

    void flush() override {
        ensure_open();
    }

    /**
     * Finalize cached statements and close the connection.
     * @throws StorageUnavailableError if SQLite fails to release it
     */
    void close() override {
        if (!db_.is_open()) {
            return;
        }
        insert_ = Statement();
        cursor_store_.reset();
        if (!db_.close()) {
            throw StorageUnavailableError("closing '" + options_.path + "' failed: " +
                                          db_.last_error());
        }
    }

    bool is_open() const override { return db_.is_open(); }

    CursorStore* cursor_store() override { return cursor_store_.get(); }

    const std::string& table() const override { return table_; }

    // ========================================================================
    // Accessors
    // ========================================================================

    const SqliteOptions& options() const { return options_; }
    const ColumnNames& columns() const { return columns_; }
    Database& database() { return db_; }

private:
    void ensure_open() const {
        if (!db_.is_open()) {
            throw StorageUnavailableError("storage for '" + table_ + "' is closed");
        }
    }

    void check_schema() {
        bool exists = db_.table_exists(table_);
        detail::check_lookup(db_, table_, "table lookup");
        if (!exists) {
            throw TableMissingError("table '" + table_ + "' does not exist");
        }
        auto info = db_.table_columns(table_);
        detail::check_lookup(db_, table_, "table_info");
        auto find = [&](const std::string& name) -> const Database::ColumnInfo* {
            for (const auto& col : info) {
                if (col.name == name) return &col;
            }
            return nullptr;
        };

        const auto* seq = find(columns_.sequence);
        if (!seq) {
            throw TableMissingError("table '" + table_ + "' has no column '" +
                                    columns_.sequence + "'");
        }
        // Only a sole INTEGER PRIMARY KEY aliases the rowid SQLite assigns.
        bool sole_key = seq->pk == 1 &&
            std::none_of(info.begin(), info.end(), [&](const Database::ColumnInfo& col) {
                return col.pk > 0 && col.name != seq->name;
            });
        if (!sole_key || detail::lower(seq->type) != "integer") {
            throw TableMissingError("column '" + columns_.sequence + "' of table '" + table_ +
                                    "' is not its INTEGER PRIMARY KEY");
        }
        for (const auto* name : {&columns_.payload, &columns_.metadata}) {
            if (!find(*name)) {
                throw TableMissingError("table '" + table_ + "' has no column '" + *name + "'");
            }
        }
    }

    SqliteOptions options_;
    std::string table_;
    ColumnNames columns_;
    Database db_;
    Statement insert_;
    std::unique_ptr<SqliteCursorStore> cursor_store_;
};

} // namespace dbstream
