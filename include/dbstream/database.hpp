/**
 * dbstream/database.hpp - RAII SQLite connection and statement wrappers
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Example usage:
 *
 *   dbstream::Database db;
 *   if (!db.open("events.db", SQLITE_OPEN_READWRITE)) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *
 *   auto stmt = db.prepare("SELECT sequence, payload FROM stdout_stream WHERE sequence > ?");
 *   stmt.bind_int64(1, 10);
 *   while (stmt.step() == SQLITE_ROW) {
 *       printf("%s\n", stmt.column_text(1).value_or("").c_str());
 *   }
 */

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbstream {

// ============================================================================
// Prepared Statement
// ============================================================================

/**
 * Owns one sqlite3_stmt. Finalized on destruction; movable, non-copyable.
 * Return codes are passed through untouched so callers can map them.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement() { finalize(); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept
        : db_(other.db_), stmt_(other.stmt_) {
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }

    Statement& operator=(Statement&& other) noexcept {
        if (this != &other) {
            finalize();
            db_ = other.db_;
            stmt_ = other.stmt_;
            other.db_ = nullptr;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    bool valid() const { return stmt_ != nullptr; }

    int bind_text(int idx, const std::string& value) {
        return sqlite3_bind_text(stmt_, idx, value.data(),
                                 static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    int bind_int64(int idx, int64_t value) {
        return sqlite3_bind_int64(stmt_, idx, value);
    }

    int bind_null(int idx) {
        return sqlite3_bind_null(stmt_, idx);
    }

    int step() { return sqlite3_step(stmt_); }

    int reset() { return sqlite3_reset(stmt_); }

    int column_count() const { return sqlite3_column_count(stmt_); }

    std::string column_name(int col) const {
        const char* name = sqlite3_column_name(stmt_, col);
        return name ? name : "";
    }

    bool column_is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    // NULL maps to an empty optional; text keeps embedded NULs.
    std::optional<std::string> column_text(int col) const {
        if (column_is_null(col)) return std::nullopt;
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        int bytes = sqlite3_column_bytes(stmt_, col);
        if (!text) return std::string();
        return std::string(text, static_cast<size_t>(bytes));
    }

    sqlite3_stmt* handle() const { return stmt_; }
    sqlite3* db() const { return db_; }

private:
    void finalize() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    Database() { open(":memory:"); }

    /**
     * Constructor with explicit path
     */
    explicit Database(const char* path,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) {
        open(path, flags);
    }
    ~Database() { close(); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_), last_error_(std::move(other.last_error_)), last_rc_(other.last_rc_) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            last_error_ = std::move(other.last_error_);
            last_rc_ = other.last_rc_;
            other.db_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Open/Close
    // ========================================================================

    bool open(const char* path = ":memory:",
              int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) {
        close();
        int rc = sqlite3_open_v2(path, &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            last_rc_ = rc;
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return false;
        }
        last_error_.clear();
        last_rc_ = SQLITE_OK;
        return true;
    }

    /**
     * Release the connection. Statements still alive keep the connection as a
     * zombie until they are finalized (sqlite3_close_v2 semantics).
     * @return false if SQLite reported a failure; see last_error()
     */
    bool close() {
        if (!db_) {
            return true;
        }
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errstr(rc);
            last_rc_ = rc;
            db_ = nullptr;
            return false;
        }
        db_ = nullptr;
        return true;
    }

    bool is_open() const { return db_ != nullptr; }

    int set_busy_timeout(int ms) {
        if (!db_) {
            last_error_ = "Database not open";
            return SQLITE_MISUSE;
        }
        return sqlite3_busy_timeout(db_, ms);
    }

    // ========================================================================
    // Statements
    // ========================================================================

    /**
     * Prepare a statement. On failure the returned Statement is not valid()
     * and last_error()/last_rc() describe why.
     */
    Statement prepare(const std::string& sql) {
        if (!db_) {
            last_error_ = "Database not open";
            last_rc_ = SQLITE_MISUSE;
            return Statement();
        }
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
            last_rc_ = rc;
            if (stmt) sqlite3_finalize(stmt);
            return Statement();
        }
        return Statement(db_, stmt);
    }

    // ========================================================================
    // Execution
    // ========================================================================

    int exec(const char* sql) {
        if (!db_) {
            last_error_ = "Database not open";
            return SQLITE_ERROR;
        }

        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
        } else {
            last_error_.clear();
        }
        last_rc_ = rc;
        return rc;
    }

    int exec(const std::string& sql) {
        return exec(sql.c_str());
    }

    // ========================================================================
    // Schema Inspection
    // ========================================================================

    /**
     * @return false if the table is absent or the lookup failed; on failure
     *         last_rc() is the SQLite error, otherwise SQLITE_OK
     */
    bool table_exists(const std::string& table) {
        Statement stmt = prepare(
            "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
        if (!stmt.valid()) return false;
        stmt.bind_text(1, table);
        int rc = stmt.step();
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            return step_failed(rc);
        }
        last_rc_ = SQLITE_OK;
        return rc == SQLITE_ROW;
    }

    struct ColumnInfo {
        std::string name;
        std::string type;
        int pk = 0;         // 1-based position in the primary key, 0 if not part of it
    };

    /**
     * Columns of `table` via PRAGMA table_info; empty if the table is missing.
     * An empty result with last_rc() != SQLITE_OK means the lookup failed.
     */
    std::vector<ColumnInfo> table_columns(const std::string& table) {
        std::vector<ColumnInfo> out;
        Statement stmt = prepare(
            "SELECT name, type, pk FROM pragma_table_info(?)");
        if (!stmt.valid()) return out;
        stmt.bind_text(1, table);
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            ColumnInfo info;
            info.name = stmt.column_text(0).value_or("");
            info.type = stmt.column_text(1).value_or("");
            info.pk = static_cast<int>(stmt.column_int64(2));
            out.push_back(std::move(info));
        }
        if (rc != SQLITE_DONE) {
            step_failed(rc);
            out.clear();
            return out;
        }
        last_rc_ = SQLITE_OK;
        return out;
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }
    const std::string& last_error() const { return last_error_; }
    int last_rc() const { return last_rc_; }

    // ========================================================================
    // Utility
    // ========================================================================

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

private:
    bool step_failed(int rc) {
        last_error_ = sqlite3_errmsg(db_);
        last_rc_ = rc;
        return false;
    }

    sqlite3* db_ = nullptr;
    std::string last_error_;
    int last_rc_ = SQLITE_OK;
};

} // namespace dbstream
