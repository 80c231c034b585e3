/**
 * dbstream/stream.hpp - File-like append/read stream over a table
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Writers append lines tagged with session metadata. Readers pull only the
 * rows they have not seen yet, in write order, each reader identity keeping
 * its own position.
 *
 * Example:
 *
 *   dbstream::StreamConfig cfg;
 *   cfg.table = "stdout_stream";
 *   cfg.session_metadata = {{"job", "nightly"}};
 *
 *   auto stream = dbstream::Stream::open({"events.db"}, cfg);
 *   stream.write("alpha\n");
 *   stream.write("beta\n");
 *
 *   for (const auto& line : stream.read_new("tailer")) {
 *       std::cout << line;
 *   }
 *   stream.close();
 */

#pragma once

#include "cursor.hpp"
#include "errors.hpp"
#include "record.hpp"
#include "session.hpp"
#include "sqlite_storage.hpp"
#include "storage.hpp"
#include "types.hpp"

#include <atomic>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dbstream {

// ============================================================================
// Configuration
// ============================================================================

struct StreamConfig {
    std::string table;                        // required
    Mode mode = Mode::read_write;
    SessionMetadata session_metadata;         // attached to every write
    bool attach_process_info = true;          // add session_ts, hostname, pid
    CursorPersistence cursors = CursorPersistence::ephemeral;
    ColumnNames columns;
    std::string default_reader = "default";   // used by the reader-less overloads

    bool verbose = false;
    log_func_t log_func;
};

namespace detail {

// State shared by a Stream and the NewRecords it hands out, so a pending
// read never outlives the connection it steps.
struct StreamState {
    explicit StreamState(std::unique_ptr<StoragePort> port)
        : storage(std::move(port)), cursors(storage->cursor_store()) {}

    std::unique_ptr<StoragePort> storage;
    CursorTracker cursors;
    std::atomic<bool> closed{false};
};

} // namespace detail

// ============================================================================
// NewRecords - lazy result of Stream::read_new
// ============================================================================

/**
 * Rows newer than the reader's position, ascending. Each row advances the
 * reader's cursor as it is handed out; rows never reached stay unconsumed.
 * Move-only. Single pass; call read_new again to pick up later writes.
 */
class NewRecords {
public:
    NewRecords(std::shared_ptr<detail::StreamState> state, std::string reader,
               std::unique_ptr<RowScan> scan)
        : state_(std::move(state)), reader_(std::move(reader)), scan_(std::move(scan)) {}

    NewRecords(const NewRecords&) = delete;
    NewRecords& operator=(const NewRecords&) = delete;
    NewRecords(NewRecords&&) noexcept = default;
    NewRecords& operator=(NewRecords&&) noexcept = default;

    /**
     * Fetch the next unconsumed record.
     * @return false once the scan is exhausted
     * @throws StreamClosedError if the stream was closed meanwhile
     * @throws CorruptRecordError on an undecodable or out-of-order row; the
     *         cursor stays before that row and the batch is finished
     */
    bool next(Record& out) {
        if (!scan_) {
            return false;
        }
        if (state_->closed) {
            throw StreamClosedError();
        }
        // A failed row ends the batch, so nothing past it is handed out
        // before a fresh read_new starts again from the cursor.
        try {
            while (scan_->next()) {
                Record rec = decode(scan_->row());
                if (last_ && rec.sequence <= *last_) {
                    throw CorruptRecordError("scan returned sequence " +
                                             std::to_string(rec.sequence) + " after " +
                                             std::to_string(*last_));
                }
                last_ = rec.sequence;
                // Already taken by another read under the same identity.
                if (!state_->cursors.advance(reader_, rec.sequence)) {
                    continue;
                }
                out = std::move(rec);
                return true;
            }
        } catch (const Error&) {
            scan_.reset();
            throw;
        }
        scan_.reset();
        return false;
    }

    // Drain the remaining payloads.
    std::vector<std::string> collect() {
        std::vector<std::string> out;
        Record rec;
        while (next(rec)) {
            out.push_back(std::move(rec.payload));
        }
        return out;
    }

    const std::string& reader() const { return reader_; }

    // ------------------------------------------------------------------------
    // Input iteration over payloads
    // ------------------------------------------------------------------------

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(NewRecords* owner) : owner_(owner) { ++*this; }

        reference operator*() const { return current_.payload; }
        pointer operator->() const { return &current_.payload; }

        iterator& operator++() {
            if (owner_ && !owner_->next(current_)) {
                owner_ = nullptr;
            }
            return *this;
        }

        bool operator==(const iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const iterator& other) const { return owner_ != other.owner_; }

        // Sequence and metadata of the current payload.
        const Record& record() const { return current_; }

    private:
        NewRecords* owner_ = nullptr;
        Record current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<detail::StreamState> state_;
    std::string reader_;
    std::unique_ptr<RowScan> scan_;
    std::optional<Sequence> last_;
};

// ============================================================================
// Stream
// ============================================================================

class Stream {
public:
    /**
     * Bind a stream to an already-open storage port. The stream takes
     * exclusive ownership of the port and closes it on close().
     * @throws std::invalid_argument if stored cursors are requested from a
     *         port without a cursor store
     */
    Stream(std::unique_ptr<StoragePort> storage, StreamConfig config)
        : config_(std::move(config)) {
        if (!storage) {
            throw std::invalid_argument("stream needs a storage port");
        }
        if (config_.cursors == CursorPersistence::stored && !storage->cursor_store()) {
            throw std::invalid_argument("storage for '" + storage->table() +
                                        "' has no cursor store");
        }
        metadata_ = config_.attach_process_info
            ? session::merge(session::current(), config_.session_metadata)
            : config_.session_metadata;
        state_ = std::make_shared<detail::StreamState>(std::move(storage));
        log(std::string("opened ") + mode_name(config_.mode) + " stream on '" +
            state_->storage->table() + "'");
    }

    /**
     * Open a SQLite-backed stream on config.table.
     * @throws std::invalid_argument if config.table is empty
     * @throws TableMissingError, StorageUnavailableError from SqliteStorage
     */
    static Stream open(const SqliteOptions& options, StreamConfig config) {
        if (config.table.empty()) {
            throw std::invalid_argument("stream config has no table");
        }
        auto storage = std::make_unique<SqliteStorage>(options, config.table, config.columns,
                                                       config.cursors);
        return Stream(std::move(storage), std::move(config));
    }

    ~Stream() {
        try {
            close();
        } catch (const std::exception& e) {
            log(std::string("close failed: ") + e.what());
        }
    }

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    Stream(Stream&& other) noexcept
        : config_(std::move(other.config_)),
          metadata_(std::move(other.metadata_)),
          state_(std::move(other.state_)) {}

    Stream& operator=(Stream&& other) noexcept {
        if (this != &other) {
            try {
                close();
            } catch (const std::exception& e) {
                log(std::string("close failed: ") + e.what());
            }
            config_ = std::move(other.config_);
            metadata_ = std::move(other.metadata_);
            state_ = std::move(other.state_);
        }
        return *this;
    }

    // ========================================================================
    // Writing
    // ========================================================================

    /**
     * Append one record carrying this stream's session metadata.
     * @return the sequence storage assigned to it
     * @throws StreamClosedError, UnsupportedOperationError, EncodingError,
     *         TableMissingError, WriteError (backend unavailable)
     */
    Sequence write(std::string_view text) {
        ensure_open();
        if (!mode_writable(config_.mode)) {
            throw UnsupportedOperationError("stream is not writable");
        }
        BackendRow row = encode(text, metadata_);
        try {
            return state_->storage->append(row);
        } catch (const StorageUnavailableError& e) {
            throw WriteError(e);
        }
    }

    void flush() {
        ensure_open();
        state_->storage->flush();
    }

    // ========================================================================
    // Reading
    // ========================================================================

    /**
     * Everything `reader` has not consumed yet, lazily, in sequence order.
     * Two calls with no write in between: the second yields nothing.
     */
    NewRecords read_new(const std::string& reader) {
        ensure_readable();
        auto from = state_->cursors.position_of(reader);
        return NewRecords(state_, reader, state_->storage->scan_from(from));
    }

    NewRecords read_new() { return read_new(config_.default_reader); }

    // One record, or empty at end of data. Steps only as far as the first
    // row this reader has not consumed.
    std::optional<std::string> readline(const std::string& reader) {
        auto batch = read_new(reader);
        Record rec;
        if (batch.next(rec)) {
            return std::move(rec.payload);
        }
        return std::nullopt;
    }

    std::optional<std::string> readline() { return readline(config_.default_reader); }

    /**
     * Concatenated payloads. With size >= 0, stops once at least `size`
     * characters were gathered; whole records only, never split.
     */
    std::string read(const std::string& reader, std::ptrdiff_t size = -1) {
        ensure_readable();
        std::string out;
        if (size == 0) {
            return out;
        }
        auto batch = read_new(reader);
        Record rec;
        while (batch.next(rec)) {
            out += rec.payload;
            if (size > 0 && out.size() >= static_cast<size_t>(size)) {
                break;
            }
        }
        return out;
    }

    std::string read(std::ptrdiff_t size = -1) { return read(config_.default_reader, size); }

    // Payloads as a list. With hint > 0, stops once `hint` characters were gathered.
    std::vector<std::string> readlines(const std::string& reader, std::ptrdiff_t hint = -1) {
        ensure_readable();
        std::vector<std::string> lines;
        size_t total = 0;
        auto batch = read_new(reader);
        Record rec;
        while (batch.next(rec)) {
            total += rec.payload.size();
            lines.push_back(std::move(rec.payload));
            if (hint > 0 && total >= static_cast<size_t>(hint)) {
                break;
            }
        }
        return lines;
    }

    std::vector<std::string> readlines(std::ptrdiff_t hint = -1) {
        return readlines(config_.default_reader, hint);
    }

    // ========================================================================
    // Positions
    // ========================================================================

    std::optional<Sequence> position(const std::string& reader) {
        ensure_open();
        return state_->cursors.position_of(reader);
    }

    std::optional<Sequence> max_sequence() {
        ensure_open();
        return state_->storage->max_sequence();
    }

    // True if rows past the reader's position exist right now.
    bool has_new(const std::string& reader) {
        ensure_readable();
        auto last = max_sequence();
        if (!last) {
            return false;
        }
        auto pos = state_->cursors.position_of(reader);
        return !pos || *last > *pos;
    }

    bool has_new() { return has_new(config_.default_reader); }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Release the storage connection. Calling it again is a no-op.
     * In-memory positions are discarded.
     * @throws StorageUnavailableError if the backend fails to release; this is
     *         reported once, the stream stays closed
     */
    void close() {
        if (!state_ || state_->closed.exchange(true)) {
            return;
        }
        state_->cursors.clear();
        log("closing stream on '" + state_->storage->table() + "'");
        state_->storage->close();
    }

    bool closed() const { return !state_ || state_->closed; }
    bool readable() const { return !closed() && mode_readable(config_.mode); }
    bool writable() const { return !closed() && mode_writable(config_.mode); }

    Mode mode() const { return config_.mode; }
    const std::string& table() const { return state_ ? state_->storage->table() : config_.table; }
    const SessionMetadata& session_metadata() const { return metadata_; }
    const StreamConfig& config() const { return config_; }

private:
    void ensure_open() const {
        if (closed()) {
            throw StreamClosedError();
        }
    }

    void ensure_readable() const {
        ensure_open();
        if (!mode_readable(config_.mode)) {
            throw UnsupportedOperationError("stream is not readable");
        }
    }

    void log(const std::string& msg) const {
        if (config_.log_func) {
            config_.log_func(msg);
        } else if (config_.verbose) {
            std::cerr << "[dbstream] " << msg << std::endl;
        }
    }

    StreamConfig config_;
    SessionMetadata metadata_;
    std::shared_ptr<detail::StreamState> state_;
};

} // namespace dbstream
