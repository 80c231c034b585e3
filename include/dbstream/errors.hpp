/**
 * dbstream/errors.hpp - Exception taxonomy for table-backed streams
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Every failure surfaces to the immediate caller as one of these types.
 * Catch dbstream::Error to handle all of them.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace dbstream {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Payload or metadata cannot be represented as text. Not retryable.
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& msg) : Error(msg) {}
};

// A stored row cannot be decoded. Aborts the read; the row is never skipped.
class CorruptRecordError : public Error {
public:
    explicit CorruptRecordError(const std::string& msg) : Error(msg) {}
};

// Target table (or a required column of it) does not exist.
class TableMissingError : public Error {
public:
    explicit TableMissingError(const std::string& msg) : Error(msg) {}
};

// Transient backend failure: connection broken, busy, I/O error, closed port.
class StorageUnavailableError : public Error {
public:
    explicit StorageUnavailableError(const std::string& msg) : Error(msg) {}
};

/**
 * Raised by Stream::write when the backend was unavailable.
 * Keeps the message of the StorageUnavailableError that caused it.
 */
class WriteError : public Error {
public:
    explicit WriteError(const StorageUnavailableError& cause)
        : Error(std::string("write failed: ") + cause.what()), cause_(cause.what()) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

class StreamClosedError : public Error {
public:
    StreamClosedError() : Error("I/O operation on closed stream") {}
};

// Read on a write-only stream, or write on a read-only one.
class UnsupportedOperationError : public Error {
public:
    explicit UnsupportedOperationError(const std::string& msg) : Error(msg) {}
};

} // namespace dbstream
