/**
 * dbstream/streambuf.hpp - std::streambuf adapters over a Stream
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Lets a table stand in for stdout/stderr or stdin:
 *
 *   dbstream::LineWriterBuf out_buf(stream);
 *   std::ostream out(&out_buf);
 *   out << "progress: " << 42 << "\n";      // one row per line
 *
 *   dbstream::LineReaderBuf in_buf(stream, "worker-1");
 *   std::istream in(&in_buf);
 *   for (std::string line; std::getline(in, line); ) { ... }
 *
 * Failures follow iostream rules (badbit / EOF); the exception that caused
 * them is kept in error().
 */

#pragma once

#include "errors.hpp"
#include "stream.hpp"

#include <exception>
#include <optional>
#include <streambuf>
#include <string>

namespace dbstream {

// ============================================================================
// Writer
// ============================================================================

/**
 * Buffers characters and writes one record per completed line, newline
 * included. sync() (std::flush) writes a pending partial line as well.
 */
class LineWriterBuf : public std::streambuf {
public:
    explicit LineWriterBuf(Stream& stream) : stream_(stream) {}

    ~LineWriterBuf() override { sync(); }

    LineWriterBuf(const LineWriterBuf&) = delete;
    LineWriterBuf& operator=(const LineWriterBuf&) = delete;

    std::exception_ptr error() const { return error_; }

    void rethrow_if_error() const {
        if (error_) std::rethrow_exception(error_);
    }

    const std::string& pending() const { return pending_; }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        pending_ += traits_type::to_char_type(ch);
        if (ch == '\n' && !emit()) {
            return traits_type::eof();
        }
        return ch;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        for (std::streamsize i = 0; i < n; ++i) {
            pending_ += s[i];
            if (s[i] == '\n' && !emit()) {
                return i;
            }
        }
        return n;
    }

    int sync() override {
        if (!pending_.empty() && !emit()) {
            return -1;
        }
        if (stream_.closed()) {
            return 0;
        }
        try {
            stream_.flush();
        } catch (const Error&) {
            error_ = std::current_exception();
            return -1;
        }
        return 0;
    }

private:
    bool emit() {
        try {
            stream_.write(pending_);
        } catch (const Error&) {
            error_ = std::current_exception();
            return false;
        }
        pending_.clear();
        return true;
    }

    Stream& stream_;
    std::string pending_;
    std::exception_ptr error_;
};

// ============================================================================
// Reader
// ============================================================================

/**
 * Serves the payloads new to `reader`, back to back. Hitting EOF ends the
 * current read; after in.clear() the next extraction looks for rows written
 * since.
 */
class LineReaderBuf : public std::streambuf {
public:
    LineReaderBuf(Stream& stream, std::string reader)
        : stream_(stream), reader_(std::move(reader)) {}

    LineReaderBuf(const LineReaderBuf&) = delete;
    LineReaderBuf& operator=(const LineReaderBuf&) = delete;

    std::exception_ptr error() const { return error_; }

    void rethrow_if_error() const {
        if (error_) std::rethrow_exception(error_);
    }

    const std::string& reader() const { return reader_; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        try {
            if (!batch_) {
                batch_.emplace(stream_.read_new(reader_));
            }
            Record rec;
            while (batch_->next(rec)) {
                if (rec.payload.empty()) {
                    continue;
                }
                current_ = std::move(rec.payload);
                char* base = &current_[0];
                setg(base, base, base + current_.size());
                return traits_type::to_int_type(*gptr());
            }
        } catch (const Error&) {
            error_ = std::current_exception();
        }
        batch_.reset();
        return traits_type::eof();
    }

private:
    Stream& stream_;
    std::string reader_;
    std::optional<NewRecords> batch_;
    std::string current_;
    std::exception_ptr error_;
};

} // namespace dbstream
