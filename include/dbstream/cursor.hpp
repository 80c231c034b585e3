/**
 * dbstream/cursor.hpp - Per-reader consumption positions
 *
 * Part of libdbstream - a file-like stream over an append-only SQL table.
 *
 * Each reader identity owns one position: the highest sequence it has
 * consumed. Identities are independent, so every reader sees the full
 * history (broadcast, not competing consumers).
 */

#pragma once

#include "storage.hpp"
#include "types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dbstream {

class CursorTracker {
public:
    // `store` may be null; when set, unknown readers are loaded from it and
    // every advance is written through to it.
    explicit CursorTracker(CursorStore* store = nullptr) : store_(store) {}

    CursorTracker(const CursorTracker&) = delete;
    CursorTracker& operator=(const CursorTracker&) = delete;

    /**
     * Position of `reader`, or empty if it has consumed nothing.
     */
    std::optional<Sequence> position_of(const std::string& reader) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(reader);
    }

    /**
     * Move `reader` to max(current, sequence).
     * @return true if the position moved, false if `sequence` was already consumed
     */
    bool advance(const std::string& reader, Sequence sequence) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = lookup(reader);
        if (current && *current >= sequence) {
            return false;
        }
        if (store_) {
            store_->save(reader, sequence);
        }
        positions_[reader] = sequence;
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_.clear();
    }

    std::vector<std::string> readers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(positions_.size());
        for (const auto& entry : positions_) {
            out.push_back(entry.first);
        }
        return out;
    }

private:
    std::optional<Sequence> lookup(const std::string& reader) {
        auto it = positions_.find(reader);
        if (it != positions_.end()) {
            return it->second;
        }
        if (store_) {
            auto stored = store_->load(reader);
            if (stored) {
                positions_[reader] = *stored;
            }
            return stored;
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Sequence> positions_;
    CursorStore* store_ = nullptr;
};

} // namespace dbstream
