/**
 * test_cursor.cpp - Tests for per-reader positions
 */

#include <gtest/gtest.h>
#include <dbstream/cursor.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

class MapCursorStore : public dbstream::CursorStore {
public:
    std::map<std::string, dbstream::Sequence> stored;
    int loads = 0;
    int saves = 0;

    std::optional<dbstream::Sequence> load(const std::string& reader) override {
        ++loads;
        auto it = stored.find(reader);
        if (it == stored.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& reader, dbstream::Sequence sequence) override {
        ++saves;
        stored[reader] = std::max(stored[reader], sequence);
    }
};

} // namespace

TEST(CursorTrackerTest, UnknownReaderHasNoPosition) {
    dbstream::CursorTracker tracker;
    EXPECT_FALSE(tracker.position_of("a").has_value());
}

TEST(CursorTrackerTest, AdvanceMovesForward) {
    dbstream::CursorTracker tracker;
    EXPECT_TRUE(tracker.advance("a", 1));
    EXPECT_TRUE(tracker.advance("a", 4));
    EXPECT_EQ(tracker.position_of("a"), 4u);
}

TEST(CursorTrackerTest, AdvanceNeverRegresses) {
    dbstream::CursorTracker tracker;
    ASSERT_TRUE(tracker.advance("a", 5));
    EXPECT_FALSE(tracker.advance("a", 3));
    EXPECT_FALSE(tracker.advance("a", 5));
    EXPECT_EQ(tracker.position_of("a"), 5u);
}

TEST(CursorTrackerTest, SequenceZeroCountsAsConsumed) {
    dbstream::CursorTracker tracker;
    EXPECT_TRUE(tracker.advance("a", 0));
    EXPECT_EQ(tracker.position_of("a"), 0u);
    EXPECT_FALSE(tracker.advance("a", 0));
}

TEST(CursorTrackerTest, ReadersAreIndependent) {
    dbstream::CursorTracker tracker;
    tracker.advance("a", 10);
    tracker.advance("b", 2);
    EXPECT_EQ(tracker.position_of("a"), 10u);
    EXPECT_EQ(tracker.position_of("b"), 2u);
    EXPECT_FALSE(tracker.position_of("c").has_value());

    auto readers = tracker.readers();
    std::sort(readers.begin(), readers.end());
    EXPECT_EQ(readers, (std::vector<std::string>{"a", "b"}));
}

TEST(CursorTrackerTest, ClearDropsPositions) {
    dbstream::CursorTracker tracker;
    tracker.advance("a", 3);
    tracker.clear();
    EXPECT_FALSE(tracker.position_of("a").has_value());
    EXPECT_TRUE(tracker.readers().empty());
}

TEST(CursorTrackerTest, LoadsFromStoreOnce) {
    MapCursorStore store;
    store.stored["a"] = 7;
    dbstream::CursorTracker tracker(&store);

    EXPECT_EQ(tracker.position_of("a"), 7u);
    EXPECT_EQ(tracker.position_of("a"), 7u);
    EXPECT_EQ(store.loads, 1);
    EXPECT_FALSE(tracker.advance("a", 6));
}

TEST(CursorTrackerTest, AdvanceWritesThrough) {
    MapCursorStore store;
    dbstream::CursorTracker tracker(&store);

    tracker.advance("a", 1);
    tracker.advance("a", 2);
    tracker.advance("a", 2);
    EXPECT_EQ(store.stored.at("a"), 2u);
    EXPECT_EQ(store.saves, 2);
}

TEST(CursorTrackerTest, ConcurrentAdvanceClaimsEachSequenceOnce) {
    dbstream::CursorTracker tracker;
    constexpr dbstream::Sequence kLast = 2000;
    constexpr int kThreads = 4;

    std::mutex mutex;
    std::vector<dbstream::Sequence> claimed;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (dbstream::Sequence s = 1; s <= kLast; ++s) {
                if (tracker.advance("shared", s)) {
                    std::lock_guard<std::mutex> lock(mutex);
                    claimed.push_back(s);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<dbstream::Sequence> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(unique.size(), claimed.size());
    EXPECT_EQ(tracker.position_of("shared"), kLast);
}
