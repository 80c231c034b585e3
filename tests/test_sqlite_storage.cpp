/**
 * test_sqlite_storage.cpp - Tests for the SQLite storage port
 */

#include <gtest/gtest.h>
#include <dbstream/sqlite_storage.hpp>
#include "temp_db.hpp"

#include <fstream>
#include <memory>
#include <string>
#include <vector>

using dbstream::CorruptRecordError;
using dbstream::Sequence;
using dbstream::SqliteStorage;
using dbstream::StorageUnavailableError;
using dbstream::TableMissingError;

namespace {

std::vector<dbstream::Record> drain(dbstream::RowScan& scan) {
    std::vector<dbstream::Record> out;
    while (scan.next()) {
        out.push_back(dbstream::decode(scan.row()));
    }
    return out;
}

} // namespace

class SqliteStorageTest : public ::testing::Test {
protected:
    TempDb tmp_;

    void SetUp() override {
        ASSERT_TRUE(tmp_.provision("stdout_stream")) << tmp_.last_error();
    }

    std::unique_ptr<SqliteStorage> open(
        dbstream::CursorPersistence cursors = dbstream::CursorPersistence::ephemeral) {
        return std::make_unique<SqliteStorage>(tmp_.options(), "stdout_stream",
                                               dbstream::ColumnNames{}, cursors);
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(SqliteStorageTest, MissingTableFailsAtConstruction) {
    EXPECT_THROW(SqliteStorage(tmp_.options(), "no_such_stream"), TableMissingError);
}

TEST_F(SqliteStorageTest, MissingColumnFailsAtConstruction) {
    ASSERT_TRUE(tmp_.exec("CREATE TABLE partial (sequence INTEGER PRIMARY KEY, payload TEXT)"));
    EXPECT_THROW(SqliteStorage(tmp_.options(), "partial"), TableMissingError);
}

TEST_F(SqliteStorageTest, SequenceMustBeIntegerPrimaryKey) {
    ASSERT_TRUE(tmp_.exec(
        "CREATE TABLE loose (sequence INTEGER, payload TEXT, metadata TEXT)"));
    EXPECT_THROW(SqliteStorage(tmp_.options(), "loose"), TableMissingError);

    ASSERT_TRUE(tmp_.exec(
        "CREATE TABLE composite (sequence INTEGER, payload TEXT, metadata TEXT, "
        "PRIMARY KEY (sequence, payload))"));
    EXPECT_THROW(SqliteStorage(tmp_.options(), "composite"), TableMissingError);

    ASSERT_TRUE(tmp_.exec(
        "CREATE TABLE second_key (tag TEXT, sequence INTEGER, payload TEXT, metadata TEXT, "
        "PRIMARY KEY (tag, sequence))"));
    EXPECT_THROW(SqliteStorage(tmp_.options(), "second_key"), TableMissingError);
}

TEST_F(SqliteStorageTest, NonDatabaseFileIsUnavailable) {
    TempDb other;
    {
        std::ofstream junk(other.path(), std::ios::binary);
        junk << std::string(4096, 'x');
    }
    EXPECT_THROW(SqliteStorage(other.options(), "stdout_stream"), StorageUnavailableError);
}

TEST_F(SqliteStorageTest, MissingDatabaseFileIsNotCreated) {
    TempDb other;
    EXPECT_THROW(SqliteStorage(other.options(), "stdout_stream"), StorageUnavailableError);
}

TEST_F(SqliteStorageTest, CreateIfMissingStillNeedsTable) {
    TempDb other;
    auto opts = other.options();
    opts.create_if_missing = true;
    EXPECT_THROW(SqliteStorage(opts, "stdout_stream"), TableMissingError);
}

TEST_F(SqliteStorageTest, CustomColumnNames) {
    ASSERT_TRUE(tmp_.exec(
        "CREATE TABLE stdin_stream (id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "content TEXT NOT NULL, session TEXT)"));
    ASSERT_TRUE(tmp_.exec("INSERT INTO stdin_stream (content) VALUES ('Input1\n')"));

    dbstream::ColumnNames cols;
    cols.sequence = "id";
    cols.payload = "content";
    cols.metadata = "session";
    SqliteStorage storage(tmp_.options(), "stdin_stream", cols);

    auto seq = storage.append(dbstream::encode("Input2\n", {{"pid", "1"}}));
    EXPECT_EQ(seq, 2u);

    auto scan = storage.scan_from(std::nullopt);
    auto records = drain(*scan);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].payload, "Input1\n");
    EXPECT_TRUE(records[0].metadata.empty());
    EXPECT_EQ(records[1].payload, "Input2\n");
    EXPECT_EQ(records[1].metadata.at("pid"), "1");
}

// ============================================================================
// append / scan_from / max_sequence
// ============================================================================

TEST_F(SqliteStorageTest, AppendAssignsIncreasingSequences) {
    auto storage = open();
    Sequence a = storage->append(dbstream::encode("a", {}));
    Sequence b = storage->append(dbstream::encode("b", {}));
    Sequence c = storage->append(dbstream::encode("c", {}));
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST_F(SqliteStorageTest, AppendWithoutPayloadIsRejected) {
    auto storage = open();
    dbstream::BackendRow row;
    row.set("metadata", std::string("{}"));
    EXPECT_THROW(storage->append(row), dbstream::EncodingError);
}

TEST_F(SqliteStorageTest, ScanFromIsExclusiveAndOrdered) {
    auto storage = open();
    std::vector<Sequence> seqs;
    for (const char* p : {"one", "two", "three", "four"}) {
        seqs.push_back(storage->append(dbstream::encode(p, {})));
    }

    auto records = drain(*storage->scan_from(seqs[1]));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].sequence, seqs[2]);
    EXPECT_EQ(records[0].payload, "three");
    EXPECT_EQ(records[1].payload, "four");

    auto all = drain(*storage->scan_from(std::nullopt));
    EXPECT_EQ(all.size(), 4u);
}

TEST_F(SqliteStorageTest, ScanFromHonorsLimit) {
    auto storage = open();
    for (const char* p : {"one", "two", "three"}) {
        storage->append(dbstream::encode(p, {}));
    }
    auto records = drain(*storage->scan_from(std::nullopt, 2));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].payload, "two");
}

TEST_F(SqliteStorageTest, ScanOnEmptyTable) {
    auto storage = open();
    auto scan = storage->scan_from(std::nullopt);
    EXPECT_FALSE(scan->next());
}

TEST_F(SqliteStorageTest, ScanIsSnapshotPerCall) {
    auto storage = open();
    storage->append(dbstream::encode("first", {}));
    auto scan = storage->scan_from(std::nullopt);
    ASSERT_TRUE(scan->next());
    EXPECT_FALSE(scan->next());

    storage->append(dbstream::encode("second", {}));
    EXPECT_EQ(drain(*storage->scan_from(std::nullopt)).size(), 2u);
}

TEST_F(SqliteStorageTest, MaxSequence) {
    auto storage = open();
    EXPECT_FALSE(storage->max_sequence().has_value());
    storage->append(dbstream::encode("a", {}));
    Sequence last = storage->append(dbstream::encode("b", {}));
    EXPECT_EQ(storage->max_sequence(), last);
}

TEST_F(SqliteStorageTest, RowsFromOtherConnectionsAreVisible) {
    auto writer = open();
    auto reader = open();
    writer->append(dbstream::encode("shared", {}));
    auto records = drain(*reader->scan_from(std::nullopt));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].payload, "shared");
}

TEST_F(SqliteStorageTest, NegativeSequenceIsCorrupt) {
    ASSERT_TRUE(tmp_.exec(
        "INSERT INTO stdout_stream (sequence, payload, metadata) VALUES (-4, 'x', '{}')"));
    auto storage = open();
    EXPECT_THROW(storage->max_sequence(), CorruptRecordError);
    auto scan = storage->scan_from(std::nullopt);
    ASSERT_TRUE(scan->next());
    EXPECT_THROW(dbstream::decode(scan->row()), CorruptRecordError);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(SqliteStorageTest, DroppedTableIsReportedAsMissing) {
    auto storage = open();
    ASSERT_TRUE(tmp_.exec("DROP TABLE stdout_stream"));
    EXPECT_THROW(storage->scan_from(std::nullopt)->next(), TableMissingError);
    EXPECT_THROW(storage->max_sequence(), TableMissingError);
    EXPECT_THROW(storage->append(dbstream::encode("x", {})), TableMissingError);
}

TEST_F(SqliteStorageTest, LockedDatabaseIsUnavailable) {
    auto storage = std::make_unique<SqliteStorage>(tmp_.options(50), "stdout_stream");

    dbstream::Database locker(tmp_.path().c_str());
    ASSERT_EQ(locker.exec("BEGIN EXCLUSIVE"), SQLITE_OK) << locker.last_error();

    EXPECT_THROW(storage->append(dbstream::encode("blocked", {})), StorageUnavailableError);

    ASSERT_EQ(locker.exec("COMMIT"), SQLITE_OK);
    EXPECT_NO_THROW(storage->append(dbstream::encode("after", {})));
}

TEST_F(SqliteStorageTest, ClosedStorageIsUnavailable) {
    auto storage = open();
    storage->close();
    EXPECT_FALSE(storage->is_open());
    EXPECT_NO_THROW(storage->close());
    EXPECT_THROW(storage->append(dbstream::encode("x", {})), StorageUnavailableError);
    EXPECT_THROW(storage->scan_from(std::nullopt), StorageUnavailableError);
    EXPECT_THROW(storage->max_sequence(), StorageUnavailableError);
    EXPECT_THROW(storage->flush(), StorageUnavailableError);
}

TEST_F(SqliteStorageTest, CloseWithOutstandingScan) {
    auto storage = open();
    storage->append(dbstream::encode("x", {}));
    auto scan = storage->scan_from(std::nullopt);
    EXPECT_NO_THROW(storage->close());
    scan.reset();
}

// ============================================================================
// Cursor store
// ============================================================================

TEST_F(SqliteStorageTest, EphemeralHasNoCursorStore) {
    auto storage = open();
    EXPECT_EQ(storage->cursor_store(), nullptr);
}

TEST_F(SqliteStorageTest, StoredCursorsNeedCursorTable) {
    EXPECT_THROW(open(dbstream::CursorPersistence::stored), TableMissingError);
}

TEST_F(SqliteStorageTest, CursorStoreKeepsLargestPosition) {
    ASSERT_TRUE(tmp_.provision("stdout_stream", true)) << tmp_.last_error();
    auto storage = open(dbstream::CursorPersistence::stored);
    auto* store = storage->cursor_store();
    ASSERT_NE(store, nullptr);

    EXPECT_FALSE(store->load("ci").has_value());
    store->save("ci", 5);
    store->save("ci", 3);
    EXPECT_EQ(store->load("ci"), 5u);
    store->save("ci", 9);
    EXPECT_EQ(store->load("ci"), 9u);
    EXPECT_FALSE(store->load("other").has_value());
}

TEST_F(SqliteStorageTest, CursorStoreSharedAcrossConnections) {
    ASSERT_TRUE(tmp_.provision("stdout_stream", true));
    {
        auto storage = open(dbstream::CursorPersistence::stored);
        storage->cursor_store()->save("ci", 12);
    }
    auto storage = open(dbstream::CursorPersistence::stored);
    EXPECT_EQ(storage->cursor_store()->load("ci"), 12u);
}

// ============================================================================
// SQL helpers
// ============================================================================

TEST(SqlHelpersTest, QuoteIdentifier) {
    EXPECT_EQ(dbstream::quote_identifier("plain"), "\"plain\"");
    EXPECT_EQ(dbstream::quote_identifier("we\"ird"), "\"we\"\"ird\"");
}

TEST(SqlHelpersTest, CreateTableSql) {
    EXPECT_EQ(dbstream::create_table_sql("out"),
              "CREATE TABLE IF NOT EXISTS \"out\" (\"sequence\" INTEGER PRIMARY KEY AUTOINCREMENT, "
              "\"payload\" TEXT NOT NULL, \"metadata\" TEXT)");
    EXPECT_EQ(dbstream::cursor_table_name("out"), "out_cursors");
}
