/**
 * dbstream/dbstream.hpp - Master include for libdbstream
 *
 * libdbstream - a file-like stream over an append-only SQL table
 *
 * Include this single header to get all libdbstream functionality:
 *   - Stream, StreamConfig, NewRecords - write lines, read what is new per reader
 *   - StoragePort, RowScan, CursorStore - the storage interfaces the stream needs
 *   - SqliteStorage, SqliteCursorStore - the SQLite backend
 *   - LineWriterBuf, LineReaderBuf - iostream adapters
 *   - Database - RAII SQLite connection and statement wrappers
 *
 * Example:
 *
 *   #include <dbstream/dbstream.hpp>
 *
 *   dbstream::Database db("app.db");
 *   dbstream::provision(db, "stdout_stream");
 *
 *   dbstream::StreamConfig cfg;
 *   cfg.table = "stdout_stream";
 *   auto stream = dbstream::Stream::open({"app.db"}, cfg);
 *
 *   stream.write("alpha\n");
 *   auto lines = stream.read_new("reader-a").collect();   // {"alpha\n"}
 *   auto again = stream.read_new("reader-a").collect();   // {}
 */

#pragma once

#include "errors.hpp"
#include "types.hpp"
#include "record.hpp"
#include "session.hpp"
#include "storage.hpp"
#include "cursor.hpp"
#include "database.hpp"
#include "sqlite_storage.hpp"
#include "stream.hpp"
#include "streambuf.hpp"
