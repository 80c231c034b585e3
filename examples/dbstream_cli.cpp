/**
 * dbstream_cli.cpp - Command-line wrapper around a table-backed stream
 *
 *   dbstream -s app.db -t stdout_stream --create
 *   some_job | dbstream -s app.db -t stdout_stream -w --meta job=nightly
 *   dbstream -s app.db -t stdout_stream --reader ci --follow
 */

#include <dbstream/cli.hpp>
#include <dbstream/dbstream.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>

namespace {

int run_create(const dbstream::cli::cli_args& args) {
    dbstream::Database db;
    if (!db.open(args.database.c_str())) {
        std::cerr << "dbstream: error: " << db.last_error() << "\n";
        return 1;
    }
    if (!dbstream::provision(db, args.table, {}, true)) {
        std::cerr << "dbstream: error: " << db.last_error() << "\n";
        return 1;
    }
    return 0;
}

int run_write(const dbstream::cli::cli_args& args) {
    auto stream = dbstream::Stream::open(args.sqlite_options(), args.stream_config());
    dbstream::LineWriterBuf buf(stream);
    std::ostream out(&buf);
    for (std::string line; std::getline(std::cin, line); ) {
        out << line << '\n';
        if (!out) {
            buf.rethrow_if_error();
        }
    }
    out.flush();
    buf.rethrow_if_error();
    stream.close();
    return 0;
}

int run_read(const dbstream::cli::cli_args& args) {
    auto stream = dbstream::Stream::open(args.sqlite_options(), args.stream_config());
    do {
        if (stream.has_new()) {
            for (const auto& line : stream.read_new()) {
                std::cout << line;
            }
            std::cout.flush();
        }
        if (args.follow) {
            std::this_thread::sleep_for(std::chrono::milliseconds(args.interval_ms));
        }
    } while (args.follow);
    stream.close();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    int exit_code = 0;
    auto args = dbstream::cli::parse_args(argc, argv, "dbstream",
        "dbstream - append lines to a SQLite table, read back what is new", exit_code);
    if (!args) {
        return exit_code;
    }

    try {
        switch (args->mode) {
            case dbstream::cli::cli_mode::create: return run_create(*args);
            case dbstream::cli::cli_mode::write:  return run_write(*args);
            case dbstream::cli::cli_mode::read:   return run_read(*args);
        }
    } catch (const dbstream::Error& e) {
        std::cerr << "dbstream: error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "dbstream: error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
