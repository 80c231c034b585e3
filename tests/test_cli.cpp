/**
 * test_cli.cpp - Tests for the command-line argument parser
 */

#include <gtest/gtest.h>
#include <dbstream/cli.hpp>

#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using dbstream::cli::arg_parser;
using dbstream::cli::cli_args;
using dbstream::cli::cli_mode;

class CliTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    std::ostringstream err_;

    std::optional<cli_args> parse(std::initializer_list<const char*> args) {
        storage_.assign({"dbstream"});
        storage_.insert(storage_.end(), args.begin(), args.end());
        argv_.clear();
        for (auto& s : storage_) {
            argv_.push_back(&s[0]);
        }
        arg_parser parser("dbstream", "Append-only table stream", out_, err_);
        auto parsed = parser.parse(static_cast<int>(argv_.size()), argv_.data());
        exit_code_ = parser.exit_code();
        return parsed;
    }

    int exit_code_ = -1;

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CliTest, ReadIsDefault) {
    auto args = parse({"-s", "app.db", "-t", "stdout_stream"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->mode, cli_mode::read);
    EXPECT_EQ(args->database, "app.db");
    EXPECT_EQ(args->table, "stdout_stream");
    EXPECT_EQ(args->reader, "default");
    EXPECT_EQ(args->interval_ms, 500);
    EXPECT_FALSE(args->follow);
    EXPECT_EQ(exit_code_, 0);
}

TEST_F(CliTest, PositionalDatabase) {
    auto args = parse({"app.db", "--table", "t"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->database, "app.db");
}

TEST_F(CliTest, WriteWithMetadata) {
    auto args = parse({"-s", "app.db", "-t", "t", "-w", "--meta", "job=build", "--meta", "step=2"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->mode, cli_mode::write);
    EXPECT_EQ(args->metadata.at("job"), "build");
    EXPECT_EQ(args->metadata.at("step"), "2");

    auto cfg = args->stream_config();
    EXPECT_EQ(cfg.mode, dbstream::Mode::write);
    EXPECT_EQ(cfg.table, "t");
    EXPECT_EQ(cfg.session_metadata.at("job"), "build");
}

TEST_F(CliTest, ReadOptions) {
    auto args = parse({"-s", "app.db", "-t", "t", "-r", "--reader", "ci", "--follow",
                       "--interval", "100", "--persist-cursors", "-v"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->reader, "ci");
    EXPECT_TRUE(args->follow);
    EXPECT_EQ(args->interval_ms, 100);
    EXPECT_TRUE(args->verbose);

    auto cfg = args->stream_config();
    EXPECT_EQ(cfg.mode, dbstream::Mode::read);
    EXPECT_EQ(cfg.default_reader, "ci");
    EXPECT_EQ(cfg.cursors, dbstream::CursorPersistence::stored);
    EXPECT_EQ(args->sqlite_options().path, "app.db");
}

TEST_F(CliTest, CreateMode) {
    auto args = parse({"-s", "app.db", "-t", "t", "--create"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->mode, cli_mode::create);
}

TEST_F(CliTest, ConflictingModes) {
    EXPECT_FALSE(parse({"-s", "app.db", "-t", "t", "-w", "-r"}).has_value());
    EXPECT_NE(err_.str().find("Choose one of --write, --read, --create"), std::string::npos);
}

TEST_F(CliTest, MissingDatabase) {
    EXPECT_FALSE(parse({"-t", "t"}).has_value());
    EXPECT_NE(err_.str().find("dbstream: error: No database specified"), std::string::npos);
    EXPECT_EQ(exit_code_, 2);
}

TEST_F(CliTest, MissingTable) {
    EXPECT_FALSE(parse({"-s", "app.db"}).has_value());
    EXPECT_NE(err_.str().find("No table specified"), std::string::npos);
}

TEST_F(CliTest, MissingOptionValue) {
    EXPECT_FALSE(parse({"-s", "app.db", "-t"}).has_value());
    EXPECT_NE(err_.str().find("Missing argument for -t"), std::string::npos);
}

TEST_F(CliTest, BadInterval) {
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "--interval", "soon"}).has_value());
    EXPECT_NE(err_.str().find("Invalid interval"), std::string::npos);
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "--interval", "0"}).has_value());
    EXPECT_NE(err_.str().find("Interval must be positive"), std::string::npos);
}

TEST_F(CliTest, BadMetadata) {
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "-w", "--meta", "novalue"}).has_value());
    EXPECT_NE(err_.str().find("Metadata must be key=value"), std::string::npos);
}

TEST_F(CliTest, FlagsOutsideTheirMode) {
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "-w", "--follow"}).has_value());
    EXPECT_NE(err_.str().find("--follow only applies to read mode"), std::string::npos);
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "--meta", "k=v"}).has_value());
    EXPECT_NE(err_.str().find("--meta only applies to write mode"), std::string::npos);
}

TEST_F(CliTest, UnknownOption) {
    EXPECT_FALSE(parse({"-s", "a.db", "-t", "t", "--bogus"}).has_value());
    EXPECT_NE(err_.str().find("Unknown option: --bogus"), std::string::npos);
    EXPECT_EQ(exit_code_, 2);
}

TEST_F(CliTest, ExtraPositional) {
    EXPECT_FALSE(parse({"a.db", "b.db", "-t", "t"}).has_value());
    EXPECT_NE(err_.str().find("Unexpected argument: b.db"), std::string::npos);
}

TEST_F(CliTest, HelpAndVersion) {
    EXPECT_FALSE(parse({"--help"}).has_value());
    EXPECT_EQ(exit_code_, 0);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_NE(out_.str().find("--persist-cursors"), std::string::npos);

    out_.str("");
    EXPECT_FALSE(parse({"--version"}).has_value());
    EXPECT_EQ(exit_code_, 0);
    EXPECT_EQ(out_.str(), "dbstream version 1.0.0\n");
    EXPECT_TRUE(err_.str().empty());
}
