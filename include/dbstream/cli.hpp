#pragma once

/**
 * @file cli.hpp
 * @brief Argument parsing for the dbstream command-line wrapper
 *
 * The tool is a thin shell around Stream: write mode appends each stdin line,
 * read mode prints the rows a reader has not seen yet.
 */

#include <dbstream/sqlite_storage.hpp>
#include <dbstream/stream.hpp>
#include <dbstream/types.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace dbstream::cli {

// ============================================================================
// CLI Modes
// ============================================================================

enum class cli_mode {
    read,       // -s db -t table [--reader id] [--follow]
    write,      // -s db -t table -w < lines
    create      // -s db -t table --create
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct cli_args {
    cli_mode mode = cli_mode::read;

    // Database and table
    std::string database;
    std::string table;

    // Reading
    std::string reader = "default";
    bool follow = false;
    int interval_ms = 500;
    bool persist_cursors = false;

    // Writing
    SessionMetadata metadata;   // --meta key=value

    // Misc
    bool verbose = false;
    bool help = false;
    bool version = false;

    SqliteOptions sqlite_options() const {
        SqliteOptions opts;
        opts.path = database;
        return opts;
    }

    StreamConfig stream_config() const {
        StreamConfig cfg;
        cfg.table = table;
        cfg.mode = (mode == cli_mode::write) ? Mode::write : Mode::read;
        cfg.session_metadata = metadata;
        cfg.default_reader = reader;
        cfg.cursors = persist_cursors ? CursorPersistence::stored : CursorPersistence::ephemeral;
        cfg.verbose = verbose;
        return cfg;
    }
};

// ============================================================================
// Argument Parser
// ============================================================================

class arg_parser {
public:
    arg_parser(const std::string& program_name, const std::string& description,
               std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : program_name_(program_name), description_(description), out_(out), err_(err) {}

    std::optional<cli_args> parse(int argc, char** argv) {
        exit_code_ = 2;
        cli_args args;
        bool write = false;
        bool read = false;
        bool create = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
            }
            else if (arg == "--version") {
                args.version = true;
            }
            else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
            else if (arg == "-s" || arg == "--source") {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return std::nullopt;
                }
                args.database = argv[i];
            }
            else if (arg == "-t" || arg == "--table") {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return std::nullopt;
                }
                args.table = argv[i];
            }
            else if (arg == "-w" || arg == "--write") {
                write = true;
            }
            else if (arg == "-r" || arg == "--read") {
                read = true;
            }
            else if (arg == "--create") {
                create = true;
            }
            else if (arg == "--reader") {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return std::nullopt;
                }
                args.reader = argv[i];
            }
            else if (arg == "--follow") {
                args.follow = true;
            }
            else if (arg == "--persist-cursors") {
                args.persist_cursors = true;
            }
            else if (arg == "--interval") {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return std::nullopt;
                }
                try {
                    args.interval_ms = std::stoi(argv[i]);
                } catch (const std::exception&) {
                    error("Invalid interval: " + std::string(argv[i]));
                    return std::nullopt;
                }
                if (args.interval_ms <= 0) {
                    error("Interval must be positive: " + std::string(argv[i]));
                    return std::nullopt;
                }
            }
            else if (arg == "--meta") {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return std::nullopt;
                }
                std::string kv = argv[i];
                auto eq = kv.find('=');
                if (eq == std::string::npos || eq == 0) {
                    error("Metadata must be key=value: " + kv);
                    return std::nullopt;
                }
                args.metadata[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            else if (arg[0] == '-') {
                error("Unknown option: " + arg);
                return std::nullopt;
            }
            else {
                // Positional argument - treat as database if not set
                if (args.database.empty()) {
                    args.database = arg;
                } else {
                    error("Unexpected argument: " + arg);
                    return std::nullopt;
                }
            }
        }

        if (args.help) {
            print_help();
            exit_code_ = 0;
            return std::nullopt;
        }

        if (args.version) {
            out_ << program_name_ << " version 1.0.0\n";
            exit_code_ = 0;
            return std::nullopt;
        }

        if ((write + read + create) > 1) {
            error("Choose one of --write, --read, --create");
            print_usage();
            return std::nullopt;
        }
        if (write) args.mode = cli_mode::write;
        if (create) args.mode = cli_mode::create;

        if (!validate(args)) {
            return std::nullopt;
        }
        exit_code_ = 0;
        return args;
    }

    // Process exit status after parse(): 0 for --help/--version or success, 2 on error.
    int exit_code() const { return exit_code_; }

private:
    bool validate(const cli_args& args) {
        if (args.database.empty()) {
            error("No database specified. Use -s <database>");
            print_usage();
            return false;
        }
        if (args.table.empty()) {
            error("No table specified. Use -t <table>");
            print_usage();
            return false;
        }
        if (args.follow && args.mode != cli_mode::read) {
            error("--follow only applies to read mode");
            return false;
        }
        if (!args.metadata.empty() && args.mode != cli_mode::write) {
            error("--meta only applies to write mode");
            return false;
        }
        return true;
    }

    void error(const std::string& msg) {
        err_ << program_name_ << ": error: " << msg << "\n";
    }

    void print_usage() {
        err_ << "Usage: " << program_name_ << " -s <database> -t <table> [options]\n";
        err_ << "Try '" << program_name_ << " --help' for more information.\n";
    }

    void print_help() {
        out_ << description_ << "\n\n";
        out_ << "Usage:\n";
        out_ << "  " << program_name_ << " -s <db> -t <table>              Print rows not yet read\n";
        out_ << "  " << program_name_ << " -s <db> -t <table> --follow     Keep printing new rows\n";
        out_ << "  " << program_name_ << " -s <db> -t <table> -w           Append stdin lines\n";
        out_ << "  " << program_name_ << " -s <db> -t <table> --create     Create the table\n";
        out_ << "\n";
        out_ << "Options:\n";
        out_ << "  -s, --source <path>    SQLite database path\n";
        out_ << "  -t, --table <name>     Stream table\n";
        out_ << "  -r, --read             Read mode (default)\n";
        out_ << "  -w, --write            Write mode\n";
        out_ << "  --create               Create the table and its cursor table\n";
        out_ << "  --reader <id>          Reader identity (default: default)\n";
        out_ << "  --persist-cursors      Keep reader positions in <table>_cursors\n";
        out_ << "  --follow               Poll for new rows until interrupted\n";
        out_ << "  --interval <ms>        Poll interval (default: 500)\n";
        out_ << "  --meta <key=value>     Extra session metadata (repeatable)\n";
        out_ << "  -v, --verbose          Log stream events to stderr\n";
        out_ << "\n";
        out_ << "Other:\n";
        out_ << "  -h, --help             Show this help\n";
        out_ << "  --version              Show version\n";
        out_ << "\n";
        out_ << "Examples:\n";
        out_ << "  " << program_name_ << " -s app.db -t stdout_stream --create\n";
        out_ << "  make 2>&1 | " << program_name_ << " -s app.db -t stdout_stream -w --meta job=build\n";
        out_ << "  " << program_name_ << " -s app.db -t stdout_stream --reader ci --persist-cursors\n";
    }

    std::string program_name_;
    std::string description_;
    std::ostream& out_;
    std::ostream& err_;
    int exit_code_ = 0;
};

// ============================================================================
// Convenience function
// ============================================================================

/**
 * Parse command line arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param program_name Name of the program (for help/errors)
 * @param description Brief description (for help)
 * @param exit_code Set to the status to exit with when nullopt is returned
 * @return Parsed arguments, or nullopt if --help/--version or error
 */
inline std::optional<cli_args> parse_args(
    int argc, char** argv,
    const std::string& program_name,
    const std::string& description,
    int& exit_code)
{
    arg_parser parser(program_name, description);
    auto args = parser.parse(argc, argv);
    exit_code = parser.exit_code();
    return args;
}

}  // namespace dbstream::cli
