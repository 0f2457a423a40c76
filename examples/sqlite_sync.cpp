// Copyright 2026 The ttsync Authors
// SPDX-License-Identifier: Apache-2.0
//
// Sync a table or query from one SQLite database into a temporal table in
// another. Each run records inserts, changes and deletions as of --asof.
//
//   ttsync_sqlite --source extract.db --source-table stock \
//                 --target history.db --table stock \
//                 --column plant:text --column code:text --column qty:integer \
//                 --key plant,code --asof 2024-03-01

#include <ttsync.h>

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace ttsync;

namespace {

struct Options {
    std::string source_db;
    std::string query;
    std::string source_table;
    std::string target_db;
    std::string log_file;
    TableSpec   spec;
    SyncConfig  config;
    bool        verbose = false;
};

void print_usage(const char* prog) {
    std::printf(
        "Usage: %s [options]\n"
        "  --source DB              SQLite database holding the extract\n"
        "  --query SQL              Query producing the extract rows\n"
        "  --source-table NAME      Read every row of NAME (instead of --query)\n"
        "  --target DB              SQLite database holding the temporal table\n"
        "  --table NAME             Temporal table name\n"
        "  --column NAME:TYPE       Business column (text|integer|real|date|blob), repeatable\n"
        "  --key COL[,COL...]       Natural key columns\n"
        "  --asof YYYY-MM-DD        As-of date of this run\n"
        "  --chunk-size N           Rows per insert batch (default 5000)\n"
        "  --keep-deleted           Do not close rows missing from the extract\n"
        "  --log-file PATH          Also log to PATH, rotated daily\n"
        "  --verbose                Debug logging\n"
        "  --help                   Show this message\n",
        prog);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        out.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

// Returns false if the program should exit without syncing.
bool parse_args(int argc, char* argv[], Options& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw Error(ErrorCode::InvalidConfig, "missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--source") {
            opt.source_db = value();
        } else if (arg == "--query") {
            opt.query = value();
        } else if (arg == "--source-table") {
            opt.source_table = value();
        } else if (arg == "--target") {
            opt.target_db = value();
        } else if (arg == "--table") {
            opt.spec.table = value();
        } else if (arg == "--column") {
            auto v = value();
            auto colon = v.find(':');
            if (colon == std::string::npos) {
                throw Error(ErrorCode::InvalidConfig, "expected NAME:TYPE, got '" + v + "'");
            }
            opt.spec.columns.push_back(
                {v.substr(0, colon), parse_column_type(v.substr(colon + 1))});
        } else if (arg == "--key") {
            opt.config.natural_key = split(value(), ',');
        } else if (arg == "--asof") {
            opt.config.as_of = parse_date(value());
        } else if (arg == "--chunk-size") {
            opt.config.chunk_size = std::stoul(value());
        } else if (arg == "--keep-deleted") {
            opt.config.close_deleted_rows = false;
        } else if (arg == "--log-file") {
            opt.log_file = value();
        } else if (arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return false;
        } else {
            throw Error(ErrorCode::InvalidConfig, "unknown option: " + arg);
        }
    }

    if (opt.source_db.empty() || opt.target_db.empty()) {
        throw Error(ErrorCode::InvalidConfig, "--source and --target are required");
    }
    if (opt.query.empty() == opt.source_table.empty()) {
        throw Error(ErrorCode::InvalidConfig,
                    "exactly one of --query and --source-table is required");
    }
    if (!opt.source_table.empty()) {
        std::string quoted = "\"";
        for (char c : opt.source_table) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        opt.query = "SELECT * FROM " + quoted + "\"";
    }
    opt.spec.natural_key = opt.config.natural_key;
    return true;
}

void setup_logging(const Options& opt) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!opt.log_file.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::daily_file_sink_mt>(opt.log_file, 0, 0));
    }
    auto logger = std::make_shared<spdlog::logger>("ttsync", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(opt.verbose ? spdlog::level::debug : spdlog::level::info);
}

/// Owns one sqlite3 connection.
class Connection {
public:
    explicit Connection(const std::string& path) {
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            throw Error(ErrorCode::SqliteError, "cannot open " + path + ": " + msg);
        }
    }
    ~Connection() { sqlite3_close(db_); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

} // namespace

int main(int argc, char* argv[]) {
    Options opt;
    try {
        if (!parse_args(argc, argv, opt)) return 0;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        print_usage(argv[0]);
        return 1;
    }

    try {
        setup_logging(opt);

        Connection source(opt.source_db);
        Connection target(opt.target_db);

        SqliteSink sink(target.get(), opt.spec);
        sink.ensure_table();

        Transaction tx(target.get());
        SqliteQuerySource rows(source.get(), opt.query);
        auto stats = run_sync(rows, sink, opt.config);
        tx.commit();

        std::printf("%s as of %s: %zu read, %zu new, %zu modified, "
                    "%zu unchanged, %zu deleted\n",
                    opt.spec.table.c_str(), format_date(opt.config.as_of).c_str(),
                    stats.rows_read, stats.inserted_new, stats.inserted_modified,
                    stats.unchanged, stats.closed_deleted);
        return 0;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("sync failed: {}", e.what());
        return 1;
    }
}
