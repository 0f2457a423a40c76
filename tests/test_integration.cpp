// Copyright 2026 The ttsync Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <ttsync.h>

#include <sqlite3.h>

using namespace ttsync;

namespace {

struct DB {
    sqlite3* db = nullptr;
    DB() { sqlite3_open(":memory:", &db); }
    ~DB() { if (db) sqlite3_close(db); }
    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }
    int count(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        sqlite3_step(stmt);
        int n = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
        return n;
    }
    std::string query_val(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        std::string result;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            auto* text = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt, 0));
            if (text) result = text;
        }
        sqlite3_finalize(stmt);
        return result;
    }
};

TableSpec stock_table() {
    TableSpec spec;
    spec.table = "stock";
    spec.columns = {
        {"plant", ColumnType::Text},
        {"code", ColumnType::Text},
        {"qty", ColumnType::Integer},
        {"price", ColumnType::Real},
    };
    spec.natural_key = {"plant", "code"};
    return spec;
}

SyncConfig stock_config(const char* as_of) {
    SyncConfig c;
    c.natural_key = {"plant", "code"};
    c.as_of = parse_date(as_of);
    c.chunk_size = 2;
    return c;
}

// Load the source table, then sync it into the target inside one transaction.
SyncStats sync(DB& source, DB& target, const char* as_of) {
    SqliteSink sink(target.db, stock_table());
    sink.ensure_table();

    Transaction tx(target.db);
    SqliteQuerySource rows(source.db, "SELECT plant, code, qty, price FROM extract");
    auto stats = run_sync(rows, sink, stock_config(as_of));
    tx.commit();
    return stats;
}

} // namespace

TEST_CASE("integration: sqlite extract to temporal table over several runs") {
    DB source, target;
    source.exec("CREATE TABLE extract (plant TEXT, code TEXT, qty INTEGER, price REAL)");
    source.exec("INSERT INTO extract VALUES ('P1', 'A', 10, 1.5)");
    source.exec("INSERT INTO extract VALUES ('P1', 'B', 20, 2.0)");
    source.exec("INSERT INTO extract VALUES ('P2', 'A', 30, 1.5)");

    auto first = sync(source, target, "2024-01-01");
    CHECK(first.inserted_new == 3);
    CHECK(target.count("SELECT COUNT(*) FROM stock") == 3);

    // Unchanged extract: nothing happens.
    auto again = sync(source, target, "2024-01-02");
    CHECK(again.unchanged == 3);
    CHECK(target.count("SELECT COUNT(*) FROM stock") == 3);

    // One change, one deletion, one addition.
    source.exec("UPDATE extract SET qty = 11 WHERE plant='P1' AND code='A'");
    source.exec("DELETE FROM extract WHERE plant='P2'");
    source.exec("INSERT INTO extract VALUES ('P2', 'C', 5, NULL)");

    auto third = sync(source, target, "2024-02-01");
    CHECK(third.inserted_modified == 1);
    CHECK(third.inserted_new == 1);
    CHECK(third.closed_modified == 1);
    CHECK(third.closed_deleted == 1);
    CHECK(third.unchanged == 1);

    CHECK(target.count("SELECT COUNT(*) FROM stock") == 5);
    CHECK(target.count("SELECT COUNT(*) FROM stock WHERE SysEndDate='2999-12-31'") == 3);
    CHECK(target.query_val(
        "SELECT SysEndDate FROM stock WHERE plant='P2' AND code='A'") == "2024-02-01");
    CHECK(target.query_val(
        "SELECT qty FROM stock WHERE plant='P1' AND code='A' "
        "AND SysEndDate='2999-12-31'") == "11");
    CHECK(target.query_val(
        "SELECT SysStartDate FROM stock WHERE plant='P1' AND code='A' "
        "AND SysEndDate='2999-12-31'") == "2024-02-01");

    // At most one current version per natural key.
    CHECK(target.count(
        "SELECT COUNT(*) FROM (SELECT plant, code FROM stock "
        "WHERE SysEndDate='2999-12-31' GROUP BY plant, code HAVING COUNT(*) > 1)") == 0);
}

TEST_CASE("integration: failed run leaves the target unchanged after rollback") {
    DB source, target;
    source.exec("CREATE TABLE extract (plant TEXT, code TEXT, qty INTEGER, price REAL)");
    source.exec("INSERT INTO extract VALUES ('P1', 'A', 10, 1.5)");
    sync(source, target, "2024-01-01");

    // Duplicate key in the extract, after a row that would otherwise be flushed.
    source.exec("DELETE FROM extract");
    source.exec("INSERT INTO extract VALUES ('P1', 'B', 1, 1.0)");
    source.exec("INSERT INTO extract VALUES ('P1', 'C', 1, 1.0)");
    source.exec("INSERT INTO extract VALUES ('P1', 'B', 2, 1.0)");

    try {
        sync(source, target, "2024-02-01");
        FAIL("expected DuplicateSourceKey");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::DuplicateSourceKey);
    }

    CHECK(target.count("SELECT COUNT(*) FROM stock") == 1);
    CHECK(target.query_val("SELECT SysEndDate FROM stock") == "2999-12-31");
}

TEST_CASE("integration: corrupt target is reported before any write") {
    DB source, target;
    source.exec("CREATE TABLE extract (plant TEXT, code TEXT, qty INTEGER, price REAL)");
    source.exec("INSERT INTO extract VALUES ('P1', 'Z', 1, 1.0)");

    SqliteSink sink(target.db, stock_table());
    sink.ensure_table();
    target.exec("INSERT INTO stock (plant, code, qty, SysStartDate, SysEndDate) "
                "VALUES ('P1', 'A', 1, '2023-01-01', '2999-12-31')");
    target.exec("INSERT INTO stock (plant, code, qty, SysStartDate, SysEndDate) "
                "VALUES ('P1', 'A', 2, '2023-02-01', '2999-12-31')");

    try {
        sync(source, target, "2024-01-01");
        FAIL("expected DuplicateCurrentKey");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::DuplicateCurrentKey);
    }
    CHECK(target.count("SELECT COUNT(*) FROM stock") == 2);
}
