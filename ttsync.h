// Copyright 2026 The ttsync Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace ttsync {

/// Calendar date. Used for as-of values and validity bounds.
using Date = std::chrono::year_month_day;

/// Raw binary column payload.
using Blob = std::vector<std::uint8_t>;

/// Column value. A closed set of scalar kinds; hashing has one
/// canonicalization rule per alternative.
using Value = std::variant<
    std::monostate,  // NULL
    std::int64_t,    // INTEGER
    double,          // REAL
    std::string,     // TEXT
    Date,            // DATE
    Blob             // BLOB
>;

/// A named column value.
struct Field {
    std::string name;
    Value       value;
};

/// One source or target row. Column order is preserved but carries no meaning.
using Row = std::vector<Field>;

/// Surrogate key assigned by the sink to one stored version.
using RecordId = std::int64_t;

/// SHA-256 of a row's payload columns.
using Digest = std::array<std::uint8_t, 32>;

/// Canonical encoding of a natural-key tuple, usable as a hash-map key.
using KeyString = std::string;

/// Default open-ended valid_to: "still current".
inline constexpr Date kOpenValidTo{
    std::chrono::year{2999}, std::chrono::month{12}, std::chrono::day{31}};

/// Names of the columns a versioned store adds to every business row.
struct SystemColumns {
    std::string id         = "id";
    std::string valid_from = "SysStartDate";
    std::string valid_to   = "SysEndDate";

    bool contains(std::string_view name) const {
        return name == id || name == valid_from || name == valid_to;
    }
};

/// Returns the value of column `name`, or nullptr if the row has no such column.
const Value* find_field(const Row& row, std::string_view name);

/// Replace the value of column `name`, appending the column if absent.
void set_field(Row& row, std::string_view name, Value value);

/// Remove column `name` if present.
void erase_field(Row& row, std::string_view name);

/// Parse an ISO date (YYYY-MM-DD). Throws Error(InvalidConfig) on bad input.
Date parse_date(std::string_view text);

/// Format a date as YYYY-MM-DD.
std::string format_date(const Date& d);

} // namespace ttsync

// ── error.h ─────────────────────────────────────────────────────
namespace ttsync {

/// Error codes returned by ttsync operations.
enum class ErrorCode : int {
    Ok = 0,
    SqliteError,          ///< An underlying SQLite call failed.
    InvalidConfig,        ///< Run configuration is incomplete or inconsistent.
    MalformedRow,         ///< A row lacks a declared column or has an unknown one.
    DuplicateCurrentKey,  ///< Target holds two current versions of one natural key.
    DuplicateSourceKey,   ///< Source yielded the same natural key twice in one run.
    InvalidState,         ///< Operation not valid in the current state.
    HashError,            ///< The digest backend failed.
};

/// Exception thrown by ttsync operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace ttsync

// ── config.h ────────────────────────────────────────────────────
namespace ttsync {

/// Parameters of one reconciliation run.
struct SyncConfig {
    /// Ordered natural-key columns. Required.
    std::vector<std::string> natural_key;

    /// Historical boundary stamped on every insert and close. Required.
    Date as_of{};

    /// Pending inserts are flushed to the sink once this many accumulate.
    std::size_t chunk_size = 5000;

    /// Close current versions whose key is absent from the source.
    bool close_deleted_rows = true;

    /// valid_to value meaning "currently valid".
    Date sentinel_valid_to = kOpenValidTo;

    SystemColumns system_columns;
};

/// Throws Error(InvalidConfig) if `config` cannot drive a run.
void validate(const SyncConfig& config);

} // namespace ttsync

// ── hasher.h ────────────────────────────────────────────────────
namespace ttsync {

/// Stable text form of a value. Integers and integral floats print the
/// same, strings lose trailing whitespace, dates print as YYYY-MM-DD, and
/// blobs pass through unchanged. NULL yields an empty string.
std::string canonical_value(const Value& v);

/// Digest of every non-system, non-NULL column, visited in name order.
Digest hash_row(const Row& row, const SystemColumns& system_columns);

/// Canonical natural-key tuple of `row`.
/// Throws Error(MalformedRow) if a key column is missing.
KeyString encode_key(const Row& row, const std::vector<std::string>& natural_key);

/// Lower-case hex rendering of a digest.
std::string to_hex(const Digest& d);

} // namespace ttsync

// ── sink.h ──────────────────────────────────────────────────────
namespace ttsync {

/// Called once per currently valid stored row. Return false to stop the scan.
using ScanCallback = std::function<bool(const Row& row, RecordId id)>;

/// The versioned store a run writes to.
///
/// All calls of one run are expected to happen inside a single transaction
/// owned by the caller.
class Sink {
public:
    virtual ~Sink() = default;

    /// Stream every stored row whose valid_to equals `open_valid_to`.
    virtual void scan_current(const Date& open_valid_to, const ScanCallback& cb) = 0;

    /// Append new versions. Rows already carry valid_from and valid_to;
    /// the sink assigns surrogate ids.
    virtual void insert_batch(const std::vector<Row>& rows) = 0;

    /// Set valid_to = `as_of` on exactly the given ids.
    virtual void close_batch(const std::vector<RecordId>& ids, const Date& as_of) = 0;
};

/// A finite, single-pass stream of current-state rows.
class RowSource {
public:
    virtual ~RowSource() = default;

    /// Fill `row` with the next row. Returns false at end of stream.
    virtual bool next(Row& row) = 0;
};

} // namespace ttsync

// ── cache.h ─────────────────────────────────────────────────────
namespace ttsync {

/// Digest and surrogate id of the current version of one natural key.
struct CacheEntry {
    Digest   digest;
    RecordId id;
};

/// Natural key -> current version, for one run only.
class VersionCache {
public:
    using Map = std::unordered_map<KeyString, CacheEntry>;

    /// Load every currently valid row of `sink`.
    /// Throws Error(DuplicateCurrentKey) if a key has two current versions.
    static VersionCache build(Sink& sink, const SyncConfig& config);

    /// Throws Error(DuplicateCurrentKey) if `key` is already present.
    void insert(KeyString key, CacheEntry entry);

    const CacheEntry* find(const KeyString& key) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    Map::const_iterator begin() const { return entries_.begin(); }
    Map::const_iterator end() const { return entries_.end(); }

private:
    Map entries_;
};

} // namespace ttsync

// ── reconciler.h ────────────────────────────────────────────────
namespace ttsync {

/// Outcome of comparing one source row against the cache.
enum class Classification : std::uint8_t {
    New,        ///< Key not current in the target; inserted.
    Modified,   ///< Payload changed; new version inserted, old one closed by the sweep.
    Unchanged,  ///< Digest matches; nothing to do.
};

/// Natural keys observed in the source during one run.
using SeenSet = std::unordered_set<KeyString>;

/// Everything the sweep needs from a drained source.
struct ReconcileResult {
    SeenSet               seen;
    std::vector<RecordId> modified_ids;  ///< Cached ids superseded by a new version.

    std::size_t rows_read         = 0;
    std::size_t inserted_new      = 0;
    std::size_t inserted_modified = 0;
    std::size_t unchanged         = 0;
    std::size_t flushes           = 0;
};

/// Classifies source rows one at a time and writes new versions in chunks.
///
/// Holds references to the cache, sink and config; all three must outlive it.
class Reconciler {
public:
    Reconciler(const VersionCache& cache, Sink& sink, const SyncConfig& config);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;
    Reconciler(Reconciler&&) noexcept;
    Reconciler& operator=(Reconciler&&) noexcept;

    /// Classify `row` and queue it for insertion if needed. May flush.
    /// Throws Error(MalformedRow) if a key column is missing and
    /// Error(DuplicateSourceKey) if the key was already seen this run.
    Classification process(Row row);

    /// Flush the remaining inserts and hand over the run state.
    /// The reconciler cannot be used afterwards.
    ReconcileResult finish();

    /// Number of inserts queued but not yet flushed.
    std::size_t pending() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    /// Throws Error(InvalidState) on a moved-from reconciler.
    Impl& live() const;
};

/// Drain `source` through a Reconciler.
ReconcileResult reconcile(RowSource& source, const VersionCache& cache,
                          Sink& sink, const SyncConfig& config);

} // namespace ttsync

// ── sweep.h ─────────────────────────────────────────────────────
namespace ttsync {

struct SweepResult {
    std::vector<RecordId> closed_ids;  ///< Ascending, without duplicates.
    std::size_t closed_modified = 0;
    std::size_t closed_deleted  = 0;
};

/// Close superseded versions and, if enabled, versions whose key was not
/// seen. Must only run after the source is fully drained. Issues no sink
/// call when there is nothing to close.
SweepResult sweep(const VersionCache& cache, const ReconcileResult& reconciled,
                  Sink& sink, const SyncConfig& config);

} // namespace ttsync

// ── engine.h ────────────────────────────────────────────────────
namespace ttsync {

/// Counters of one completed run.
struct SyncStats {
    std::size_t cached            = 0;
    std::size_t rows_read         = 0;
    std::size_t inserted_new      = 0;
    std::size_t inserted_modified = 0;
    std::size_t unchanged         = 0;
    std::size_t closed_modified   = 0;
    std::size_t closed_deleted    = 0;
    std::size_t flushes           = 0;
};

/// Build the cache, reconcile the whole source, then sweep.
///
/// Does not manage transactions; wrap the call in one so a failure can be
/// rolled back.
SyncStats run_sync(RowSource& source, Sink& sink, const SyncConfig& config);

} // namespace ttsync

// ── sources.h ───────────────────────────────────────────────────
namespace ttsync {

/// Rows held in memory.
class VectorSource : public RowSource {
public:
    explicit VectorSource(std::vector<Row> rows) : rows_(std::move(rows)) {}

    bool next(Row& row) override;

private:
    std::vector<Row> rows_;
    std::size_t      pos_ = 0;
};

/// Rows of an SQLite query, stepped one at a time.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the source's lifetime.
class SqliteQuerySource : public RowSource {
public:
    SqliteQuerySource(sqlite3* db, const std::string& sql);
    ~SqliteQuerySource() override;

    SqliteQuerySource(const SqliteQuerySource&) = delete;
    SqliteQuerySource& operator=(const SqliteQuerySource&) = delete;

    bool next(Row& row) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Old column name -> new column name.
using ColumnMap = std::map<std::string, std::string>;

/// Renames the columns of another source.
///
/// Column names are whitespace-trimmed before lookup. Unmapped columns are
/// kept unless `drop_unmapped` is set. Every mapped target must be present
/// in each row, else Error(MalformedRow).
class MappedSource : public RowSource {
public:
    MappedSource(RowSource& inner, ColumnMap map, bool drop_unmapped = true)
        : inner_(inner), map_(std::move(map)), drop_unmapped_(drop_unmapped) {}

    bool next(Row& row) override;

private:
    RowSource& inner_;
    ColumnMap  map_;
    bool       drop_unmapped_;
};

} // namespace ttsync

// ── sqlite_sink.h ───────────────────────────────────────────────
namespace ttsync {

/// Declared storage type of a business column.
enum class ColumnType : std::uint8_t {
    Text,
    Integer,
    Real,
    Date,
    Blob,
};

struct ColumnSpec {
    std::string name;
    ColumnType  type = ColumnType::Text;
};

/// Layout of a versioned table: business columns plus system columns.
struct TableSpec {
    std::string              table;
    std::vector<ColumnSpec>  columns;
    std::vector<std::string> natural_key;
    SystemColumns            system_columns;
};

/// Sink backed by one SQLite table.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the sink's lifetime.
class SqliteSink : public Sink {
public:
    SqliteSink(sqlite3* db, TableSpec spec);
    ~SqliteSink() override;

    SqliteSink(const SqliteSink&) = delete;
    SqliteSink& operator=(const SqliteSink&) = delete;

    /// Create the table and its indexes if the table does not exist.
    void ensure_table();

    void scan_current(const Date& open_valid_to, const ScanCallback& cb) override;
    void insert_batch(const std::vector<Row>& rows) override;
    void close_batch(const std::vector<RecordId>& ids, const Date& as_of) override;

    const TableSpec& spec() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// RAII write transaction. Rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    bool     done_ = false;
};

/// Parse "text", "integer", "real", "date" or "blob".
/// Throws Error(InvalidConfig) on anything else.
ColumnType parse_column_type(std::string_view name);

} // namespace ttsync
