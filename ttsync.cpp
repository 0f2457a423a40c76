// Copyright 2026 The ttsync Authors
// SPDX-License-Identifier: Apache-2.0
#include "ttsync.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <optional>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace ttsync::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

/// Double-quote an SQL identifier.
std::string quote(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

/// Bind a Value to parameter `idx` (1-based) or throw.
void bind_value(sqlite3* db, sqlite3_stmt* stmt, int idx, const Value& v) {
    int rc = std::visit([&](const auto& x) -> int {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, idx);
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, idx, x);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, idx, x);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, idx, x.data(),
                                     static_cast<int>(x.size()), SQLITE_TRANSIENT);
        }
        else if constexpr (std::is_same_v<T, Date>) {
            auto text = format_date(x);
            return sqlite3_bind_text(stmt, idx, text.data(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        else {
            if (x.empty()) return sqlite3_bind_zeroblob(stmt, idx, 0);
            return sqlite3_bind_blob(stmt, idx, x.data(),
                                     static_cast<int>(x.size()), SQLITE_TRANSIENT);
        }
    }, v);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

/// Read result column `i` of the current row.
Value column_value(sqlite3_stmt* stmt, int i) {
    switch (sqlite3_column_type(stmt, i)) {
    case SQLITE_NULL:
        return std::monostate{};
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt, i));
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt, i);
    case SQLITE_TEXT: {
        auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
        int len = sqlite3_column_bytes(stmt, i);
        if (!text) return std::string{};
        return std::string(text, static_cast<std::size_t>(len));
    }
    case SQLITE_BLOB: {
        auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, i));
        int len = sqlite3_column_bytes(stmt, i);
        if (!data) return Blob{};
        return Blob(data, data + len);
    }
    default:
        return std::monostate{};
    }
}

} // namespace ttsync::detail

// ── types.cpp ───────────────────────────────────────────────────
namespace ttsync {

const Value* find_field(const Row& row, std::string_view name) {
    for (const auto& f : row) {
        if (f.name == name) return &f.value;
    }
    return nullptr;
}

void set_field(Row& row, std::string_view name, Value value) {
    for (auto& f : row) {
        if (f.name == name) {
            f.value = std::move(value);
            return;
        }
    }
    row.push_back(Field{std::string(name), std::move(value)});
}

void erase_field(Row& row, std::string_view name) {
    std::erase_if(row, [&](const Field& f) { return f.name == name; });
}

Date parse_date(std::string_view text) {
    auto fail = [&]() -> Error {
        return Error(ErrorCode::InvalidConfig,
                     "invalid date '" + std::string(text) + "', expected YYYY-MM-DD");
    };

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') throw fail();

    int y = 0;
    unsigned m = 0, d = 0;
    auto parse = [&](std::string_view part, auto& out) {
        auto* first = part.data();
        auto* last = part.data() + part.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec != std::errc{} || ptr != last) throw fail();
    };
    parse(text.substr(0, 4), y);
    parse(text.substr(5, 2), m);
    parse(text.substr(8, 2), d);

    Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) throw fail();
    return date;
}

std::string format_date(const Date& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(d.year()),
                  static_cast<unsigned>(d.month()),
                  static_cast<unsigned>(d.day()));
    return buf;
}

} // namespace ttsync

// ── config.cpp ──────────────────────────────────────────────────
namespace ttsync {

void validate(const SyncConfig& config) {
    auto fail = [](const std::string& msg) {
        throw Error(ErrorCode::InvalidConfig, msg);
    };

    if (config.natural_key.empty()) fail("natural key must name at least one column");

    const auto& sys = config.system_columns;
    if (sys.id.empty() || sys.valid_from.empty() || sys.valid_to.empty()) {
        fail("system column names must not be empty");
    }
    if (sys.id == sys.valid_from || sys.id == sys.valid_to ||
        sys.valid_from == sys.valid_to) {
        fail("system column names must be distinct");
    }

    for (std::size_t i = 0; i < config.natural_key.size(); ++i) {
        const auto& col = config.natural_key[i];
        if (sys.contains(col)) {
            fail("natural key column '" + col + "' is a system column");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (config.natural_key[j] == col) {
                fail("natural key column '" + col + "' listed twice");
            }
        }
    }

    if (config.chunk_size == 0) fail("chunk size must be positive");
    if (!config.as_of.ok()) fail("as-of date is not set");
    if (!config.sentinel_valid_to.ok()) fail("open valid_to date is invalid");
    if (config.as_of >= config.sentinel_valid_to) {
        fail("as-of " + format_date(config.as_of) +
             " is not before open valid_to " + format_date(config.sentinel_valid_to));
    }
}

} // namespace ttsync

// ── hasher.cpp ──────────────────────────────────────────────────
namespace ttsync {

namespace {

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string canonical_double(double d) {
    // Integral values print like integers so 1.0 and 1 agree.
    if (std::isfinite(d) && d == std::trunc(d) &&
        d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
        return std::to_string(static_cast<std::int64_t>(d));
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        throw Error(ErrorCode::HashError, "cannot format floating point value");
    }
    return std::string(buf, ptr);
}

void digest_update(EVP_MD_CTX* ctx, const void* data, std::size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw Error(ErrorCode::HashError, "EVP_DigestUpdate failed");
    }
}

// Length-prefixed so adjacent fields cannot run into each other.
void digest_chunk(EVP_MD_CTX* ctx, std::string_view bytes) {
    std::uint8_t len[8];
    auto n = static_cast<std::uint64_t>(bytes.size());
    for (int i = 0; i < 8; ++i) {
        len[i] = static_cast<std::uint8_t>(n >> (i * 8));
    }
    digest_update(ctx, len, sizeof(len));
    digest_update(ctx, bytes.data(), bytes.size());
}

} // namespace

std::string canonical_value(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(x);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return canonical_double(x);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            auto end = x.find_last_not_of(" \t\r\n\f\v");
            return end == std::string::npos ? std::string{} : x.substr(0, end + 1);
        }
        else if constexpr (std::is_same_v<T, Date>) {
            return format_date(x);
        }
        else {
            return std::string(x.begin(), x.end());
        }
    }, v);
}

Digest hash_row(const Row& row, const SystemColumns& system_columns) {
    std::vector<const Field*> fields;
    fields.reserve(row.size());
    for (const auto& f : row) {
        if (system_columns.contains(f.name)) continue;
        if (std::holds_alternative<std::monostate>(f.value)) continue;
        fields.push_back(&f);
    }
    std::sort(fields.begin(), fields.end(),
              [](const Field* a, const Field* b) { return a->name < b->name; });

    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw Error(ErrorCode::HashError, "EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw Error(ErrorCode::HashError, "EVP_DigestInit_ex failed");
    }

    const std::string* prev = nullptr;
    for (const Field* f : fields) {
        if (prev && *prev == f->name) {
            throw Error(ErrorCode::MalformedRow,
                        "column '" + f->name + "' appears twice in one row");
        }
        prev = &f->name;
        digest_chunk(ctx.get(), f->name);
        digest_chunk(ctx.get(), canonical_value(f->value));
    }

    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        throw Error(ErrorCode::HashError, "EVP_DigestFinal_ex failed");
    }
    return out;
}

KeyString encode_key(const Row& row, const std::vector<std::string>& natural_key) {
    KeyString key;
    for (const auto& col : natural_key) {
        const Value* v = find_field(row, col);
        if (!v) {
            throw Error(ErrorCode::MalformedRow,
                        "row has no natural key column '" + col + "'");
        }
        if (std::holds_alternative<std::monostate>(*v)) {
            key += 'N';
            continue;
        }
        auto c = canonical_value(*v);
        key += 'V';
        key += std::to_string(c.size());
        key += ':';
        key += c;
    }
    return key;
}

std::string to_hex(const Digest& d) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(d.size() * 2);
    for (auto b : d) {
        out += kHex[b >> 4];
        out += kHex[b & 0x0f];
    }
    return out;
}

} // namespace ttsync

// ── cache.cpp ───────────────────────────────────────────────────
namespace ttsync {

VersionCache VersionCache::build(Sink& sink, const SyncConfig& config) {
    SPDLOG_DEBUG("loading temporal table hash cache");

    VersionCache cache;
    sink.scan_current(config.sentinel_valid_to, [&](const Row& row, RecordId id) {
        cache.insert(encode_key(row, config.natural_key),
                     CacheEntry{hash_row(row, config.system_columns), id});
        return true;
    });

    SPDLOG_INFO("hash cache holds {} current versions", cache.size());
    return cache;
}

void VersionCache::insert(KeyString key, CacheEntry entry) {
    auto [it, inserted] = entries_.try_emplace(std::move(key), entry);
    if (!inserted) {
        throw Error(ErrorCode::DuplicateCurrentKey,
                    "natural key '" + it->first + "' has two current versions: id " +
                    std::to_string(it->second.id) + " digest " + to_hex(it->second.digest) +
                    ", id " + std::to_string(entry.id) + " digest " + to_hex(entry.digest));
    }
}

const CacheEntry* VersionCache::find(const KeyString& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

} // namespace ttsync

// ── reconciler.cpp ──────────────────────────────────────────────
namespace ttsync {

struct Reconciler::Impl {
    const VersionCache& cache;
    Sink&               sink;
    const SyncConfig&   config;
    std::vector<Row>    pending;
    ReconcileResult     result;
    bool                finished = false;

    Impl(const VersionCache& c, Sink& s, const SyncConfig& cfg)
        : cache(c), sink(s), config(cfg) {}

    void stamp(Row& row) const {
        const auto& sys = config.system_columns;
        erase_field(row, sys.id);
        set_field(row, sys.valid_from, config.as_of);
        set_field(row, sys.valid_to, config.sentinel_valid_to);
    }

    void flush() {
        if (pending.empty()) return;
        SPDLOG_DEBUG("writing {} rows", pending.size());
        sink.insert_batch(pending);
        pending.clear();
        ++result.flushes;
    }

    Classification process(Row row) {
        if (finished) {
            throw Error(ErrorCode::InvalidState, "reconciler already finished");
        }
        ++result.rows_read;

        auto key = encode_key(row, config.natural_key);
        if (result.seen.contains(key)) {
            throw Error(ErrorCode::DuplicateSourceKey,
                        "natural key '" + key + "' appears twice in the source (row " +
                        std::to_string(result.rows_read) + ")");
        }

        Classification cls;
        const CacheEntry* current = cache.find(key);
        if (!current) {
            cls = Classification::New;
            ++result.inserted_new;
        } else if (hash_row(row, config.system_columns) == current->digest) {
            result.seen.insert(std::move(key));
            ++result.unchanged;
            return Classification::Unchanged;
        } else {
            cls = Classification::Modified;
            result.modified_ids.push_back(current->id);
            ++result.inserted_modified;
        }
        result.seen.insert(std::move(key));

        stamp(row);
        pending.push_back(std::move(row));
        if (pending.size() >= config.chunk_size) flush();
        return cls;
    }
};

Reconciler::Reconciler(const VersionCache& cache, Sink& sink, const SyncConfig& config)
    : impl_(std::make_unique<Impl>(cache, sink, config)) {
    impl_->pending.reserve(std::min<std::size_t>(config.chunk_size, 4096));
}

Reconciler::~Reconciler() = default;
Reconciler::Reconciler(Reconciler&&) noexcept = default;
Reconciler& Reconciler::operator=(Reconciler&&) noexcept = default;

Reconciler::Impl& Reconciler::live() const {
    if (!impl_) {
        throw Error(ErrorCode::InvalidState, "reconciler was moved from");
    }
    return *impl_;
}

Classification Reconciler::process(Row row) {
    return live().process(std::move(row));
}

ReconcileResult Reconciler::finish() {
    auto& impl = live();
    if (impl.finished) {
        throw Error(ErrorCode::InvalidState, "reconciler already finished");
    }
    impl.flush();
    impl.finished = true;
    return std::move(impl.result);
}

std::size_t Reconciler::pending() const { return live().pending.size(); }

ReconcileResult reconcile(RowSource& source, const VersionCache& cache,
                          Sink& sink, const SyncConfig& config) {
    SPDLOG_DEBUG("logging changes");
    Reconciler reconciler(cache, sink, config);
    Row row;
    while (source.next(row)) {
        reconciler.process(std::move(row));
        row.clear();
    }
    return reconciler.finish();
}

} // namespace ttsync

// ── sweep.cpp ───────────────────────────────────────────────────
namespace ttsync {

SweepResult sweep(const VersionCache& cache, const ReconcileResult& reconciled,
                  Sink& sink, const SyncConfig& config) {
    SweepResult out;
    out.closed_ids = reconciled.modified_ids;
    out.closed_modified = reconciled.modified_ids.size();

    // Only meaningful once the whole source has been seen.
    if (config.close_deleted_rows) {
        for (const auto& [key, entry] : cache) {
            if (!reconciled.seen.contains(key)) {
                out.closed_ids.push_back(entry.id);
                ++out.closed_deleted;
            }
        }
        SPDLOG_DEBUG("{} rows set as obsolete", out.closed_deleted);
    }

    std::sort(out.closed_ids.begin(), out.closed_ids.end());
    out.closed_ids.erase(std::unique(out.closed_ids.begin(), out.closed_ids.end()),
                         out.closed_ids.end());

    if (out.closed_ids.empty()) return out;

    SPDLOG_DEBUG("closing {} versions as of {}",
                 out.closed_ids.size(), format_date(config.as_of));
    sink.close_batch(out.closed_ids, config.as_of);
    return out;
}

} // namespace ttsync

// ── engine.cpp ──────────────────────────────────────────────────
namespace ttsync {

namespace {

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    double seconds() const {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace

SyncStats run_sync(RowSource& source, Sink& sink, const SyncConfig& config) {
    validate(config);
    SPDLOG_INFO("updating temporal table as of {}", format_date(config.as_of));

    Stopwatch total;
    SyncStats stats;

    Stopwatch phase;
    auto cache = VersionCache::build(sink, config);
    stats.cached = cache.size();
    SPDLOG_DEBUG("cache build took {:.3f}s", phase.seconds());

    phase = Stopwatch{};
    auto reconciled = reconcile(source, cache, sink, config);
    stats.rows_read = reconciled.rows_read;
    stats.inserted_new = reconciled.inserted_new;
    stats.inserted_modified = reconciled.inserted_modified;
    stats.unchanged = reconciled.unchanged;
    stats.flushes = reconciled.flushes;
    SPDLOG_DEBUG("reconcile took {:.3f}s", phase.seconds());

    phase = Stopwatch{};
    auto swept = sweep(cache, reconciled, sink, config);
    stats.closed_modified = swept.closed_modified;
    stats.closed_deleted = swept.closed_deleted;
    SPDLOG_DEBUG("sweep took {:.3f}s", phase.seconds());

    SPDLOG_INFO("read {} rows: {} new, {} modified, {} unchanged, {} deleted ({:.3f}s)",
                stats.rows_read, stats.inserted_new, stats.inserted_modified,
                stats.unchanged, stats.closed_deleted, total.seconds());
    return stats;
}

} // namespace ttsync

// ── sources.cpp ─────────────────────────────────────────────────
namespace ttsync {

bool VectorSource::next(Row& row) {
    if (pos_ >= rows_.size()) return false;
    row = std::move(rows_[pos_++]);
    return true;
}

struct SqliteQuerySource::Impl {
    sqlite3*                 db;
    detail::StmtGuard        stmt;
    std::vector<std::string> names;
    bool                     done = false;
};

SqliteQuerySource::SqliteQuerySource(sqlite3* db, const std::string& sql)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = db;
    impl_->stmt = detail::prepare(db, sql);

    int n = sqlite3_column_count(impl_->stmt.get());
    if (n == 0) {
        throw Error(ErrorCode::InvalidConfig, "source query returns no columns: " + sql);
    }
    impl_->names.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        const char* name = sqlite3_column_name(impl_->stmt.get(), i);
        impl_->names.emplace_back(name ? name : "");
    }
}

SqliteQuerySource::~SqliteQuerySource() = default;

bool SqliteQuerySource::next(Row& row) {
    if (impl_->done) return false;

    int rc = sqlite3_step(impl_->stmt.get());
    if (rc == SQLITE_DONE) {
        impl_->done = true;
        return false;
    }
    if (rc != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(impl_->db));
    }

    row.clear();
    row.reserve(impl_->names.size());
    for (std::size_t i = 0; i < impl_->names.size(); ++i) {
        row.push_back(Field{impl_->names[i],
                            detail::column_value(impl_->stmt.get(), static_cast<int>(i))});
    }
    return true;
}

bool MappedSource::next(Row& row) {
    Row raw;
    if (!inner_.next(raw)) return false;

    row.clear();
    for (auto& f : raw) {
        auto first = f.name.find_first_not_of(" \t");
        auto last = f.name.find_last_not_of(" \t");
        std::string name = first == std::string::npos
            ? std::string{} : f.name.substr(first, last - first + 1);

        auto it = map_.find(name);
        if (it != map_.end()) {
            row.push_back(Field{it->second, std::move(f.value)});
        } else if (!drop_unmapped_) {
            row.push_back(Field{std::move(name), std::move(f.value)});
        }
    }

    for (const auto& [from, to] : map_) {
        if (!find_field(row, to)) {
            throw Error(ErrorCode::MalformedRow,
                        "source row has no column '" + from + "' (mapped to '" + to + "')");
        }
    }
    return true;
}

} // namespace ttsync

// ── sqlite_sink.cpp ─────────────────────────────────────────────
namespace ttsync {

namespace {

const char* sql_type(ColumnType t) {
    switch (t) {
    case ColumnType::Text:    return "TEXT";
    case ColumnType::Integer: return "INTEGER";
    case ColumnType::Real:    return "REAL";
    case ColumnType::Date:    return "DATE";
    case ColumnType::Blob:    return "BLOB";
    }
    return "TEXT";
}

std::string join_quoted(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += detail::quote(n);
    }
    return out;
}

std::optional<std::int64_t> parse_int(const std::string& text) {
    std::int64_t n = 0;
    auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, n);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return n;
}

std::optional<double> parse_real(const std::string& text) {
    double d = 0;
    auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, d);
    if (ec != std::errc{} || ptr != last || !std::isfinite(d)) return std::nullopt;
    return d;
}

// Convert `v` to what a column of type `t` keeps without applying SQLite's
// type affinity. Returns nullopt if the canonical form would not survive.
std::optional<Value> to_column_type(const Value& v, ColumnType t) {
    if (std::holds_alternative<std::monostate>(v) ||
        std::holds_alternative<Blob>(v) || t == ColumnType::Blob) {
        return v;
    }
    auto canon = canonical_value(v);

    switch (t) {
    case ColumnType::Text:
        if (std::holds_alternative<std::string>(v)) return v;
        return Value{canon};

    case ColumnType::Integer: {
        if (std::holds_alternative<std::int64_t>(v)) return v;
        if (std::holds_alternative<Date>(v)) return std::nullopt;
        auto n = parse_int(canon);
        if (!n || std::to_string(*n) != canon) return std::nullopt;
        return Value{*n};
    }

    case ColumnType::Real: {
        if (std::holds_alternative<Date>(v)) return std::nullopt;
        if (const auto* d = std::get_if<double>(&v)) {
            if (!std::isfinite(*d)) return std::nullopt;
            return v;
        }
        auto d = parse_real(canon);
        if (!d || canonical_value(Value{*d}) != canon) return std::nullopt;
        return Value{*d};
    }

    case ColumnType::Date:
        if (std::holds_alternative<Date>(v)) return v;
        if (!std::holds_alternative<std::string>(v)) return std::nullopt;
        try {
            return Value{parse_date(canon)};
        } catch (const Error&) {
            return std::nullopt;
        }

    case ColumnType::Blob:
        break;
    }
    return v;
}

} // namespace

ColumnType parse_column_type(std::string_view name) {
    if (name == "text")    return ColumnType::Text;
    if (name == "integer") return ColumnType::Integer;
    if (name == "real")    return ColumnType::Real;
    if (name == "date")    return ColumnType::Date;
    if (name == "blob")    return ColumnType::Blob;
    throw Error(ErrorCode::InvalidConfig,
                "unknown column type '" + std::string(name) + "'");
}

struct SqliteSink::Impl {
    sqlite3*                 db;
    TableSpec                spec;
    std::vector<std::string> business;  // column names, declared order
    detail::StmtGuard        insert_stmt;
    detail::StmtGuard        close_stmt;

    void check_spec() {
        auto fail = [](const std::string& msg) {
            throw Error(ErrorCode::InvalidConfig, msg);
        };
        if (spec.table.empty()) fail("table name must not be empty");
        if (spec.columns.empty()) fail("table '" + spec.table + "' has no columns");

        for (const auto& c : spec.columns) {
            if (spec.system_columns.contains(c.name)) {
                fail("column '" + c.name + "' clashes with a system column");
            }
            if (std::find(business.begin(), business.end(), c.name) != business.end()) {
                fail("column '" + c.name + "' declared twice");
            }
            business.push_back(c.name);
        }
        for (const auto& k : spec.natural_key) {
            if (std::find(business.begin(), business.end(), k) == business.end()) {
                fail("natural key column '" + k + "' is not a table column");
            }
        }
    }

    bool table_exists() {
        auto stmt = detail::prepare(db,
            "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
        sqlite3_bind_text(stmt.get(), 1, spec.table.c_str(),
                          static_cast<int>(spec.table.size()), SQLITE_TRANSIENT);
        return sqlite3_step(stmt.get()) == SQLITE_ROW;
    }

    sqlite3_stmt* insert() {
        if (!insert_stmt) {
            const auto& sys = spec.system_columns;
            auto cols = business;
            cols.push_back(sys.valid_from);
            cols.push_back(sys.valid_to);

            std::string params;
            for (std::size_t i = 0; i < cols.size(); ++i) {
                params += i == 0 ? "?" : ", ?";
            }
            insert_stmt = detail::prepare(db,
                "INSERT INTO " + detail::quote(spec.table) +
                " (" + join_quoted(cols) + ") VALUES (" + params + ")");
        }
        return insert_stmt.get();
    }

    sqlite3_stmt* close() {
        if (!close_stmt) {
            close_stmt = detail::prepare(db,
                "UPDATE " + detail::quote(spec.table) +
                " SET " + detail::quote(spec.system_columns.valid_to) + " = ?" +
                " WHERE " + detail::quote(spec.system_columns.id) + " = ?");
        }
        return close_stmt.get();
    }

    void check_row(const Row& row) const {
        const auto& sys = spec.system_columns;
        for (const auto& f : row) {
            if (f.name == sys.valid_from || f.name == sys.valid_to) continue;
            if (std::find(business.begin(), business.end(), f.name) == business.end()) {
                throw Error(ErrorCode::MalformedRow,
                            "column '" + f.name + "' is not in table '" + spec.table + "'");
            }
        }
        if (!find_field(row, sys.valid_from) || !find_field(row, sys.valid_to)) {
            throw Error(ErrorCode::MalformedRow,
                        "row for table '" + spec.table + "' lacks validity columns");
        }
    }
};

SqliteSink::SqliteSink(sqlite3* db, TableSpec spec)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = db;
    impl_->spec = std::move(spec);
    impl_->check_spec();
}

SqliteSink::~SqliteSink() = default;

const TableSpec& SqliteSink::spec() const { return impl_->spec; }

void SqliteSink::ensure_table() {
    const auto& spec = impl_->spec;
    const auto& sys = spec.system_columns;

    if (impl_->table_exists()) {
        SPDLOG_DEBUG("table '{}' already exists", spec.table);
        return;
    }

    std::string sql = "CREATE TABLE " + detail::quote(spec.table) + " (" +
                      detail::quote(sys.id) + " INTEGER PRIMARY KEY";
    for (const auto& c : spec.columns) {
        sql += ", " + detail::quote(c.name) + " " + sql_type(c.type);
    }
    sql += ", " + detail::quote(sys.valid_from) + " DATE NOT NULL";
    sql += ", " + detail::quote(sys.valid_to) + " DATE NOT NULL)";
    detail::exec(impl_->db, sql);

    detail::exec(impl_->db,
        "CREATE INDEX " + detail::quote("ix_" + spec.table + "_" + sys.valid_to) +
        " ON " + detail::quote(spec.table) + " (" + detail::quote(sys.valid_to) + ")");

    if (!spec.natural_key.empty()) {
        std::string index = "ix_" + spec.table;
        for (const auto& k : spec.natural_key) index += "_" + k;
        detail::exec(impl_->db,
            "CREATE INDEX " + detail::quote(index) + " ON " +
            detail::quote(spec.table) + " (" + join_quoted(spec.natural_key) + ")");
    }

    SPDLOG_INFO("created temporal table '{}'", spec.table);
}

void SqliteSink::scan_current(const Date& open_valid_to, const ScanCallback& cb) {
    const auto& spec = impl_->spec;
    auto stmt = detail::prepare(impl_->db,
        "SELECT " + detail::quote(spec.system_columns.id) + ", " +
        join_quoted(impl_->business) + " FROM " + detail::quote(spec.table) +
        " WHERE " + detail::quote(spec.system_columns.valid_to) + " = ?" +
        " ORDER BY " + detail::quote(spec.system_columns.id));
    detail::bind_value(impl_->db, stmt.get(), 1, open_valid_to);

    Row row;
    row.reserve(impl_->business.size());
    for (;;) {
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            throw Error(ErrorCode::SqliteError, sqlite3_errmsg(impl_->db));
        }

        RecordId id = sqlite3_column_int64(stmt.get(), 0);
        row.clear();
        for (std::size_t i = 0; i < impl_->business.size(); ++i) {
            row.push_back(Field{impl_->business[i],
                                detail::column_value(stmt.get(), static_cast<int>(i + 1))});
        }
        if (!cb(row, id)) break;
    }
}

void SqliteSink::insert_batch(const std::vector<Row>& rows) {
    if (rows.empty()) return;

    const auto& sys = impl_->spec.system_columns;
    auto* stmt = impl_->insert();

    for (const auto& row : rows) {
        impl_->check_row(row);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        int idx = 1;
        for (const auto& col : impl_->spec.columns) {
            const Value* v = find_field(row, col.name);
            if (!v) {
                detail::bind_value(impl_->db, stmt, idx++, Value{});
                continue;
            }
            auto stored = to_column_type(*v, col.type);
            if (!stored) {
                throw Error(ErrorCode::MalformedRow,
                            "value '" + canonical_value(*v) + "' of column '" + col.name +
                            "' cannot be stored unchanged as " + sql_type(col.type));
            }
            detail::bind_value(impl_->db, stmt, idx++, *stored);
        }
        detail::bind_value(impl_->db, stmt, idx++, *find_field(row, sys.valid_from));
        detail::bind_value(impl_->db, stmt, idx++, *find_field(row, sys.valid_to));

        detail::step_done(impl_->db, stmt);
    }
    sqlite3_reset(stmt);
}

void SqliteSink::close_batch(const std::vector<RecordId>& ids, const Date& as_of) {
    if (ids.empty()) return;

    auto* stmt = impl_->close();
    for (RecordId id : ids) {
        sqlite3_reset(stmt);
        detail::bind_value(impl_->db, stmt, 1, as_of);
        detail::bind_value(impl_->db, stmt, 2, Value{id});

        detail::step_done(impl_->db, stmt);
        if (sqlite3_changes(impl_->db) != 1) {
            throw Error(ErrorCode::InvalidState,
                        "table '" + impl_->spec.table + "' has no version with id " +
                        std::to_string(id));
        }
    }
    sqlite3_reset(stmt);
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    detail::exec(db_, "BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (done_) return;
    int rc = sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        SPDLOG_WARN("rollback failed: {}", sqlite3_errmsg(db_));
    } else {
        SPDLOG_INFO("transaction rolled back");
    }
}

void Transaction::commit() {
    if (done_) {
        throw Error(ErrorCode::InvalidState, "transaction already committed");
    }
    detail::exec(db_, "COMMIT");
    done_ = true;
}

} // namespace ttsync
