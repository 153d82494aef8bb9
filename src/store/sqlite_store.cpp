/// @file src/store/sqlite_store.cpp
/// @brief SQLite3-backed Store.
///
/// Each commit runs inside `BEGIN IMMEDIATE … COMMIT`: the date's rows are
/// deleted from every table and the canonical batch is inserted. Any failure
/// rolls the transaction back, so a partition is always either the previous
/// one or the new one.

#include "sift/store.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <mutex>
#include <tuple>
#include <utility>

namespace sift::store {

struct SqliteStore::Connection {
    sqlite3*   db = nullptr;
    std::mutex mtx;

    ~Connection() {
        if (db != nullptr) sqlite3_close(db);
    }
};

namespace {

// ─── Statement helpers ────────────────────────────────────────────────────────

struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const noexcept { sqlite3_finalize(s); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

StoreFailure failure_from(sqlite3* db, std::string_view what) {
    const int code = sqlite3_extended_errcode(db) & 0xff;
    return StoreFailure{
        .error  = code == SQLITE_CONSTRAINT ? StoreError::ConstraintViolation
                                            : StoreError::Unavailable,
        .detail = fmt::format("{}: {}", what, sqlite3_errmsg(db)),
    };
}

std::optional<StoreFailure> exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        StoreFailure f{.error  = StoreError::Unavailable,
                       .detail = fmt::format("{}: {}", sql, err != nullptr ? err : "unknown")};
        sqlite3_free(err);
        return f;
    }
    return std::nullopt;
}

StoreResult<Statement> prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return failure_from(db, "prepare");
    }
    return Statement(raw);
}

/// Sequential parameter binder; the first failed bind sticks.
class Binder {
public:
    explicit Binder(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    Binder& text(std::string_view v) {
        if (ok_) {
            ok_ = sqlite3_bind_text(stmt_, ++index_, v.data(), static_cast<int>(v.size()),
                                    SQLITE_TRANSIENT) == SQLITE_OK;
        }
        return *this;
    }
    Binder& date(TradingDate d) { return text(d.to_string()); }
    Binder& real(double v) {
        if (ok_) ok_ = sqlite3_bind_double(stmt_, ++index_, v) == SQLITE_OK;
        return *this;
    }
    Binder& real_or_null(IndicatorValue v) {
        if (v) return real(*v);
        if (ok_) ok_ = sqlite3_bind_null(stmt_, ++index_) == SQLITE_OK;
        return *this;
    }
    Binder& integer(std::int64_t v) {
        if (ok_) ok_ = sqlite3_bind_int64(stmt_, ++index_, v) == SQLITE_OK;
        return *this;
    }

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    sqlite3_stmt* stmt_;
    int           index_ = 0;
    bool          ok_    = true;
};

std::string column_text(sqlite3_stmt* s, int col) {
    const auto* p = sqlite3_column_text(s, col);
    if (p == nullptr) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<std::size_t>(sqlite3_column_bytes(s, col)));
}

IndicatorValue column_optional(sqlite3_stmt* s, int col) {
    if (sqlite3_column_type(s, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(s, col);
}

/// Step a bound write statement to completion.
std::optional<StoreFailure> run(sqlite3* db, sqlite3_stmt* s, const Binder& b,
                                std::string_view what) {
    if (!b.ok()) return failure_from(db, fmt::format("bind {}", what));
    if (sqlite3_step(s) != SQLITE_DONE) return failure_from(db, what);
    return std::nullopt;
}

constexpr const char* SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS partitions (
    date TEXT PRIMARY KEY
);
CREATE TABLE IF NOT EXISTS bars (
    date   TEXT NOT NULL,
    code   TEXT NOT NULL,
    open   REAL NOT NULL,
    high   REAL NOT NULL,
    low    REAL NOT NULL,
    close  REAL NOT NULL,
    volume REAL NOT NULL,
    amount REAL NOT NULL,
    PRIMARY KEY (date, code)
);
CREATE INDEX IF NOT EXISTS bars_by_code ON bars (code, date);
CREATE TABLE IF NOT EXISTS indicator_rows (
    date TEXT NOT NULL,
    code TEXT NOT NULL,
    PRIMARY KEY (date, code)
);
CREATE TABLE IF NOT EXISTS indicator_values (
    date  TEXT NOT NULL,
    code  TEXT NOT NULL,
    name  TEXT NOT NULL,
    value REAL,
    PRIMARY KEY (date, code, name)
);
CREATE TABLE IF NOT EXISTS strategy_results (
    date     TEXT NOT NULL,
    strategy TEXT NOT NULL,
    code     TEXT NOT NULL,
    score    REAL NOT NULL,
    PRIMARY KEY (date, strategy, code)
);
CREATE TABLE IF NOT EXISTS result_params (
    date     TEXT NOT NULL,
    strategy TEXT NOT NULL,
    code     TEXT NOT NULL,
    name     TEXT NOT NULL,
    value    REAL NOT NULL,
    PRIMARY KEY (date, strategy, code, name)
);
)sql";

constexpr const char* BAR_COLUMNS = "date, code, open, high, low, close, volume, amount";

StoreResult<Bar> read_bar(sqlite3_stmt* s) {
    const auto date = TradingDate::parse(column_text(s, 0));
    if (!date) {
        return StoreFailure{.error = StoreError::Unavailable,
                            .detail = "corrupt date in bars table"};
    }
    return Bar{
        .code   = column_text(s, 1),
        .date   = *date,
        .open   = sqlite3_column_double(s, 2),
        .high   = sqlite3_column_double(s, 3),
        .low    = sqlite3_column_double(s, 4),
        .close  = sqlite3_column_double(s, 5),
        .volume = sqlite3_column_double(s, 6),
        .amount = sqlite3_column_double(s, 7),
    };
}

/// Collect every row of a bound bar query.
StoreResult<std::vector<Bar>> collect_bars(sqlite3* db, sqlite3_stmt* s) {
    std::vector<Bar> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        auto bar = read_bar(s);
        if (auto* f = std::get_if<StoreFailure>(&bar)) return *f;
        out.push_back(std::move(std::get<Bar>(bar)));
    }
    if (rc != SQLITE_DONE) return failure_from(db, "read bars");
    return out;
}

}  // namespace

// ─── Lifecycle ────────────────────────────────────────────────────────────────

SqliteStore::SqliteStore(std::unique_ptr<Connection> conn)
    : conn_(std::move(conn)) {}

SqliteStore::~SqliteStore() = default;

StoreResult<std::unique_ptr<SqliteStore>>
SqliteStore::open(const std::string& path, SqliteOptions options) {
    auto conn = std::make_unique<Connection>();
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &conn->db, flags, nullptr) != SQLITE_OK) {
        return StoreFailure{
            .error  = StoreError::Unavailable,
            .detail = fmt::format("open {}: {}", path,
                                  conn->db != nullptr ? sqlite3_errmsg(conn->db) : "out of memory"),
        };
    }
    sqlite3_busy_timeout(conn->db, options.busy_timeout_ms);

    if (options.wal && path != ":memory:") {
        if (auto f = exec(conn->db, "PRAGMA journal_mode=WAL;")) return *f;
        if (auto f = exec(conn->db, "PRAGMA synchronous=NORMAL;")) return *f;
    }
    if (auto f = exec(conn->db, SCHEMA)) return *f;

    spdlog::debug("opened sqlite store {}", path);
    return std::unique_ptr<SqliteStore>(new SqliteStore(std::move(conn)));
}

// ─── Commit ───────────────────────────────────────────────────────────────────

namespace {

std::optional<StoreFailure> write_partition(sqlite3* db, const DateBatch& batch) {
    static constexpr const char* DELETES[] = {
        "DELETE FROM partitions WHERE date = ?1",
        "DELETE FROM bars WHERE date = ?1",
        "DELETE FROM indicator_rows WHERE date = ?1",
        "DELETE FROM indicator_values WHERE date = ?1",
        "DELETE FROM strategy_results WHERE date = ?1",
        "DELETE FROM result_params WHERE date = ?1",
    };
    for (const char* sql : DELETES) {
        auto stmt = prepare(db, sql);
        if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
        auto* s = std::get<Statement>(stmt).get();
        if (auto f = run(db, s, Binder(s).date(batch.date), "delete partition")) return f;
    }

    {
        auto stmt = prepare(db, "INSERT INTO partitions (date) VALUES (?1)");
        if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
        auto* s = std::get<Statement>(stmt).get();
        if (auto f = run(db, s, Binder(s).date(batch.date), "insert partition")) return f;
    }

    {
        auto stmt = prepare(db, "INSERT INTO bars (date, code, open, high, low, close, volume, amount) "
                                "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
        if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
        auto* s = std::get<Statement>(stmt).get();
        for (const auto& b : batch.bars) {
            Binder binder(s);
            binder.date(b.date).text(b.code).real(b.open).real(b.high).real(b.low)
                  .real(b.close).real(b.volume).real(b.amount);
            if (auto f = run(db, s, binder, "insert bar")) return f;
        }
    }

    {
        auto rows = prepare(db, "INSERT INTO indicator_rows (date, code) VALUES (?1, ?2)");
        if (auto* f = std::get_if<StoreFailure>(&rows)) return *f;
        auto vals = prepare(db, "INSERT INTO indicator_values (date, code, name, value) "
                                "VALUES (?1, ?2, ?3, ?4)");
        if (auto* f = std::get_if<StoreFailure>(&vals)) return *f;
        auto* rs = std::get<Statement>(rows).get();
        auto* vs = std::get<Statement>(vals).get();
        for (const auto& r : batch.indicators) {
            if (auto f = run(db, rs, Binder(rs).date(r.date).text(r.code), "insert indicator row")) {
                return f;
            }
            for (const auto& [name, value] : r.values) {
                Binder binder(vs);
                binder.date(r.date).text(r.code).text(name).real_or_null(value);
                if (auto f = run(db, vs, binder, "insert indicator value")) return f;
            }
        }
    }

    {
        auto res = prepare(db, "INSERT INTO strategy_results (date, strategy, code, score) "
                               "VALUES (?1, ?2, ?3, ?4)");
        if (auto* f = std::get_if<StoreFailure>(&res)) return *f;
        auto par = prepare(db, "INSERT INTO result_params (date, strategy, code, name, value) "
                               "VALUES (?1, ?2, ?3, ?4, ?5)");
        if (auto* f = std::get_if<StoreFailure>(&par)) return *f;
        auto* rs = std::get<Statement>(res).get();
        auto* ps = std::get<Statement>(par).get();
        for (const auto& r : batch.results) {
            Binder binder(rs);
            binder.date(r.date).text(r.strategy).text(r.code).real(r.score);
            if (auto f = run(db, rs, binder, "insert strategy result")) return f;
            for (const auto& [name, value] : r.params) {
                Binder pb(ps);
                pb.date(r.date).text(r.strategy).text(r.code).text(name).real(value);
                if (auto f = run(db, ps, pb, "insert result param")) return f;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<StoreFailure> SqliteStore::commit(const DateBatch& batch) {
    auto normalized = normalize_batch(batch);
    if (auto* failure = std::get_if<StoreFailure>(&normalized)) {
        return *failure;
    }
    const auto& canonical = std::get<DateBatch>(normalized);

    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;

    if (auto f = exec(db, "BEGIN IMMEDIATE")) return f;

    if (auto f = write_partition(db, canonical)) {
        if (auto rb = exec(db, "ROLLBACK")) {
            spdlog::error("rollback of {} failed: {}", batch.date.to_string(), rb->detail);
        }
        return f;
    }
    if (auto f = exec(db, "COMMIT")) {
        if (auto rb = exec(db, "ROLLBACK")) {
            spdlog::error("rollback of {} failed: {}", batch.date.to_string(), rb->detail);
        }
        return f;
    }
    return std::nullopt;
}

// ─── Reads ────────────────────────────────────────────────────────────────────

StoreResult<std::vector<Bar>>
SqliteStore::get_bars(std::string_view code, DateRange range) const {
    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;
    const std::string sql = fmt::format(
        "SELECT {} FROM bars WHERE code = ?1 AND date >= ?2 AND date <= ?3 ORDER BY date",
        BAR_COLUMNS);
    auto stmt = prepare(db, sql.c_str());
    if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
    auto* s = std::get<Statement>(stmt).get();

    Binder binder(s);
    binder.text(code).date(range.first).date(range.last);
    if (!binder.ok()) return failure_from(db, "bind get_bars");
    return collect_bars(db, s);
}

StoreResult<std::vector<Bar>>
SqliteStore::bar_history(std::string_view code, TradingDate before, std::size_t max_bars) const {
    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;
    const std::string sql = fmt::format(
        "SELECT {} FROM bars WHERE code = ?1 AND date < ?2 ORDER BY date DESC LIMIT ?3",
        BAR_COLUMNS);
    auto stmt = prepare(db, sql.c_str());
    if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
    auto* s = std::get<Statement>(stmt).get();

    Binder binder(s);
    binder.text(code).date(before).integer(static_cast<std::int64_t>(max_bars));
    if (!binder.ok()) return failure_from(db, "bind bar_history");

    auto bars = collect_bars(db, s);
    if (auto* list = std::get_if<std::vector<Bar>>(&bars)) {
        std::reverse(list->begin(), list->end());
    }
    return bars;
}

StoreResult<std::optional<IndicatorRow>>
SqliteStore::get_indicators(std::string_view code, TradingDate date) const {
    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;

    auto exists = prepare(db, "SELECT 1 FROM indicator_rows WHERE date = ?1 AND code = ?2");
    if (auto* f = std::get_if<StoreFailure>(&exists)) return *f;
    auto* es = std::get<Statement>(exists).get();
    Binder eb(es);
    eb.date(date).text(code);
    if (!eb.ok()) return failure_from(db, "bind get_indicators");
    const int rc = sqlite3_step(es);
    if (rc == SQLITE_DONE) return std::optional<IndicatorRow>{};
    if (rc != SQLITE_ROW) return failure_from(db, "read indicator row");

    auto values = prepare(db, "SELECT name, value FROM indicator_values "
                              "WHERE date = ?1 AND code = ?2 ORDER BY name");
    if (auto* f = std::get_if<StoreFailure>(&values)) return *f;
    auto* vs = std::get<Statement>(values).get();
    Binder vb(vs);
    vb.date(date).text(code);
    if (!vb.ok()) return failure_from(db, "bind get_indicators");

    IndicatorRow row{.code = std::string(code), .date = date, .values = {}};
    int step = SQLITE_ROW;
    while ((step = sqlite3_step(vs)) == SQLITE_ROW) {
        row.values.emplace(column_text(vs, 0), column_optional(vs, 1));
    }
    if (step != SQLITE_DONE) return failure_from(db, "read indicator values");
    return std::optional<IndicatorRow>{std::move(row)};
}

StoreResult<std::vector<StrategyResult>>
SqliteStore::get_strategy_results(TradingDate date,
                                  const std::optional<std::string>& strategy) const {
    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;

    const char* results_sql = strategy
        ? "SELECT strategy, code, score FROM strategy_results "
          "WHERE date = ?1 AND strategy = ?2 ORDER BY strategy, code"
        : "SELECT strategy, code, score FROM strategy_results "
          "WHERE date = ?1 ORDER BY strategy, code";
    auto stmt = prepare(db, results_sql);
    if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
    auto* s = std::get<Statement>(stmt).get();
    Binder binder(s);
    binder.date(date);
    if (strategy) binder.text(*strategy);
    if (!binder.ok()) return failure_from(db, "bind get_strategy_results");

    std::vector<StrategyResult> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        out.push_back(StrategyResult{
            .strategy = column_text(s, 0),
            .code     = column_text(s, 1),
            .date     = date,
            .score    = sqlite3_column_double(s, 2),
            .params   = {},
        });
    }
    if (rc != SQLITE_DONE) return failure_from(db, "read strategy results");
    if (out.empty()) return out;

    auto params = prepare(db, "SELECT strategy, code, name, value FROM result_params "
                              "WHERE date = ?1");
    if (auto* f = std::get_if<StoreFailure>(&params)) return *f;
    auto* ps = std::get<Statement>(params).get();
    Binder pb(ps);
    pb.date(date);
    if (!pb.ok()) return failure_from(db, "bind result params");

    std::map<std::pair<std::string, std::string>, std::size_t> index;
    for (std::size_t i = 0; i < out.size(); ++i) {
        index.emplace(std::make_pair(out[i].strategy, out[i].code), i);
    }
    while ((rc = sqlite3_step(ps)) == SQLITE_ROW) {
        const auto it = index.find({column_text(ps, 0), column_text(ps, 1)});
        if (it == index.end()) continue;
        out[it->second].params.insert_or_assign(column_text(ps, 2),
                                                sqlite3_column_double(ps, 3));
    }
    if (rc != SQLITE_DONE) return failure_from(db, "read result params");
    return out;
}

StoreResult<std::vector<TradingDate>> SqliteStore::committed_dates() const {
    std::lock_guard lock(conn_->mtx);
    sqlite3* db = conn_->db;
    auto stmt = prepare(db, "SELECT date FROM partitions ORDER BY date");
    if (auto* f = std::get_if<StoreFailure>(&stmt)) return *f;
    auto* s = std::get<Statement>(stmt).get();

    std::vector<TradingDate> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        const auto d = TradingDate::parse(column_text(s, 0));
        if (!d) {
            return StoreFailure{.error = StoreError::Unavailable,
                                .detail = "corrupt date in partitions table"};
        }
        out.push_back(*d);
    }
    if (rc != SQLITE_DONE) return failure_from(db, "read partitions");
    return out;
}

}  // namespace sift::store
