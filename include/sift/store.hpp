#pragma once

/// @file include/sift/store.hpp
/// @brief Date-partitioned persistence for bars, indicator rows and matches.
///
/// # Module: Store
///
/// ## Responsibility
/// Persist one `DateBatch` per trading date and serve read-only queries.
///
/// ## Guarantees
/// - `commit` replaces the whole partition of its date in one transaction:
///   bars, indicator rows and strategy results change together or not at all
/// - A batch is validated before anything is written: every record must be
///   dated on the batch date; identical duplicates collapse, conflicting
///   duplicates are a `ConstraintViolation`
/// - Committing the same batch twice leaves the same state as once
/// - Reads never observe a half-written partition
///
/// ## Backends
/// - `MemoryStore`: process-local, guarded by a shared mutex
/// - `SqliteStore`: SQLite3 file (WAL journal, `BEGIN IMMEDIATE` per commit)

#include "sift/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sift::store {

// ─── Results ──────────────────────────────────────────────────────────────────

struct StoreFailure {
    StoreError  error;
    std::string detail;
};

/// Value or failure.
template <typename T>
using StoreResult = std::variant<T, StoreFailure>;

template <typename T>
[[nodiscard]] bool ok(const StoreResult<T>& r) noexcept {
    return std::holds_alternative<T>(r);
}

// ─── DateBatch ────────────────────────────────────────────────────────────────

/// Everything computed for one date, committed as a unit.
struct DateBatch {
    TradingDate                 date;
    std::vector<Bar>            bars;
    std::vector<IndicatorRow>   indicators;
    std::vector<StrategyResult> results;
};

/// Validate a batch and bring it to canonical form: bars and rows sorted by
/// code, results by (strategy, code), identical duplicates removed.
///
/// # Returns
/// The canonical batch, or a `ConstraintViolation` naming the first
/// offending key.
[[nodiscard]] StoreResult<DateBatch> normalize_batch(DateBatch batch);

// ─── Store ────────────────────────────────────────────────────────────────────

class Store {
public:
    virtual ~Store() = default;

    /// Atomically replace the partition of `batch.date`.
    ///
    /// # Returns
    /// `nullopt` on success.
    [[nodiscard]] virtual std::optional<StoreFailure> commit(const DateBatch& batch) = 0;

    /// Bars of `code` dated within `range`, ascending.
    [[nodiscard]] virtual StoreResult<std::vector<Bar>>
    get_bars(std::string_view code, DateRange range) const = 0;

    /// Indicator row of `code` on `date`; `nullopt` if none was committed.
    [[nodiscard]] virtual StoreResult<std::optional<IndicatorRow>>
    get_indicators(std::string_view code, TradingDate date) const = 0;

    /// Results of `date` sorted by (strategy, code), optionally for one
    /// strategy only.
    [[nodiscard]] virtual StoreResult<std::vector<StrategyResult>>
    get_strategy_results(TradingDate date, const std::optional<std::string>& strategy) const = 0;

    /// Up to `max_bars` most recent bars of `code` dated strictly before
    /// `before`, ascending.
    [[nodiscard]] virtual StoreResult<std::vector<Bar>>
    bar_history(std::string_view code, TradingDate before, std::size_t max_bars) const = 0;

    /// Dates with a committed partition, ascending.
    [[nodiscard]] virtual StoreResult<std::vector<TradingDate>> committed_dates() const = 0;
};

/// Ordered matches of `date` for the automation consumer. Carries no
/// indicator values.
[[nodiscard]] StoreResult<std::vector<StrategyResult>>
list_matches(const Store& store, TradingDate date);

// ─── MemoryStore ──────────────────────────────────────────────────────────────

class MemoryStore final : public Store {
public:
    MemoryStore() = default;

    [[nodiscard]] std::optional<StoreFailure> commit(const DateBatch& batch) override;

    [[nodiscard]] StoreResult<std::vector<Bar>>
    get_bars(std::string_view code, DateRange range) const override;

    [[nodiscard]] StoreResult<std::optional<IndicatorRow>>
    get_indicators(std::string_view code, TradingDate date) const override;

    [[nodiscard]] StoreResult<std::vector<StrategyResult>>
    get_strategy_results(TradingDate date,
                         const std::optional<std::string>& strategy) const override;

    [[nodiscard]] StoreResult<std::vector<Bar>>
    bar_history(std::string_view code, TradingDate before, std::size_t max_bars) const override;

    [[nodiscard]] StoreResult<std::vector<TradingDate>> committed_dates() const override;

    /// Total bars across all partitions.
    [[nodiscard]] std::size_t bar_count() const;

private:
    struct Partition {
        std::map<std::string, Bar, std::less<>>          bars;
        std::map<std::string, IndicatorRow, std::less<>> indicators;
        std::vector<StrategyResult>                      results;  ///< Sorted
    };

    mutable std::shared_mutex           mtx_;
    std::map<TradingDate, Partition>    partitions_;
};

// ─── SqliteStore ──────────────────────────────────────────────────────────────

struct SqliteOptions {
    int  busy_timeout_ms = 5000;
    bool wal             = true;  ///< Ignored for ":memory:"
};

/// SQLite3-backed store. One connection, serialised by an internal mutex.
///
/// Schema (dates stored as `YYYY-MM-DD` text):
/// - `partitions(date)`                                      committed dates
/// - `bars(date, code, open, high, low, close, volume, amount)`
/// - `indicator_rows(date, code)`
/// - `indicator_values(date, code, name, value)`             NULL = undefined
/// - `strategy_results(date, strategy, code, score)`
/// - `result_params(date, strategy, code, name, value)`
class SqliteStore final : public Store {
public:
    /// Open (creating if needed) the database at `path` and apply the schema.
    [[nodiscard]] static StoreResult<std::unique_ptr<SqliteStore>>
    open(const std::string& path, SqliteOptions options = SqliteOptions{});

    ~SqliteStore() override;
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    [[nodiscard]] std::optional<StoreFailure> commit(const DateBatch& batch) override;

    [[nodiscard]] StoreResult<std::vector<Bar>>
    get_bars(std::string_view code, DateRange range) const override;

    [[nodiscard]] StoreResult<std::optional<IndicatorRow>>
    get_indicators(std::string_view code, TradingDate date) const override;

    [[nodiscard]] StoreResult<std::vector<StrategyResult>>
    get_strategy_results(TradingDate date,
                         const std::optional<std::string>& strategy) const override;

    [[nodiscard]] StoreResult<std::vector<Bar>>
    bar_history(std::string_view code, TradingDate before, std::size_t max_bars) const override;

    [[nodiscard]] StoreResult<std::vector<TradingDate>> committed_dates() const override;

private:
    struct Connection;

    explicit SqliteStore(std::unique_ptr<Connection> conn);

    std::unique_ptr<Connection> conn_;
};

}  // namespace sift::store
