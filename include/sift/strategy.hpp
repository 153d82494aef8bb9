#pragma once

/// @file include/sift/strategy.hpp
/// @brief Pluggable selection strategies and the engine that evaluates them.
///
/// # Module: Strategy Engine
///
/// ## Responsibility
/// Evaluate every strategy of an immutable `StrategySet` against every
/// instrument computed for a date, and collect the matches.
///
/// ## Guarantees
/// - Each (strategy, instrument) pair is evaluated independently; an
///   exception thrown by one pair is recorded as a `StrategyFailure` and the
///   remaining pairs still run
/// - Instruments rejected by `Strategy::eligible` are absent from results
/// - Results are sorted by strategy name, then instrument code
/// - Strategies only receive read-only inputs; market-wide aggregates are
///   computed once per date into a `MarketSnapshot`

#include "sift/constants.hpp"
#include "sift/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sift::strategy {

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// Market-wide aggregates for one date, built from every computed row.
struct MarketSnapshot {
    TradingDate    date;
    std::size_t    instruments = 0;
    std::size_t    advancing   = 0;  ///< p_change > 0
    std::size_t    declining   = 0;  ///< p_change < 0
    IndicatorValue mean_p_change;    ///< Undefined when no row has p_change

    /// Aggregate the rows dated `date`; rows for other dates are ignored.
    [[nodiscard]] static MarketSnapshot from_rows(TradingDate date,
                                                  std::span<const IndicatorRow> rows);
};

/// Everything the engine knows about one instrument for the date.
///
/// `bars` is ascending and ends at the evaluation date. `rows` is aligned
/// with the tail of `bars`: `rows.back()` belongs to `bars.back()`.
struct StrategyInput {
    Instrument                instrument;
    std::vector<Bar>          bars;
    std::vector<IndicatorRow> rows;
};

/// Read-only view handed to a strategy.
class StrategyContext {
public:
    StrategyContext(const Instrument& instrument,
                    std::span<const Bar> bars,
                    std::span<const IndicatorRow> rows,
                    const MarketSnapshot& market) noexcept;

    [[nodiscard]] const Instrument& instrument() const noexcept { return *instrument_; }
    [[nodiscard]] std::span<const Bar> bars() const noexcept { return bars_; }
    [[nodiscard]] std::span<const IndicatorRow> rows() const noexcept { return rows_; }
    [[nodiscard]] const MarketSnapshot& market() const noexcept { return *market_; }

    /// Date of the last bar (the evaluation date), or the market date when
    /// there are no bars.
    [[nodiscard]] TradingDate date() const noexcept;

    /// Value of indicator `name` on bar index `i` (0 = oldest bar).
    /// Undefined when the bar has no aligned row.
    [[nodiscard]] IndicatorValue indicator(std::string_view name, std::size_t i) const;

    /// Value of indicator `name` on the evaluation date.
    [[nodiscard]] IndicatorValue indicator(std::string_view name) const;

    /// The same view truncated to bars [0, i], as if evaluated on bar i.
    [[nodiscard]] StrategyContext as_of(std::size_t i) const noexcept;

private:
    const Instrument*             instrument_;
    std::span<const Bar>          bars_;
    std::span<const IndicatorRow> rows_;
    const MarketSnapshot*         market_;
};

/// A positive decision with the values that produced it.
struct Match {
    double score = 0.0;
    std::map<std::string, double, std::less<>> params;
};

// ─── Strategy ─────────────────────────────────────────────────────────────────

class Strategy {
public:
    virtual ~Strategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Minimum number of bars (evaluation date included).
    [[nodiscard]] virtual std::size_t lookback() const noexcept { return 1; }

    /// Indicators that must be defined on the evaluation date.
    [[nodiscard]] virtual std::vector<std::string> required_indicators() const { return {}; }

    /// Eligibility filter run before `evaluate`.
    ///
    /// Default: listing status Active, at least `lookback()` bars, and every
    /// `required_indicators()` entry defined on the evaluation date.
    [[nodiscard]] virtual bool eligible(const StrategyContext& ctx) const;

    [[nodiscard]] virtual std::optional<Match> evaluate(const StrategyContext& ctx) const = 0;
};

using StrategyPtr = std::shared_ptr<const Strategy>;

// ─── StrategySet / StrategyRegistry ───────────────────────────────────────────

/// Immutable snapshot of strategies, ordered by name.
class StrategySet {
public:
    StrategySet() = default;

    [[nodiscard]] std::span<const StrategyPtr> strategies() const noexcept { return items_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return items_.empty(); }
    [[nodiscard]] const Strategy* find(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string> names() const;

    /// Bars needed to evaluate every strategy of the set.
    [[nodiscard]] std::size_t max_lookback() const noexcept;

private:
    friend class StrategyRegistry;
    explicit StrategySet(std::vector<StrategyPtr> items);

    std::vector<StrategyPtr> items_;
};

class StrategyRegistry {
public:
    /// # Returns
    /// `false` if `strategy` is null, unnamed, or its name is taken.
    bool add(StrategyPtr strategy);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    /// Snapshot of every registered strategy.
    [[nodiscard]] StrategySet snapshot() const;

    /// Snapshot restricted to `allow`.
    ///
    /// # Returns
    /// `nullopt` if `allow` names a strategy that is not registered.
    [[nodiscard]] std::optional<StrategySet>
    snapshot(std::span<const std::string> allow) const;

private:
    std::vector<StrategyPtr> items_;
};

/// Register every built-in strategy with default thresholds.
void register_builtin_strategies(StrategyRegistry& registry);

[[nodiscard]] StrategySet builtin_strategy_set();

// ─── StrategyEngine ───────────────────────────────────────────────────────────

struct StrategyFailure {
    std::string strategy;
    std::string code;
    std::string message;
};

struct EvaluationReport {
    std::vector<StrategyResult>  results;   ///< Sorted by (strategy, code)
    std::vector<StrategyFailure> failures;  ///< Sorted by (strategy, code)
    std::size_t                  evaluated = 0;  ///< Eligible pairs evaluated
};

class StrategyEngine {
public:
    explicit StrategyEngine(StrategySet set,
                            std::size_t workers = constants::DEFAULT_COMPUTE_WORKERS);

    /// Evaluate every strategy against every input for `date`.
    [[nodiscard]] EvaluationReport evaluate(TradingDate date,
                                            std::span<const StrategyInput> inputs,
                                            const MarketSnapshot& market) const;

    [[nodiscard]] const StrategySet& set() const noexcept { return set_; }

private:
    StrategySet set_;
    std::size_t workers_;
};

}  // namespace sift::strategy
