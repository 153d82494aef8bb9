#pragma once

/// @file include/sift/orchestrator.hpp
/// @brief Job Orchestrator: drives one or many trading dates through the
///        pipeline.
///
/// # Module: Job Orchestrator
///
/// ## Responsibility
/// For each trading date D:
///   fetch universe → load history before D → indicator rows →
///   strategy evaluation → one atomic `Store::commit`
///
/// ## Usage
/// ```cpp
/// Orchestrator orch(fetcher, IndicatorEngine(builtin_indicator_set()),
///                   StrategyEngine(builtin_strategy_set()), store);
/// auto report = orch.run(dates, universe, stop.get_token());
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Guarantees
/// - Stages of one date run in order; dates are computed and committed in
///   ascending order even when later dates are prefetched
/// - History is read strictly before D, so re-running D never sees its own
///   previous output
/// - A failed date never aborts a range; every date appears in the report
/// - Cancellation is honoured between dates only

#include "sift/constants.hpp"
#include "sift/fetcher.hpp"
#include "sift/indicators.hpp"
#include "sift/store.hpp"
#include "sift/strategy.hpp"
#include "sift/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sift::engine {

// ─── DateState ────────────────────────────────────────────────────────────────

enum class DateState {
    Pending,
    Fetching,
    Computing,
    Evaluating,
    Committed,  ///< Terminal
    Failed,     ///< Terminal; `DateOutcome::cause` says why
    Cancelled,  ///< Terminal; never started
};

[[nodiscard]] std::string_view to_string(DateState s) noexcept;

[[nodiscard]] constexpr bool is_terminal(DateState s) noexcept {
    return s == DateState::Committed || s == DateState::Failed || s == DateState::Cancelled;
}

// ─── DateOutcome ──────────────────────────────────────────────────────────────

struct DateOutcome {
    TradingDate                       date;
    DateState                         state = DateState::Pending;
    std::optional<OrchestrationError> cause;
    std::string                       detail;

    // Fetch stage
    std::size_t fetched      = 0;
    std::size_t not_found    = 0;
    std::size_t rate_limited = 0;
    std::size_t transient    = 0;
    std::size_t malformed    = 0;

    // Compute / evaluate / commit
    std::size_t indicator_rows    = 0;
    std::size_t results           = 0;
    std::size_t strategy_failures = 0;
    int         commit_attempts   = 0;

    /// One line, e.g. "2024-03-15 Committed fetched=497 not_found=3 …".
    [[nodiscard]] std::string to_string() const;
};

// ─── RunReport ────────────────────────────────────────────────────────────────

struct RunReport {
    std::vector<DateOutcome> outcomes;  ///< In requested date order

    [[nodiscard]] std::size_t count(DateState s) const noexcept;
    [[nodiscard]] std::size_t committed() const noexcept { return count(DateState::Committed); }
    [[nodiscard]] std::size_t failed() const noexcept { return count(DateState::Failed); }
    [[nodiscard]] std::size_t cancelled() const noexcept { return count(DateState::Cancelled); }
    [[nodiscard]] bool any_failed() const noexcept { return failed() > 0; }

    /// 0 when no date failed, 1 otherwise.
    [[nodiscard]] int exit_code() const noexcept { return any_failed() ? 1 : 0; }

    /// Multi-line summary: one line per date plus a totals line.
    [[nodiscard]] std::string to_string() const;
};

// ─── OrchestratorConfig ───────────────────────────────────────────────────────

struct OrchestratorConfig {
    /// Stored bars loaded per instrument before D.
    std::size_t history_bars = constants::DEFAULT_HISTORY_BARS;

    /// Indicator rows handed to strategies per instrument.
    std::size_t strategy_rows = constants::DEFAULT_STRATEGY_ROWS;

    /// Workers for the per-instrument compute stage.
    std::size_t compute_workers = constants::DEFAULT_COMPUTE_WORKERS;

    /// Future dates fetched ahead of the one being computed. 0 disables.
    std::size_t prefetch_dates = 1;

    /// Total commit attempts when the store reports `Unavailable`.
    int commit_attempts = constants::DEFAULT_COMMIT_ATTEMPTS;

    std::chrono::milliseconds commit_retry_delay = constants::DEFAULT_COMMIT_RETRY_DELAY;

    /// Fail the date instead of committing an empty partition when nothing
    /// could be fetched because of throttling, transport faults or payloads
    /// that are not bar CSV.
    bool abort_on_total_outage = true;
};

/// Called on every state transition of a date.
using Observer = std::function<void(TradingDate, DateState)>;

// ─── Orchestrator ─────────────────────────────────────────────────────────────

class Orchestrator {
public:
    Orchestrator(const fetch::Fetcher& fetcher,
                 indicator::IndicatorEngine indicators,
                 strategy::StrategyEngine strategies,
                 store::Store& store,
                 OrchestratorConfig config = OrchestratorConfig{},
                 fetch::Sleeper sleeper = fetch::real_sleeper());

    void set_observer(Observer observer) { observer_ = std::move(observer); }

    /// Run one date to a terminal state.
    [[nodiscard]] DateOutcome run_date(TradingDate date,
                                       std::span<const Instrument> universe) const;

    /// Run every date of `dates` in the given order.
    ///
    /// # Returns
    /// One outcome per date. Dates not started when `stop` is requested are
    /// reported `Cancelled`.
    [[nodiscard]] RunReport run(std::span<const TradingDate> dates,
                                std::span<const Instrument> universe,
                                std::stop_token stop = {}) const;

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    /// Everything after the fetch stage; leaves `outcome` terminal.
    void process(DateOutcome& outcome, std::span<const Instrument> universe,
                 const fetch::FetchReport& fetched) const;

    void transition(DateOutcome& outcome, DateState next) const;
    void fail(DateOutcome& outcome, OrchestrationError cause, std::string detail) const;

    const fetch::Fetcher&      fetcher_;
    indicator::IndicatorEngine indicators_;
    strategy::StrategyEngine   strategies_;
    store::Store&              store_;
    OrchestratorConfig         config_;
    fetch::Sleeper             sleeper_;
    Observer                   observer_;
};

}  // namespace sift::engine
