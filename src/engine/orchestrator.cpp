/// @file src/engine/orchestrator.cpp
/// @brief Orchestrator implementation.

#include "sift/orchestrator.hpp"
#include "sift/parallel.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <map>

namespace sift::engine {

// ─── Reporting ────────────────────────────────────────────────────────────────

std::string_view to_string(DateState s) noexcept {
    switch (s) {
        case DateState::Pending:    return "Pending";
        case DateState::Fetching:   return "Fetching";
        case DateState::Computing:  return "Computing";
        case DateState::Evaluating: return "Evaluating";
        case DateState::Committed:  return "Committed";
        case DateState::Failed:     return "Failed";
        case DateState::Cancelled:  return "Cancelled";
    }
    return "Unknown";
}

std::string DateOutcome::to_string() const {
    std::string line = fmt::format(
        "{} {:<9} fetched={} not_found={} rate_limited={} transient={} malformed={} "
        "rows={} results={} strategy_failures={}",
        date.to_string(), engine::to_string(state), fetched, not_found, rate_limited,
        transient, malformed, indicator_rows, results, strategy_failures);
    if (cause) {
        line += fmt::format(" cause={} ({})", sift::to_string(*cause), detail);
    }
    return line;
}

std::size_t RunReport::count(DateState s) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [s](const DateOutcome& o) { return o.state == s; }));
}

std::string RunReport::to_string() const {
    std::string out;
    for (const auto& o : outcomes) {
        out += o.to_string();
        out += '\n';
    }
    out += fmt::format("dates={} committed={} failed={} cancelled={}",
                       outcomes.size(), committed(), failed(), cancelled());
    return out;
}

// ─── Orchestrator ─────────────────────────────────────────────────────────────

Orchestrator::Orchestrator(const fetch::Fetcher& fetcher,
                           indicator::IndicatorEngine indicators,
                           strategy::StrategyEngine strategies,
                           store::Store& store,
                           OrchestratorConfig config,
                           fetch::Sleeper sleeper)
    : fetcher_(fetcher),
      indicators_(std::move(indicators)),
      strategies_(std::move(strategies)),
      store_(store),
      config_(config),
      sleeper_(std::move(sleeper)) {}

void Orchestrator::transition(DateOutcome& outcome, DateState next) const {
    spdlog::info("{}: {} -> {}", outcome.date.to_string(),
                 to_string(outcome.state), to_string(next));
    outcome.state = next;
    if (observer_) observer_(outcome.date, next);
}

void Orchestrator::fail(DateOutcome& outcome, OrchestrationError cause,
                        std::string detail) const {
    spdlog::error("{}: {}: {}", outcome.date.to_string(), sift::to_string(cause), detail);
    outcome.cause  = cause;
    outcome.detail = std::move(detail);
    transition(outcome, DateState::Failed);
}

DateOutcome Orchestrator::run_date(TradingDate date,
                                   std::span<const Instrument> universe) const {
    DateOutcome outcome{.date = date};
    transition(outcome, DateState::Fetching);
    const auto fetched = fetcher_.fetch(universe, date);
    process(outcome, universe, fetched);
    return outcome;
}

RunReport Orchestrator::run(std::span<const TradingDate> dates,
                            std::span<const Instrument> universe,
                            std::stop_token stop) const {
    RunReport report;
    report.outcomes.reserve(dates.size());

    // ahead.front() is always the fetch of dates[report.outcomes.size()].
    std::deque<std::future<fetch::FetchReport>> ahead;
    std::size_t launched = 0;

    for (std::size_t i = 0; i < dates.size(); ++i) {
        if (stop.stop_requested()) {
            spdlog::warn("cancellation requested; {} date(s) not started", dates.size() - i);
            for (std::size_t k = i; k < dates.size(); ++k) {
                DateOutcome cancelled{.date = dates[k]};
                transition(cancelled, DateState::Cancelled);
                report.outcomes.push_back(std::move(cancelled));
            }
            break;
        }

        DateOutcome outcome{.date = dates[i]};
        transition(outcome, DateState::Fetching);

        while (launched < dates.size() && launched <= i + config_.prefetch_dates) {
            ahead.push_back(std::async(std::launch::async,
                                       [this, universe, date = dates[launched]] {
                                           return fetcher_.fetch(universe, date);
                                       }));
            ++launched;
        }
        const auto fetched = ahead.front().get();
        ahead.pop_front();

        process(outcome, universe, fetched);
        report.outcomes.push_back(std::move(outcome));
    }
    // Prefetches of cancelled dates are joined by the future destructors and
    // their bars discarded.

    spdlog::info("run finished: {} committed, {} failed, {} cancelled",
                 report.committed(), report.failed(), report.cancelled());
    return report;
}

void Orchestrator::process(DateOutcome& outcome, std::span<const Instrument> universe,
                           const fetch::FetchReport& fetched) const {
    const TradingDate date = outcome.date;
    const std::string day  = date.to_string();

    outcome.fetched      = fetched.success_count();
    outcome.not_found    = fetched.failure_count(FetchError::NotFound);
    outcome.rate_limited = fetched.failure_count(FetchError::RateLimited);
    outcome.transient    = fetched.failure_count(FetchError::Transient);
    outcome.malformed    = fetched.failure_count(FetchError::MalformedPayload);

    if (config_.abort_on_total_outage && !universe.empty() && outcome.fetched == 0 &&
        outcome.rate_limited + outcome.transient + outcome.malformed > 0) {
        fail(outcome, OrchestrationError::PartialDateFailure,
             fmt::format("upstream outage: no bars fetched ({} rate limited, {} transient, "
                         "{} malformed)",
                         outcome.rate_limited, outcome.transient, outcome.malformed));
        return;
    }

    // ── Computing ────────────────────────────────────────────────────────────
    transition(outcome, DateState::Computing);

    std::map<std::string_view, const Instrument*> by_code;
    for (const auto& inst : universe) by_code.emplace(inst.code, &inst);

    std::vector<Bar> bars = fetched.bars();
    std::vector<strategy::StrategyInput>       inputs(bars.size());
    std::vector<std::optional<store::StoreFailure>> read_faults(bars.size());
    std::vector<std::optional<std::string>>         compute_faults(bars.size());

    core::parallel_for(bars.size(), config_.compute_workers, [&](std::size_t i) {
        const Bar& bar = bars[i];
        try {
            auto history = store_.bar_history(bar.code, date, config_.history_bars);
            if (auto* f = std::get_if<store::StoreFailure>(&history)) {
                read_faults[i] = *f;
                return;
            }
            auto& series = std::get<std::vector<Bar>>(history);
            series.push_back(bar);

            const auto it = by_code.find(bar.code);
            auto rows = indicators_.compute_series(series, config_.strategy_rows);
            inputs[i] = strategy::StrategyInput{
                .instrument = it != by_code.end() ? *it->second : Instrument{.code = bar.code},
                .bars       = std::move(series),
                .rows       = std::move(rows),
            };
        } catch (const std::exception& e) {
            compute_faults[i] = e.what();
        } catch (...) {
            compute_faults[i] = "non-standard exception";
        }
    });

    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (read_faults[i]) {
            fail(outcome, OrchestrationError::PartialDateFailure,
                 fmt::format("history read for {} failed: {}", bars[i].code,
                             read_faults[i]->detail));
            return;
        }
        if (compute_faults[i]) {
            fail(outcome, OrchestrationError::PartialDateFailure,
                 fmt::format("computing {} failed: {}", bars[i].code, *compute_faults[i]));
            return;
        }
    }

    std::vector<IndicatorRow> day_rows;
    day_rows.reserve(inputs.size());
    for (const auto& in : inputs) {
        if (!in.rows.empty() && in.rows.back().date == date) {
            day_rows.push_back(in.rows.back());
        }
    }
    outcome.indicator_rows = day_rows.size();

    // ── Evaluating ───────────────────────────────────────────────────────────
    transition(outcome, DateState::Evaluating);

    const auto market = strategy::MarketSnapshot::from_rows(date, day_rows);
    auto evaluation   = strategies_.evaluate(date, inputs, market);
    outcome.results           = evaluation.results.size();
    outcome.strategy_failures = evaluation.failures.size();

    // ── Commit ───────────────────────────────────────────────────────────────
    const store::DateBatch batch{
        .date       = date,
        .bars       = std::move(bars),
        .indicators = std::move(day_rows),
        .results    = std::move(evaluation.results),
    };

    const int attempts = std::max(1, config_.commit_attempts);
    std::optional<store::StoreFailure> failure;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        outcome.commit_attempts = attempt;
        failure = store_.commit(batch);
        if (!failure) break;
        if (failure->error != StoreError::Unavailable || attempt == attempts) break;
        spdlog::warn("{}: commit attempt {}/{} failed: {}; retrying",
                     day, attempt, attempts, failure->detail);
        sleeper_(config_.commit_retry_delay);
    }

    if (failure) {
        fail(outcome, OrchestrationError::StoreCommitFailure,
             fmt::format("{}: {}", sift::to_string(failure->error), failure->detail));
        return;
    }
    transition(outcome, DateState::Committed);
}

}  // namespace sift::engine
