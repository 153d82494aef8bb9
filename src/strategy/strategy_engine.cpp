/// @file src/strategy/strategy_engine.cpp
/// @brief StrategyContext, registry snapshots and the isolated evaluation loop.

#include "sift/parallel.hpp"
#include "sift/strategy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <set>
#include <tuple>
#include <utility>

namespace sift::strategy {

// ─── MarketSnapshot ───────────────────────────────────────────────────────────

MarketSnapshot MarketSnapshot::from_rows(TradingDate date,
                                         std::span<const IndicatorRow> rows) {
    MarketSnapshot snap{.date = date};
    double sum = 0.0;
    std::size_t defined = 0;
    for (const auto& row : rows) {
        if (row.date != date) continue;
        ++snap.instruments;
        const auto pc = row.get("p_change");
        if (!pc) continue;
        ++defined;
        sum += *pc;
        if (*pc > 0.0)      ++snap.advancing;
        else if (*pc < 0.0) ++snap.declining;
    }
    if (defined > 0) {
        snap.mean_p_change = sum / static_cast<double>(defined);
    }
    return snap;
}

// ─── StrategyContext ──────────────────────────────────────────────────────────

StrategyContext::StrategyContext(const Instrument& instrument,
                                 std::span<const Bar> bars,
                                 std::span<const IndicatorRow> rows,
                                 const MarketSnapshot& market) noexcept
    : instrument_(&instrument)
    , bars_(bars)
    , rows_(rows.size() > bars.size() ? rows.last(bars.size()) : rows)
    , market_(&market) {}

TradingDate StrategyContext::date() const noexcept {
    return bars_.empty() ? market_->date : bars_.back().date;
}

IndicatorValue StrategyContext::indicator(std::string_view name, std::size_t i) const {
    if (i >= bars_.size()) return std::nullopt;
    const std::size_t offset = bars_.size() - rows_.size();
    if (i < offset) return std::nullopt;
    return rows_[i - offset].get(name);
}

IndicatorValue StrategyContext::indicator(std::string_view name) const {
    if (bars_.empty()) return std::nullopt;
    return indicator(name, bars_.size() - 1);
}

StrategyContext StrategyContext::as_of(std::size_t i) const noexcept {
    const std::size_t keep = std::min(i + 1, bars_.size());
    const std::size_t drop = bars_.size() - keep;
    const auto rows = drop >= rows_.size() ? std::span<const IndicatorRow>{}
                                           : rows_.first(rows_.size() - drop);
    return StrategyContext(*instrument_, bars_.first(keep), rows, *market_);
}

// ─── Strategy ─────────────────────────────────────────────────────────────────

bool Strategy::eligible(const StrategyContext& ctx) const {
    if (ctx.instrument().status != ListingStatus::Active) return false;
    if (ctx.bars().size() < std::max<std::size_t>(1, lookback())) return false;
    for (const auto& name : required_indicators()) {
        if (!ctx.indicator(name)) return false;
    }
    return true;
}

// ─── StrategySet / StrategyRegistry ───────────────────────────────────────────

StrategySet::StrategySet(std::vector<StrategyPtr> items)
    : items_(std::move(items)) {
    std::sort(items_.begin(), items_.end(),
              [](const StrategyPtr& a, const StrategyPtr& b) { return a->name() < b->name(); });
}

const Strategy* StrategySet::find(std::string_view name) const noexcept {
    for (const auto& s : items_) {
        if (s->name() == name) return s.get();
    }
    return nullptr;
}

std::vector<std::string> StrategySet::names() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& s : items_) out.emplace_back(s->name());
    return out;
}

std::size_t StrategySet::max_lookback() const noexcept {
    std::size_t n = 0;
    for (const auto& s : items_) n = std::max(n, s->lookback());
    return n;
}

bool StrategyRegistry::add(StrategyPtr strategy) {
    if (!strategy || strategy->name().empty()) {
        spdlog::warn("rejected invalid strategy registration");
        return false;
    }
    if (contains(strategy->name())) {
        spdlog::warn("rejected duplicate strategy '{}'", strategy->name());
        return false;
    }
    items_.push_back(std::move(strategy));
    return true;
}

bool StrategyRegistry::contains(std::string_view name) const noexcept {
    return std::any_of(items_.begin(), items_.end(),
                       [name](const StrategyPtr& s) { return s->name() == name; });
}

StrategySet StrategyRegistry::snapshot() const {
    return StrategySet(items_);
}

std::optional<StrategySet>
StrategyRegistry::snapshot(std::span<const std::string> allow) const {
    const std::set<std::string, std::less<>> wanted(allow.begin(), allow.end());
    std::vector<StrategyPtr> picked;
    for (const auto& s : items_) {
        if (wanted.contains(s->name())) picked.push_back(s);
    }
    if (picked.size() != wanted.size()) {
        for (const auto& name : wanted) {
            if (!contains(name)) spdlog::error("unknown strategy '{}'", name);
        }
        return std::nullopt;
    }
    return StrategySet(std::move(picked));
}

StrategySet builtin_strategy_set() {
    StrategyRegistry registry;
    register_builtin_strategies(registry);
    return registry.snapshot();
}

// ─── StrategyEngine ───────────────────────────────────────────────────────────

StrategyEngine::StrategyEngine(StrategySet set, std::size_t workers)
    : set_(std::move(set))
    , workers_(workers) {}

EvaluationReport StrategyEngine::evaluate(TradingDate date,
                                          std::span<const StrategyInput> inputs,
                                          const MarketSnapshot& market) const {
    const auto strategies = set_.strategies();
    const std::size_t pairs = strategies.size() * inputs.size();

    std::vector<std::optional<StrategyResult>>  matched(pairs);
    std::vector<std::optional<StrategyFailure>> failed(pairs);
    std::atomic<std::size_t> evaluated{0};

    core::parallel_for(pairs, workers_, [&](std::size_t k) {
        const Strategy&      strategy = *strategies[k / inputs.size()];
        const StrategyInput& input    = inputs[k % inputs.size()];

        // Only instruments with a bar on the evaluation date take part.
        if (input.bars.empty() || input.bars.back().date != date) return;

        const StrategyContext ctx(input.instrument, input.bars, input.rows, market);
        std::string message;
        try {
            if (!strategy.eligible(ctx)) return;
            evaluated.fetch_add(1, std::memory_order_relaxed);
            if (auto m = strategy.evaluate(ctx)) {
                matched[k] = StrategyResult{
                    .strategy = std::string(strategy.name()),
                    .code     = input.instrument.code,
                    .date     = date,
                    .score    = m->score,
                    .params   = std::move(m->params),
                };
            }
            return;
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }

        spdlog::error("strategy '{}' failed on {} for {}: {}", strategy.name(),
                      input.instrument.code, date.to_string(), message);
        failed[k] = StrategyFailure{
            .strategy = std::string(strategy.name()),
            .code     = input.instrument.code,
            .message  = std::move(message),
        };
    });

    EvaluationReport report;
    report.evaluated = evaluated.load();
    for (auto& r : matched) {
        if (r) report.results.push_back(std::move(*r));
    }
    for (auto& f : failed) {
        if (f) report.failures.push_back(std::move(*f));
    }

    std::sort(report.results.begin(), report.results.end(),
              [](const StrategyResult& a, const StrategyResult& b) {
                  return std::tie(a.strategy, a.code) < std::tie(b.strategy, b.code);
              });
    std::sort(report.failures.begin(), report.failures.end(),
              [](const StrategyFailure& a, const StrategyFailure& b) {
                  return std::tie(a.strategy, a.code) < std::tie(b.strategy, b.code);
              });

    spdlog::info("evaluated {}: {} strategies, {} eligible pairs, {} matches, {} failures",
                 date.to_string(), strategies.size(), report.evaluated,
                 report.results.size(), report.failures.size());
    return report;
}

}  // namespace sift::strategy
