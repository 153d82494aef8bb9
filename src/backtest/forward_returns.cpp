/// @file src/backtest/forward_returns.cpp
/// @brief Forward return computation over stored bars.

#include "sift/forward_returns.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>

namespace sift::backtest {

std::size_t ForwardReturns::observed() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(rates.begin(), rates.end(), [](const IndicatorValue& v) { return v.has_value(); }));
}

std::vector<IndicatorValue>
cumulative_rates(std::span<const Bar> from_entry, std::size_t horizon) {
    std::vector<IndicatorValue> rates(horizon);
    if (from_entry.empty()) return rates;

    const double entry = from_entry.front().close;
    if (!(entry > constants::FLOAT_EPSILON)) return rates;

    const std::size_t available = std::min(horizon, from_entry.size() - 1);
    for (std::size_t k = 1; k <= available; ++k) {
        const double pct = 100.0 * (from_entry[k].close - entry) / entry;
        if (std::isfinite(pct)) rates[k - 1] = std::round(pct * 100.0) / 100.0;
    }
    return rates;
}

store::StoreResult<std::vector<ForwardReturns>>
forward_returns(const store::Store& store, TradingDate date, std::size_t horizon,
                const std::optional<std::string>& strategy) {
    auto results = store.get_strategy_results(date, strategy);
    if (auto* f = std::get_if<store::StoreFailure>(&results)) return *f;
    const auto& matches = std::get<std::vector<StrategyResult>>(results);

    std::vector<ForwardReturns> out;
    if (matches.empty()) return out;

    auto dates = store.committed_dates();
    if (auto* f = std::get_if<store::StoreFailure>(&dates)) return *f;
    const auto& committed = std::get<std::vector<TradingDate>>(dates);
    const DateRange window{.first = date,
                           .last  = committed.empty() ? date : std::max(date, committed.back())};

    // Several strategies often match the same instrument.
    std::map<std::string, std::vector<Bar>, std::less<>> bars_by_code;
    out.reserve(matches.size());

    for (const auto& m : matches) {
        auto it = bars_by_code.find(m.code);
        if (it == bars_by_code.end()) {
            auto bars = store.get_bars(m.code, window);
            if (auto* f = std::get_if<store::StoreFailure>(&bars)) return *f;
            auto& list = std::get<std::vector<Bar>>(bars);
            if (list.size() > horizon + 1) list.resize(horizon + 1);
            it = bars_by_code.emplace(m.code, std::move(list)).first;
        }

        const auto& series = it->second;
        const bool has_entry = !series.empty() && series.front().date == date;
        if (!has_entry) {
            spdlog::warn("no stored bar for {} on {}; forward returns undefined",
                         m.code, date.to_string());
        }
        out.push_back(ForwardReturns{
            .strategy    = m.strategy,
            .code        = m.code,
            .date        = date,
            .entry_close = has_entry ? IndicatorValue{series.front().close} : std::nullopt,
            .rates       = has_entry ? cumulative_rates(series, horizon)
                                     : std::vector<IndicatorValue>(horizon),
        });
    }
    return out;
}

}  // namespace sift::backtest
