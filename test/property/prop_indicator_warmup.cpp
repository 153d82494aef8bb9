/**
 * @file  prop_indicator_warmup.cpp
 * @brief Property: an N-bar indicator is undefined on the first N−1 bars of a
 *        history and defined from the N-th bar on.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_indicator_warmup
 *
 * The moving averages never degenerate on positive prices, so the defined
 * boundary depends on the window alone. Degenerate oscillators (zero range)
 * are allowed to stay undefined, but must never be defined before warmup.
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "sift/indicators.hpp"

using namespace sift;
using namespace sift::indicator;

namespace {

std::vector<Bar> make_history(const std::vector<int>& steps) {
    std::vector<Bar> bars;
    double close = 50.0;
    const auto start = TradingDate::from_ymd(2020, 1, 1);
    for (std::size_t i = 0; i < steps.size(); ++i) {
        close = std::max(1.0, close * (1.0 + steps[i] / 1000.0));
        bars.push_back(Bar{.code = "P", .date = start.plus_days(static_cast<std::int32_t>(i)),
                           .open = close, .high = close * 1.02, .low = close * 0.98,
                           .close = close, .volume = 1000.0 + steps[i], .amount = close * 1000.0});
    }
    return bars;
}

}  // namespace

int main() {
    const IndicatorSet set = builtin_indicator_set();
    const IndicatorEngine engine(set);

    // ── Property 1: moving averages follow their window exactly ──────────────
    rc::check(
        "warmup: maN undefined before N bars, defined from N",
        [&]() {
            const auto steps = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(1, 80), rc::gen::inRange(-90, 91));
            const auto bars = make_history(steps);
            const auto rows = engine.compute_series(bars, bars.size());
            RC_ASSERT(rows.size() == bars.size());

            for (const char* name : {"ma5", "ma10", "ma20", "ma30", "ma60", "vol_ma5"}) {
                const std::size_t window = set.find(name)->window();
                for (std::size_t i = 0; i < rows.size(); ++i) {
                    RC_ASSERT(rows[i].defined(name) == (i + 1 >= window));
                }
            }
        }
    );

    // ── Property 2: no indicator is ever defined before its window ───────────
    rc::check(
        "warmup: every indicator undefined with fewer bars than its window",
        [&]() {
            const auto steps = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(1, 120), rc::gen::inRange(-90, 91));
            const auto bars = make_history(steps);
            const auto row  = engine.compute(bars);
            RC_ASSERT(row.has_value());

            for (const auto& ind : set.indicators()) {
                if (bars.size() < ind->window()) {
                    RC_ASSERT(!row->defined(ind->name()));
                }
                if (const auto v = row->get(ind->name())) {
                    RC_ASSERT(std::isfinite(*v));
                }
            }
        }
    );

    // ── Property 3: determinism ───────────────────────────────────────────────
    rc::check(
        "warmup: identical history gives identical rows",
        [&]() {
            const auto steps = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(1, 60), rc::gen::inRange(-90, 91));
            const auto bars = make_history(steps);
            RC_ASSERT(*engine.compute(bars) == *engine.compute(bars));
        }
    );

    return 0;
}
