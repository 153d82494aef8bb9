/// @file src/strategy/builtin_strategies.cpp
/// @brief Predicates of the built-in strategies.
///
/// Index convention: `bars[n - 1]` is the evaluation date D; a "window of
/// the last k bars" is bars[n - k, n).

#include "sift/strategies.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

namespace sift::strategy {

namespace {

/// close[end] is the highest close of the `window` bars ending at `end`.
bool is_new_high(std::span<const Bar> bars, std::size_t end, std::size_t window) {
    if (window == 0 || end + 1 < window) return false;
    const double close = bars[end].close;
    for (std::size_t i = end + 1 - window; i < end; ++i) {
        if (bars[i].close > close) return false;
    }
    return true;
}

/// volume on D divided by vol_ma5 of the previous bar.
std::optional<double> volume_ratio(const StrategyContext& ctx) {
    const auto bars = ctx.bars();
    if (bars.size() < 2) return std::nullopt;
    const auto prev_ma = ctx.indicator("vol_ma5", bars.size() - 2);
    if (!prev_ma || !(*prev_ma > 0.0)) return std::nullopt;
    return bars.back().volume / *prev_ma;
}

/// Shared volume-surge predicate; also used on earlier days by
/// BreakthroughPlatform.
std::optional<Match> surge_match(const StrategyContext& ctx, std::size_t threshold,
                                 double min_pct, double min_amount, double min_ratio) {
    const auto bars = ctx.bars();
    if (bars.size() < threshold + 1) return std::nullopt;

    const Bar& d = bars.back();
    const auto pc = ctx.indicator("p_change");
    if (!pc || *pc < min_pct || d.close < d.open) return std::nullopt;
    if (d.amount < min_amount) return std::nullopt;

    const auto ratio = volume_ratio(ctx);
    if (!ratio || *ratio < min_ratio) return std::nullopt;

    return Match{.score = *ratio,
                 .params = {{"p_change", *pc}, {"amount", d.amount}, {"vol_ratio", *ratio}}};
}

}  // namespace

// ─── TurtleTrade ──────────────────────────────────────────────────────────────

std::optional<Match> TurtleTrade::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (n == 0) return std::nullopt;
    if (!is_new_high(bars, n - 1, window_)) return std::nullopt;

    double prior_high = bars.back().close;
    if (window_ > 1) {
        prior_high = bars[n - window_].close;
        for (std::size_t i = n - window_; i + 1 < n; ++i) {
            prior_high = std::max(prior_high, bars[i].close);
        }
    }
    return Match{.score = prior_high > 0.0 ? bars.back().close / prior_high : 1.0,
                 .params = {{"close", bars.back().close}, {"prior_high", prior_high}}};
}

// ─── VolumeSurge ──────────────────────────────────────────────────────────────

bool VolumeSurge::eligible(const StrategyContext& ctx) const {
    return Strategy::eligible(ctx) && ctx.bars().back().amount >= min_amount_;
}

std::optional<Match> VolumeSurge::evaluate(const StrategyContext& ctx) const {
    return surge_match(ctx, threshold_, min_pct_, min_amount_, min_ratio_);
}

// ─── BreakthroughPlatform ─────────────────────────────────────────────────────

std::optional<Match> BreakthroughPlatform::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (threshold_ == 0 || n < threshold_) return std::nullopt;
    const std::size_t first = n - threshold_;

    std::optional<std::size_t> breakout;
    for (std::size_t i = first; i < n; ++i) {
        const auto ma60 = ctx.indicator("ma60", i);
        if (!ma60) continue;
        if (!(bars[i].open < *ma60 && *ma60 <= bars[i].close)) continue;
        if (surge_match(ctx.as_of(i), threshold_, 2.0, constants::MIN_LIQUID_AMOUNT, 2.0)) {
            breakout = i;
            break;
        }
    }
    if (!breakout) return std::nullopt;

    // The platform before the breakout hugs ma60.
    for (std::size_t i = first; i < *breakout; ++i) {
        const auto ma60 = ctx.indicator("ma60", i);
        if (!ma60 || !(*ma60 > 0.0)) continue;
        const double dev = (*ma60 - bars[i].close) / *ma60;
        if (!(-0.05 < dev && dev < 0.2)) return std::nullopt;
    }

    const double ma60_break = ctx.indicator("ma60", *breakout).value_or(0.0);
    return Match{.score = static_cast<double>(n - 1 - *breakout),
                 .params = {{"breakout_close", bars[*breakout].close},
                            {"breakout_ma60", ma60_break},
                            {"days_since", static_cast<double>(n - 1 - *breakout)}}};
}

// ─── BacktraceMa250 ───────────────────────────────────────────────────────────

std::optional<Match> BacktraceMa250::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (n == 0) return std::nullopt;
    const std::size_t first = n - std::min(threshold_, n);
    auto ma250 = [&](std::size_t i) { return ctx.indicator("ma250", i).value_or(0.0); };

    // Highest close of the window; the segment before it must cross ma250
    // upward and the segment from it on must stay above ma250.
    std::size_t high = first;
    for (std::size_t i = first; i < n; ++i) {
        if (bars[i].close > bars[high].close) high = i;
    }
    if (high == first) return std::nullopt;
    if (!(bars[first].close < ma250(first) && bars[high - 1].close > ma250(high - 1))) {
        return std::nullopt;
    }

    std::size_t low = high;
    for (std::size_t i = high; i < n; ++i) {
        if (bars[i].close < ma250(i)) return std::nullopt;
        if (bars[i].close < bars[low].close) low = i;
    }

    const auto days = bars[low].date.days - bars[high].date.days;
    if (days < 10 || days > 50) return std::nullopt;
    if (!(bars[low].volume > 0.0) || !(bars[high].volume > 0.0)) return std::nullopt;

    const double vol_ratio  = bars[high].volume / bars[low].volume;
    const double back_ratio = bars[low].close / bars[high].close;
    if (!(vol_ratio > 2.0 && back_ratio < 0.8)) return std::nullopt;

    return Match{.score = vol_ratio,
                 .params = {{"high_close", bars[high].close},
                            {"low_close", bars[low].close},
                            {"vol_ratio", vol_ratio},
                            {"back_ratio", back_ratio},
                            {"pullback_days", static_cast<double>(days)}}};
}

// ─── KeepIncreasing ───────────────────────────────────────────────────────────

std::optional<Match> KeepIncreasing::evaluate(const StrategyContext& ctx) const {
    const std::size_t n = ctx.bars().size();
    if (threshold_ == 0 || n < threshold_) return std::nullopt;
    const std::size_t first = n - threshold_;
    const std::size_t step1 = static_cast<std::size_t>(std::lround(threshold_ / 3.0));
    const std::size_t step2 = static_cast<std::size_t>(std::lround(threshold_ * 2.0 / 3.0));

    const auto a = ctx.indicator("ma30", first);
    const auto b = ctx.indicator("ma30", first + step1);
    const auto c = ctx.indicator("ma30", first + step2);
    const auto d = ctx.indicator("ma30", n - 1);
    if (!a || !b || !c || !d) return std::nullopt;

    if (!(*a < *b && *b < *c && *c < *d && *d > min_growth_ * *a)) return std::nullopt;

    return Match{.score = *d / *a,
                 .params = {{"ma30_start", *a}, {"ma30_end", *d}}};
}

// ─── ParkingApron ─────────────────────────────────────────────────────────────

std::optional<Match> ParkingApron::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (threshold_ == 0 || n < threshold_) return std::nullopt;
    const std::size_t first = n - threshold_;

    auto tight = [](const Bar& b) {
        if (!(b.open > 0.0)) return false;
        const double r = b.close / b.open;
        return 0.97 < r && r < 1.03;
    };

    for (std::size_t j = first; j + 3 < n; ++j) {
        const auto pc = ctx.indicator("p_change", j);
        if (!pc || !(*pc > limit_pct_)) continue;
        if (!is_new_high(bars, j, threshold_)) continue;

        const double limit_close = bars[j].close;
        bool consolidated = true;
        for (std::size_t k = j + 1; k <= j + 3; ++k) {
            const Bar& b = bars[k];
            if (!(tight(b) && b.close > limit_close && b.open > limit_close)) {
                consolidated = false;
                break;
            }
            if (k > j + 1) {
                const auto day_pc = ctx.indicator("p_change", k);
                if (!day_pc || !(-5.0 < *day_pc && *day_pc < 5.0)) {
                    consolidated = false;
                    break;
                }
            }
        }
        if (consolidated) {
            return Match{.score = *pc,
                         .params = {{"limit_up_close", limit_close},
                                    {"limit_up_p_change", *pc},
                                    {"days_since", static_cast<double>(n - 1 - j)}}};
        }
    }
    return std::nullopt;
}

// ─── LowAtrGrowth ─────────────────────────────────────────────────────────────

std::optional<Match> LowAtrGrowth::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (threshold_ == 0 || n < threshold_) return std::nullopt;

    double total_move = 0.0;
    double lo = bars[n - threshold_].close;
    double hi = lo;
    for (std::size_t i = n - threshold_; i < n; ++i) {
        total_move += std::abs(ctx.indicator("p_change", i).value_or(0.0));
        lo = std::min(lo, bars[i].close);
        hi = std::max(hi, bars[i].close);
    }

    const double mean_move = total_move / static_cast<double>(threshold_);
    if (mean_move > max_mean_move_) return std::nullopt;
    if (!(lo > 0.0)) return std::nullopt;

    const double range = (hi - lo) / lo;
    if (!(range > min_range_)) return std::nullopt;

    return Match{.score = range,
                 .params = {{"mean_move", mean_move}, {"range", range}}};
}

// ─── LowBacktraceIncrease ─────────────────────────────────────────────────────

std::optional<Match> LowBacktraceIncrease::evaluate(const StrategyContext& ctx) const {
    const auto bars = ctx.bars();
    const std::size_t n = bars.size();
    if (threshold_ == 0 || n < threshold_) return std::nullopt;
    const std::size_t first = n - threshold_;

    const double start = bars[first].close;
    if (!(start > 0.0)) return std::nullopt;
    const double rise = (bars.back().close - start) / start;
    if (rise < min_rise_) return std::nullopt;

    double prev_pc = 100.0;
    std::optional<double> prev_open;
    for (std::size_t i = first; i < n; ++i) {
        const Bar& b = bars[i];
        if (!(b.open > 0.0)) return std::nullopt;
        const double pc = ctx.indicator("p_change", i).value_or(0.0);

        if (pc < -7.0) return std::nullopt;
        if ((b.close - b.open) / b.open * 100.0 < -7.0) return std::nullopt;
        if (prev_pc + pc < -10.0) return std::nullopt;
        if (prev_open && (b.close - *prev_open) / *prev_open * 100.0 < -10.0) {
            return std::nullopt;
        }
        prev_pc = pc;
        prev_open = b.open;
    }

    return Match{.score = 100.0 * rise, .params = {{"rise_pct", 100.0 * rise}}};
}

// ─── ClimaxLimitdown ──────────────────────────────────────────────────────────

bool ClimaxLimitdown::eligible(const StrategyContext& ctx) const {
    return Strategy::eligible(ctx) && ctx.bars().back().amount >= min_amount_;
}

std::optional<Match> ClimaxLimitdown::evaluate(const StrategyContext& ctx) const {
    const auto pc = ctx.indicator("p_change");
    if (!pc || *pc > -limit_pct_) return std::nullopt;
    if (ctx.bars().back().amount < min_amount_) return std::nullopt;

    const auto ratio = volume_ratio(ctx);
    if (!ratio || *ratio < min_ratio_) return std::nullopt;

    return Match{.score = *ratio,
                 .params = {{"p_change", *pc},
                            {"amount", ctx.bars().back().amount},
                            {"vol_ratio", *ratio}}};
}

// ─── IndicatorThreshold ───────────────────────────────────────────────────────

IndicatorThreshold::IndicatorThreshold(std::string name, std::vector<Condition> conditions)
    : name_(std::move(name))
    , conditions_(std::move(conditions)) {}

std::vector<std::string> IndicatorThreshold::required_indicators() const {
    std::vector<std::string> out;
    out.reserve(conditions_.size());
    for (const auto& c : conditions_) out.push_back(c.indicator);
    return out;
}

std::optional<Match> IndicatorThreshold::evaluate(const StrategyContext& ctx) const {
    Match match;
    for (const auto& c : conditions_) {
        const auto v = ctx.indicator(c.indicator);
        if (!v) return std::nullopt;
        const bool ok = c.op == Op::AtLeast ? *v >= c.value : *v < c.value;
        if (!ok) return std::nullopt;
        match.params.insert_or_assign(c.indicator, *v);
    }
    if (!conditions_.empty()) {
        match.score = match.params.find(conditions_.front().indicator)->second;
    }
    return match;
}

IndicatorThreshold IndicatorThreshold::buy_signal() {
    return IndicatorThreshold("indicator_buy", {
        {"kdj_k", Op::AtLeast, 80.0},  {"kdj_d", Op::AtLeast, 70.0},
        {"kdj_j", Op::AtLeast, 100.0}, {"rsi_6", Op::AtLeast, 80.0},
        {"cci",   Op::AtLeast, 100.0}, {"cr",    Op::AtLeast, 300.0},
        {"wr_6",  Op::AtLeast, -20.0}, {"vr",    Op::AtLeast, 160.0},
    });
}

IndicatorThreshold IndicatorThreshold::sell_signal() {
    return IndicatorThreshold("indicator_sell", {
        {"kdj_k", Op::Below, 20.0},   {"kdj_d", Op::Below, 30.0},
        {"kdj_j", Op::Below, 10.0},   {"rsi_6", Op::Below, 20.0},
        {"cci",   Op::Below, -100.0}, {"cr",    Op::Below, 40.0},
        {"wr_6",  Op::Below, -80.0},  {"vr",    Op::Below, 40.0},
    });
}

// ─── Registration ─────────────────────────────────────────────────────────────

void register_builtin_strategies(StrategyRegistry& registry) {
    registry.add(std::make_shared<TurtleTrade>());
    registry.add(std::make_shared<VolumeSurge>());
    registry.add(std::make_shared<BreakthroughPlatform>());
    registry.add(std::make_shared<BacktraceMa250>());
    registry.add(std::make_shared<KeepIncreasing>());
    registry.add(std::make_shared<ParkingApron>());
    registry.add(std::make_shared<LowAtrGrowth>());
    registry.add(std::make_shared<LowBacktraceIncrease>());
    registry.add(std::make_shared<ClimaxLimitdown>());
    registry.add(std::make_shared<IndicatorThreshold>(IndicatorThreshold::buy_signal()));
    registry.add(std::make_shared<IndicatorThreshold>(IndicatorThreshold::sell_signal()));
}

}  // namespace sift::strategy
