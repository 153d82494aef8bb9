/// @file src/indicator/candlestick_patterns.cpp
/// @brief Candlestick pattern indicators.
///
/// Each pattern reads the last one to three candles of its window and
/// returns +100 (bullish), -100 (bearish) or 0 (no pattern). A candle with
/// zero range never forms a pattern. Windows longer than the pattern itself
/// carry the preceding trend that single-candle reversals require.

#include "sift/constants.hpp"
#include "sift/indicators.hpp"

#include <algorithm>
#include <cmath>

namespace sift::indicator {

namespace {

using constants::FLOAT_EPSILON;

constexpr double BULLISH = 100.0;
constexpr double BEARISH = -100.0;
constexpr double NONE    = 0.0;

/// Body at most this fraction of the range is a doji.
constexpr double DOJI_BODY = 0.1;
/// Body at most this fraction of the range is a small (star, spinning) body.
constexpr double SMALL_BODY = 0.3;
/// Body at least this fraction of the range is a long candle.
constexpr double LONG_BODY = 0.5;

/// Bars before the current one used to judge the preceding trend.
constexpr std::size_t TREND_BARS = 5;

struct Candle {
    double open;
    double high;
    double low;
    double close;

    explicit Candle(const Bar& b) : open(b.open), high(b.high), low(b.low), close(b.close) {}

    [[nodiscard]] double range() const noexcept { return high - low; }
    [[nodiscard]] double body() const noexcept { return std::abs(close - open); }
    [[nodiscard]] double body_top() const noexcept { return std::max(open, close); }
    [[nodiscard]] double body_bottom() const noexcept { return std::min(open, close); }
    [[nodiscard]] double body_mid() const noexcept { return 0.5 * (open + close); }
    [[nodiscard]] double upper_shadow() const noexcept { return high - body_top(); }
    [[nodiscard]] double lower_shadow() const noexcept { return body_bottom() - low; }
    [[nodiscard]] bool bullish() const noexcept { return close > open; }
    [[nodiscard]] bool bearish() const noexcept { return close < open; }
    [[nodiscard]] bool flat() const noexcept { return range() < FLOAT_EPSILON; }
    [[nodiscard]] bool long_body() const noexcept {
        return !flat() && body() >= LONG_BODY * range();
    }
};

Candle nth_last(std::span<const Bar> w, std::size_t k) {
    return Candle(w[w.size() - 1 - k]);
}

/// Close of the bar before the current one against the close TREND_BARS
/// earlier: negative for a falling market, positive for a rising one.
double prior_trend(std::span<const Bar> w) {
    return w[w.size() - 2].close - w[w.size() - 2 - (TREND_BARS - 1)].close;
}

/// Small body with a lower shadow at least twice the body and almost no
/// upper shadow.
bool hammer_shape(const Candle& c) {
    if (c.flat()) return false;
    return c.body() <= SMALL_BODY * c.range() &&
           c.lower_shadow() >= 2.0 * c.body() &&
           c.upper_shadow() <= DOJI_BODY * c.range();
}

// ─── Single candle ────────────────────────────────────────────────────────────

IndicatorValue doji(std::span<const Bar> w) {
    const Candle c = nth_last(w, 0);
    if (c.flat()) return NONE;
    return c.body() <= DOJI_BODY * c.range() ? BULLISH : NONE;
}

IndicatorValue spinning_top(std::span<const Bar> w) {
    const Candle c = nth_last(w, 0);
    if (c.flat()) return NONE;
    const bool shape = c.body() > DOJI_BODY * c.range() &&
                       c.body() <= SMALL_BODY * c.range() &&
                       c.upper_shadow() > c.body() && c.lower_shadow() > c.body();
    if (!shape) return NONE;
    return c.close >= c.open ? BULLISH : BEARISH;
}

IndicatorValue hammer(std::span<const Bar> w) {
    return hammer_shape(nth_last(w, 0)) && prior_trend(w) < 0.0 ? BULLISH : NONE;
}

IndicatorValue hanging_man(std::span<const Bar> w) {
    return hammer_shape(nth_last(w, 0)) && prior_trend(w) > 0.0 ? BEARISH : NONE;
}

// ─── Two candles ──────────────────────────────────────────────────────────────

IndicatorValue engulfing(std::span<const Bar> w) {
    const Candle prev = nth_last(w, 1);
    const Candle cur  = nth_last(w, 0);
    if (cur.body() <= prev.body()) return NONE;
    if (prev.bearish() && cur.bullish() &&
        cur.open <= prev.close && cur.close >= prev.open) {
        return BULLISH;
    }
    if (prev.bullish() && cur.bearish() &&
        cur.open >= prev.close && cur.close <= prev.open) {
        return BEARISH;
    }
    return NONE;
}

IndicatorValue piercing(std::span<const Bar> w) {
    const Candle prev = nth_last(w, 1);
    const Candle cur  = nth_last(w, 0);
    const bool hit = prev.bearish() && prev.long_body() && cur.bullish() &&
                     cur.open < prev.low &&
                     cur.close > prev.body_mid() && cur.close < prev.open;
    return hit ? BULLISH : NONE;
}

IndicatorValue dark_cloud_cover(std::span<const Bar> w) {
    const Candle prev = nth_last(w, 1);
    const Candle cur  = nth_last(w, 0);
    const bool hit = prev.bullish() && prev.long_body() && cur.bearish() &&
                     cur.open > prev.high &&
                     cur.close < prev.body_mid() && cur.close > prev.open;
    return hit ? BEARISH : NONE;
}

// ─── Three candles ────────────────────────────────────────────────────────────

IndicatorValue morning_star(std::span<const Bar> w) {
    const Candle first  = nth_last(w, 2);
    const Candle star   = nth_last(w, 1);
    const Candle third  = nth_last(w, 0);
    const bool hit = first.bearish() && first.long_body() &&
                     star.body() <= SMALL_BODY * first.body() &&
                     star.body_top() < first.close &&
                     third.bullish() && third.close > first.body_mid();
    return hit ? BULLISH : NONE;
}

IndicatorValue evening_star(std::span<const Bar> w) {
    const Candle first  = nth_last(w, 2);
    const Candle star   = nth_last(w, 1);
    const Candle third  = nth_last(w, 0);
    const bool hit = first.bullish() && first.long_body() &&
                     star.body() <= SMALL_BODY * first.body() &&
                     star.body_bottom() > first.close &&
                     third.bearish() && third.close < first.body_mid();
    return hit ? BEARISH : NONE;
}

IndicatorValue three_white_soldiers(std::span<const Bar> w) {
    for (std::size_t k = 0; k < 3; ++k) {
        const Candle c = nth_last(w, k);
        if (!c.bullish() || !c.long_body() || c.upper_shadow() > LONG_BODY * c.body()) {
            return NONE;
        }
    }
    for (std::size_t k = 0; k < 2; ++k) {
        const Candle cur  = nth_last(w, k);
        const Candle prev = nth_last(w, k + 1);
        if (!(cur.close > prev.close) || cur.open < prev.open || cur.open > prev.close) {
            return NONE;
        }
    }
    return BULLISH;
}

IndicatorValue three_black_crows(std::span<const Bar> w) {
    for (std::size_t k = 0; k < 3; ++k) {
        const Candle c = nth_last(w, k);
        if (!c.bearish() || !c.long_body() || c.lower_shadow() > LONG_BODY * c.body()) {
            return NONE;
        }
    }
    for (std::size_t k = 0; k < 2; ++k) {
        const Candle cur  = nth_last(w, k);
        const Candle prev = nth_last(w, k + 1);
        if (!(cur.close < prev.close) || cur.open > prev.open || cur.open < prev.close) {
            return NONE;
        }
    }
    return BEARISH;
}

}  // namespace

void register_candlestick_patterns(IndicatorRegistry& registry) {
    registry.add(make_indicator("cdl_doji", 1, doji));
    registry.add(make_indicator("cdl_spinning_top", 1, spinning_top));
    registry.add(make_indicator("cdl_hammer", TREND_BARS + 1, hammer));
    registry.add(make_indicator("cdl_hanging_man", TREND_BARS + 1, hanging_man));
    registry.add(make_indicator("cdl_engulfing", 2, engulfing));
    registry.add(make_indicator("cdl_piercing", 2, piercing));
    registry.add(make_indicator("cdl_dark_cloud_cover", 2, dark_cloud_cover));
    registry.add(make_indicator("cdl_morning_star", 3, morning_star));
    registry.add(make_indicator("cdl_evening_star", 3, evening_star));
    registry.add(make_indicator("cdl_three_white_soldiers", 3, three_white_soldiers));
    registry.add(make_indicator("cdl_three_black_crows", 3, three_black_crows));
}

}  // namespace sift::indicator
