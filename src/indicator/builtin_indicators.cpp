/// @file src/indicator/builtin_indicators.cpp
/// @brief Built-in indicator definitions.
///
/// Every function receives exactly its declared window, oldest bar first,
/// with the current bar last. Sums run in bar order so results do not
/// depend on scheduling.

#include "sift/constants.hpp"
#include "sift/indicators.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace sift::indicator {

namespace {

using constants::FLOAT_EPSILON;

[[nodiscard]] bool near_zero(double x) noexcept { return std::abs(x) < FLOAT_EPSILON; }

// ─── Moving averages ──────────────────────────────────────────────────────────

IndicatorValue mean_close(std::span<const Bar> w) {
    double sum = 0.0;
    for (const auto& b : w) sum += b.close;
    return sum / static_cast<double>(w.size());
}

IndicatorValue mean_volume(std::span<const Bar> w) {
    double sum = 0.0;
    for (const auto& b : w) sum += b.volume;
    return sum / static_cast<double>(w.size());
}

IndicatorValue p_change(std::span<const Bar> w) {
    const double prev = w[0].close;
    if (near_zero(prev)) return std::nullopt;
    return 100.0 * (w[1].close - prev) / prev;
}

// ─── MACD ─────────────────────────────────────────────────────────────────────

struct Macd {
    double dif;
    double dea;
};

/// EMA12/EMA26 seeded with the window's first close; DEA is EMA9 of DIF
/// seeded with the first DIF.
Macd macd(std::span<const Bar> w) {
    constexpr double a12 = 2.0 / 13.0;
    constexpr double a26 = 2.0 / 27.0;
    constexpr double a9  = 2.0 / 10.0;

    double ema12 = w[0].close;
    double ema26 = w[0].close;
    double dea   = 0.0;
    for (std::size_t i = 1; i < w.size(); ++i) {
        ema12 += a12 * (w[i].close - ema12);
        ema26 += a26 * (w[i].close - ema26);
        const double dif = ema12 - ema26;
        dea = i == 1 ? dif : dea + a9 * (dif - dea);
    }
    return Macd{.dif = ema12 - ema26, .dea = dea};
}

// ─── KDJ ──────────────────────────────────────────────────────────────────────

constexpr std::size_t KDJ_RSV_BARS    = 9;
constexpr std::size_t KDJ_SMOOTHING   = 30;
constexpr std::size_t KDJ_WINDOW      = KDJ_RSV_BARS - 1 + KDJ_SMOOTHING;

struct Kdj {
    double k;
    double d;
};

/// K and D smoothed with weight 1/3 from 50 over the last 30 positions.
/// A position whose 9-bar range is zero leaves K and D unchanged; a zero
/// range on the current bar makes the whole indicator undefined.
std::optional<Kdj> kdj(std::span<const Bar> w) {
    double k = 50.0;
    double d = 50.0;
    bool last_defined = false;
    for (std::size_t p = KDJ_RSV_BARS - 1; p < w.size(); ++p) {
        const auto slice = w.subspan(p + 1 - KDJ_RSV_BARS, KDJ_RSV_BARS);
        double hhv = slice[0].high;
        double llv = slice[0].low;
        for (const auto& b : slice) {
            hhv = std::max(hhv, b.high);
            llv = std::min(llv, b.low);
        }
        last_defined = !near_zero(hhv - llv);
        if (!last_defined) continue;
        const double rsv = 100.0 * (w[p].close - llv) / (hhv - llv);
        k = (2.0 * k + rsv) / 3.0;
        d = (2.0 * d + k) / 3.0;
    }
    if (!last_defined) return std::nullopt;
    return Kdj{.k = k, .d = d};
}

// ─── Oscillators ──────────────────────────────────────────────────────────────

IndicatorValue rsi(std::span<const Bar> w) {
    double gain = 0.0;
    double loss = 0.0;
    for (std::size_t i = 1; i < w.size(); ++i) {
        const double diff = w[i].close - w[i - 1].close;
        if (diff > 0.0) gain += diff;
        else            loss -= diff;
    }
    if (near_zero(gain + loss)) return 50.0;
    return 100.0 * gain / (gain + loss);
}

IndicatorValue cci(std::span<const Bar> w) {
    const std::size_t n = w.size();
    std::vector<double> tp(n);
    double mean = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        tp[i] = (w[i].high + w[i].low + w[i].close) / 3.0;
        mean += tp[i];
    }
    mean /= static_cast<double>(n);

    double dev = 0.0;
    for (std::size_t i = 0; i < n; ++i) dev += std::abs(tp[i] - mean);
    dev /= static_cast<double>(n);

    if (near_zero(dev)) return std::nullopt;
    return (tp[n - 1] - mean) / (0.015 * dev);
}

IndicatorValue cr(std::span<const Bar> w) {
    double up = 0.0;
    double down = 0.0;
    for (std::size_t i = 1; i < w.size(); ++i) {
        const double mid = (w[i - 1].high + w[i - 1].low + w[i - 1].close) / 3.0;
        up   += std::max(0.0, w[i].high - mid);
        down += std::max(0.0, mid - w[i].low);
    }
    if (near_zero(down)) return std::nullopt;
    return 100.0 * up / down;
}

IndicatorValue williams_r(std::span<const Bar> w) {
    double hhv = w[0].high;
    double llv = w[0].low;
    for (const auto& b : w) {
        hhv = std::max(hhv, b.high);
        llv = std::min(llv, b.low);
    }
    if (near_zero(hhv - llv)) return std::nullopt;
    return -100.0 * (hhv - w.back().close) / (hhv - llv);
}

IndicatorValue volume_ratio(std::span<const Bar> w) {
    double up = 0.0;
    double down = 0.0;
    double flat = 0.0;
    for (std::size_t i = 1; i < w.size(); ++i) {
        if (w[i].close > w[i - 1].close)      up   += w[i].volume;
        else if (w[i].close < w[i - 1].close) down += w[i].volume;
        else                                  flat += w[i].volume;
    }
    const double denom = down + 0.5 * flat;
    if (near_zero(denom)) return std::nullopt;
    return 100.0 * (up + 0.5 * flat) / denom;
}

IndicatorValue atr(std::span<const Bar> w) {
    double sum = 0.0;
    for (std::size_t i = 1; i < w.size(); ++i) {
        const double prev = w[i - 1].close;
        sum += std::max({w[i].high - w[i].low,
                         std::abs(w[i].high - prev),
                         std::abs(w[i].low - prev)});
    }
    return sum / static_cast<double>(w.size() - 1);
}

// ─── Trend ────────────────────────────────────────────────────────────────────

/// Least-squares slope of ln(close) against bar index, in percent per bar.
IndicatorValue log_slope(std::span<const Bar> w) {
    const auto n = static_cast<Eigen::Index>(w.size());
    Eigen::MatrixXd X(n, 2);
    Eigen::VectorXd y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double c = w[static_cast<std::size_t>(i)].close;
        if (!(c > 0.0)) return std::nullopt;
        X(i, 0) = 1.0;
        X(i, 1) = static_cast<double>(i);
        y(i)    = std::log(c);
    }
    const Eigen::Vector2d beta = X.colPivHouseholderQr().solve(y);
    return 100.0 * beta(1);
}

}  // namespace

IndicatorPtr make_cci(std::string name, std::size_t window) {
    return make_indicator(std::move(name), window, cci);
}

void register_builtin_indicators(IndicatorRegistry& registry) {
    registry.add(make_indicator("p_change", 2, p_change));

    for (const std::size_t n : {5u, 10u, 20u, 30u, 60u, 250u}) {
        registry.add(make_indicator("ma" + std::to_string(n), n, mean_close));
    }
    registry.add(make_indicator("vol_ma5", 5, mean_volume));

    constexpr std::size_t macd_window = 100;
    registry.add(make_indicator("macd_dif", macd_window,
        [](std::span<const Bar> w) -> IndicatorValue { return macd(w).dif; }));
    registry.add(make_indicator("macd_dea", macd_window,
        [](std::span<const Bar> w) -> IndicatorValue { return macd(w).dea; }));
    registry.add(make_indicator("macd_hist", macd_window,
        [](std::span<const Bar> w) -> IndicatorValue {
            const auto m = macd(w);
            return 2.0 * (m.dif - m.dea);
        }));

    registry.add(make_indicator("kdj_k", KDJ_WINDOW,
        [](std::span<const Bar> w) -> IndicatorValue {
            const auto r = kdj(w);
            return r ? IndicatorValue{r->k} : std::nullopt;
        }));
    registry.add(make_indicator("kdj_d", KDJ_WINDOW,
        [](std::span<const Bar> w) -> IndicatorValue {
            const auto r = kdj(w);
            return r ? IndicatorValue{r->d} : std::nullopt;
        }));
    registry.add(make_indicator("kdj_j", KDJ_WINDOW,
        [](std::span<const Bar> w) -> IndicatorValue {
            const auto r = kdj(w);
            return r ? IndicatorValue{3.0 * r->k - 2.0 * r->d} : std::nullopt;
        }));

    registry.add(make_indicator("rsi_6", 7, rsi));
    registry.add(make_cci("cci", 14));
    registry.add(make_indicator("cr", 27, cr));
    registry.add(make_indicator("wr_6", 6, williams_r));
    registry.add(make_indicator("vr", 27, volume_ratio));
    registry.add(make_indicator("atr14", 15, atr));
    registry.add(make_indicator("slope20", 20, log_slope));
}

}  // namespace sift::indicator
