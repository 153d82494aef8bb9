#pragma once

/// @file include/sift/strategies.hpp
/// @brief Built-in selection strategies.
///
/// Thresholds are constructor parameters; the defaults are the values
/// `register_builtin_strategies` uses. Every strategy reads the bar history
/// and the indicator rows of its `StrategyContext` only.

#include "sift/constants.hpp"
#include "sift/strategy.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift::strategy {

/// Close on D is the highest close of the last `window` bars.
class TurtleTrade final : public Strategy {
public:
    explicit TurtleTrade(std::size_t window = 60) : window_(window) {}

    std::string_view name() const noexcept override { return "turtle_trade"; }
    std::size_t lookback() const noexcept override { return window_; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t window_;
};

/// Price up on sharply higher volume: p_change ≥ `min_pct`, close ≥ open,
/// traded amount ≥ `min_amount` and volume ≥ `min_ratio` × the previous
/// bar's vol_ma5.
class VolumeSurge final : public Strategy {
public:
    VolumeSurge(std::size_t threshold = 60,
                double min_pct    = 2.0,
                double min_amount = constants::MIN_LIQUID_AMOUNT,
                double min_ratio  = 2.0)
        : threshold_(threshold), min_pct_(min_pct),
          min_amount_(min_amount), min_ratio_(min_ratio) {}

    std::string_view name() const noexcept override { return "volume_surge"; }
    std::size_t lookback() const noexcept override { return threshold_ + 1; }
    std::vector<std::string> required_indicators() const override { return {"p_change"}; }

    /// Default filter plus a liquidity floor on D's traded amount.
    bool eligible(const StrategyContext& ctx) const override;

    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      min_pct_;
    double      min_amount_;
    double      min_ratio_;
};

/// Breakout from a ma60 platform on a volume-surge day.
class BreakthroughPlatform final : public Strategy {
public:
    explicit BreakthroughPlatform(std::size_t threshold = 60) : threshold_(threshold) {}

    std::string_view name() const noexcept override { return "breakthrough_platform"; }
    std::size_t lookback() const noexcept override { return threshold_ + 1; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
};

/// Break above ma250, then a low-volume pullback that holds above it.
class BacktraceMa250 final : public Strategy {
public:
    explicit BacktraceMa250(std::size_t threshold = 60) : threshold_(threshold) {}

    std::string_view name() const noexcept override { return "backtrace_ma250"; }
    std::size_t lookback() const noexcept override { return 250; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
};

/// ma30 rising across the last `threshold` bars by more than `min_growth`.
class KeepIncreasing final : public Strategy {
public:
    explicit KeepIncreasing(std::size_t threshold = 30, double min_growth = 1.2)
        : threshold_(threshold), min_growth_(min_growth) {}

    std::string_view name() const noexcept override { return "keep_increasing"; }
    std::size_t lookback() const noexcept override { return threshold_; }
    std::vector<std::string> required_indicators() const override { return {"ma30"}; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      min_growth_;
};

/// Limit-up breakout followed by three tight days above the limit-up close.
class ParkingApron final : public Strategy {
public:
    explicit ParkingApron(std::size_t threshold = 15,
                          double limit_pct = constants::LIMIT_MOVE_PCT)
        : threshold_(threshold), limit_pct_(limit_pct) {}

    std::string_view name() const noexcept override { return "parking_apron"; }
    std::size_t lookback() const noexcept override { return threshold_; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      limit_pct_;
};

/// Calm but rising: mean |p_change| ≤ `max_mean_move` over the last
/// `threshold` bars while the close range exceeds `min_range`.
class LowAtrGrowth final : public Strategy {
public:
    LowAtrGrowth(std::size_t threshold = 10, double max_mean_move = 10.0,
                 double min_range = 1.1)
        : threshold_(threshold), max_mean_move_(max_mean_move), min_range_(min_range) {}

    std::string_view name() const noexcept override { return "low_atr_growth"; }
    std::size_t lookback() const noexcept override { return 250; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      max_mean_move_;
    double      min_range_;
};

/// Strong rise over the window without any sharp one- or two-day drop.
class LowBacktraceIncrease final : public Strategy {
public:
    explicit LowBacktraceIncrease(std::size_t threshold = 60, double min_rise = 0.6)
        : threshold_(threshold), min_rise_(min_rise) {}

    std::string_view name() const noexcept override { return "low_backtrace_increase"; }
    std::size_t lookback() const noexcept override { return threshold_; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      min_rise_;
};

/// Limit-down on heavy volume.
class ClimaxLimitdown final : public Strategy {
public:
    ClimaxLimitdown(std::size_t threshold = 60,
                    double limit_pct  = constants::LIMIT_MOVE_PCT,
                    double min_amount = constants::MIN_LIQUID_AMOUNT,
                    double min_ratio  = 4.0)
        : threshold_(threshold), limit_pct_(limit_pct),
          min_amount_(min_amount), min_ratio_(min_ratio) {}

    std::string_view name() const noexcept override { return "climax_limitdown"; }
    std::size_t lookback() const noexcept override { return threshold_ + 1; }
    std::vector<std::string> required_indicators() const override { return {"p_change"}; }
    bool eligible(const StrategyContext& ctx) const override;
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

private:
    std::size_t threshold_;
    double      limit_pct_;
    double      min_amount_;
    double      min_ratio_;
};

/// Matches when every indicator condition holds on D. The score is the
/// value of the first condition's indicator.
class IndicatorThreshold final : public Strategy {
public:
    enum class Op { AtLeast, Below };

    struct Condition {
        std::string indicator;
        Op          op;
        double      value;
    };

    IndicatorThreshold(std::string name, std::vector<Condition> conditions);

    std::string_view name() const noexcept override { return name_; }
    std::size_t lookback() const noexcept override { return 1; }
    std::vector<std::string> required_indicators() const override;
    std::optional<Match> evaluate(const StrategyContext& ctx) const override;

    /// kdj_k≥80, kdj_d≥70, kdj_j≥100, rsi_6≥80, cci≥100, cr≥300, wr_6≥−20, vr≥160.
    [[nodiscard]] static IndicatorThreshold buy_signal();

    /// kdj_k<20, kdj_d<30, kdj_j<10, rsi_6<20, cci<−100, cr<40, wr_6<−80, vr<40.
    [[nodiscard]] static IndicatorThreshold sell_signal();

private:
    std::string            name_;
    std::vector<Condition> conditions_;
};

}  // namespace sift::strategy
