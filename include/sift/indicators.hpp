#pragma once

/// @file include/sift/indicators.hpp
/// @brief Named technical indicators and the engine that evaluates them.
///
/// # Module: Indicator Engine
///
/// ## Responsibility
/// Turn one instrument's ordered bar history into an `IndicatorRow` for the
/// date of its last bar.
///
/// ## Guarantees
/// - An indicator only ever sees the `window()` bars ending at the current
///   bar; later bars are never passed in
/// - Fewer than `window()` bars yields an undefined value, never zero
/// - Deterministic: identical history gives bit-identical values
/// - `IndicatorSet` is immutable and safe to share across threads
///
/// ## Extending
/// Implement `Indicator` (or wrap a function with `make_indicator`) and add
/// it to an `IndicatorRegistry` before taking the snapshot. The engine and
/// the orchestrator need no change.

#include "sift/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sift::indicator {

// ─── Indicator ────────────────────────────────────────────────────────────────

class Indicator {
public:
    virtual ~Indicator() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Bars required, the current bar included.
    [[nodiscard]] virtual std::size_t window() const noexcept = 0;

    /// Compute from exactly `window()` bars ending at the current bar.
    ///
    /// # Returns
    /// Undefined when the window is mathematically degenerate (zero range,
    /// zero denominator, non-positive price where a logarithm is needed).
    [[nodiscard]] virtual IndicatorValue compute(std::span<const Bar> window) const = 0;
};

using IndicatorPtr = std::shared_ptr<const Indicator>;

using IndicatorFn = std::function<IndicatorValue(std::span<const Bar>)>;

/// Wrap a pure function as a named indicator.
[[nodiscard]] IndicatorPtr make_indicator(std::string name, std::size_t window,
                                          IndicatorFn fn);

// ─── IndicatorSet / IndicatorRegistry ─────────────────────────────────────────

/// Immutable, ordered (by name) snapshot of indicators.
class IndicatorSet {
public:
    IndicatorSet() = default;

    [[nodiscard]] std::span<const IndicatorPtr> indicators() const noexcept {
        return items_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return items_.empty(); }

    /// Largest `window()` in the set; 0 when empty.
    [[nodiscard]] std::size_t max_window() const noexcept;

    [[nodiscard]] const Indicator* find(std::string_view name) const noexcept;

    [[nodiscard]] std::vector<std::string> names() const;

private:
    friend class IndicatorRegistry;
    explicit IndicatorSet(std::vector<IndicatorPtr> items);

    std::vector<IndicatorPtr> items_;
};

class IndicatorRegistry {
public:
    /// Register an indicator.
    ///
    /// # Returns
    /// `false` (and leaves the registry unchanged) if `indicator` is null,
    /// has an empty name or zero window, or its name is already taken.
    bool add(IndicatorPtr indicator);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    [[nodiscard]] IndicatorSet snapshot() const;

private:
    std::vector<IndicatorPtr> items_;
};

/// Register the built-in set:
/// p_change, ma5/10/20/30/60/250, vol_ma5, macd_dif/dea/hist, kdj_k/d/j,
/// rsi_6, cci, cr, wr_6, vr, atr14, slope20.
void register_builtin_indicators(IndicatorRegistry& registry);

/// Snapshot of a registry holding only the built-ins.
[[nodiscard]] IndicatorSet builtin_indicator_set();

/// CCI over `window` bars, for windows other than the built-in 14.
[[nodiscard]] IndicatorPtr make_cci(std::string name, std::size_t window);

/// Register the candlestick patterns. Each value is +100 (bullish), -100
/// (bearish) or 0 (no pattern):
///
/// | name                       | window | signal |
/// |----------------------------|--------|--------|
/// | `cdl_doji`                 | 1      | +100   |
/// | `cdl_spinning_top`         | 1      | ±100 by candle colour |
/// | `cdl_hammer`               | 6      | +100 after a falling trend |
/// | `cdl_hanging_man`          | 6      | -100 after a rising trend  |
/// | `cdl_engulfing`            | 2      | ±100   |
/// | `cdl_piercing`             | 2      | +100   |
/// | `cdl_dark_cloud_cover`     | 2      | -100   |
/// | `cdl_morning_star`         | 3      | +100   |
/// | `cdl_evening_star`         | 3      | -100   |
/// | `cdl_three_white_soldiers` | 3      | +100   |
/// | `cdl_three_black_crows`    | 3      | -100   |
void register_candlestick_patterns(IndicatorRegistry& registry);

/// Built-ins plus, when `with_patterns` is set, the candlestick patterns.
[[nodiscard]] IndicatorSet pipeline_indicator_set(bool with_patterns);

// ─── IndicatorEngine ──────────────────────────────────────────────────────────

class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorSet set);

    /// Row for the date of the last bar of `history` (ascending, one
    /// instrument). Every indicator of the set appears in the row. An
    /// indicator that throws is logged and its value is undefined; the other
    /// values of the row are unaffected.
    ///
    /// # Returns
    /// `nullopt` if `history` is empty.
    [[nodiscard]] std::optional<IndicatorRow> compute(std::span<const Bar> history) const;

    /// Rows for the last `count` dates of `history`, ascending. Each row only
    /// sees bars up to its own date.
    [[nodiscard]] std::vector<IndicatorRow>
    compute_series(std::span<const Bar> history, std::size_t count) const;

    [[nodiscard]] const IndicatorSet& set() const noexcept { return set_; }

private:
    IndicatorSet set_;
};

}  // namespace sift::indicator
