#pragma once

/// @file include/sift/forward_returns.hpp
/// @brief After-the-fact performance of strategy matches.
///
/// # Module: Forward Returns
///
/// ## Responsibility
/// For each StrategyResult of date D, report the cumulative percentage change
/// of close over the instrument's next `horizon` stored bars, relative to its
/// close on D:
///
///     rate_k = round(100 · (close_{D+k} − close_D) / close_D, 2)
///
/// ## Guarantees
/// - Always `horizon` rates per match; missing future bars are undefined
/// - Reads the Store only; never writes
///
/// ## NOT Responsible For
/// - Position sizing, fees or portfolio simulation

#include "sift/constants.hpp"
#include "sift/store.hpp"
#include "sift/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sift::backtest {

/// Default number of forward bars reported per match.
inline constexpr std::size_t DEFAULT_HORIZON = 100;

struct ForwardReturns {
    std::string                 strategy;
    std::string                 code;
    TradingDate                 date;
    IndicatorValue              entry_close;  ///< Undefined if no bar on D
    std::vector<IndicatorValue> rates;        ///< rates[k-1] is day k

    /// Number of defined rates.
    [[nodiscard]] std::size_t observed() const noexcept;
};

/// Cumulative rates for a bar series starting at the entry bar.
///
/// # Arguments
/// * `from_entry`: Ascending bars of one instrument; `from_entry[0]` is the
///                  entry bar
/// * `horizon`   : Number of rates to produce
///
/// # Returns
/// `horizon` values; all undefined when `from_entry` is empty or the entry
/// close is not positive.
[[nodiscard]] std::vector<IndicatorValue>
cumulative_rates(std::span<const Bar> from_entry, std::size_t horizon);

/// Forward returns of every match stored for `date`.
///
/// # Returns
/// One entry per StrategyResult, ordered by (strategy, code), or the first
/// store failure encountered.
[[nodiscard]] store::StoreResult<std::vector<ForwardReturns>>
forward_returns(const store::Store& store, TradingDate date,
                std::size_t horizon = DEFAULT_HORIZON,
                const std::optional<std::string>& strategy = std::nullopt);

}  // namespace sift::backtest
