#pragma once

/// @file include/sift/calendar.hpp
/// @brief Trading calendar: weekdays minus an explicit holiday list.
///
/// # Module: TradingCalendar
///
/// ## Responsibility
/// Decide which calendar dates are trading dates and expand ranges into the
/// ordered list of trading dates the orchestrator iterates.
///
/// ## Guarantees
/// - Immutable after construction; all queries are const and thread-safe
/// - Range expansion is ascending and duplicate-free

#include "sift/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sift::core {

class TradingCalendar {
public:
    /// Weekday-only calendar with no holidays.
    TradingCalendar() = default;

    explicit TradingCalendar(std::set<TradingDate> holidays);

    /// Load holidays from a file with one `YYYY-MM-DD` per line. Blank lines
    /// and lines starting with `#` are ignored.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened or any line is not a date.
    [[nodiscard]] static std::optional<TradingCalendar>
    load_holidays(const std::string& filepath);

    /// Same as `load_holidays`, from an in-memory string.
    [[nodiscard]] static std::optional<TradingCalendar>
    parse_holidays(std::string_view content);

    [[nodiscard]] bool is_trading_day(TradingDate d) const noexcept;

    /// All trading dates in [first, last], ascending. Empty if first > last.
    [[nodiscard]] std::vector<TradingDate> trading_days(DateRange range) const;

    /// Nearest trading date strictly before / after `d`.
    [[nodiscard]] TradingDate previous(TradingDate d) const noexcept;
    [[nodiscard]] TradingDate next(TradingDate d) const noexcept;

    [[nodiscard]] std::size_t holiday_count() const noexcept { return holidays_.size(); }

private:
    std::set<TradingDate> holidays_;
};

}  // namespace sift::core
