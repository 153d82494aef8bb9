/// @file src/core/calendar.cpp
/// @brief TradingDate civil arithmetic and the TradingCalendar.

#include "sift/calendar.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace sift {

// ─── Civil date conversion ────────────────────────────────────────────────────
//
// Days-from-civil and civil-from-days for the proleptic Gregorian calendar,
// using 400-year eras starting on March 1st.

namespace {

struct Civil {
    int      y;
    unsigned m;
    unsigned d;
};

constexpr std::int32_t days_from_civil(int y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int32_t>(doe) - 719468;
}

constexpr Civil civil_from_days(std::int32_t z) noexcept {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(days_from_civil(2000, 3, 1) == 11017);

constexpr bool is_leap(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr unsigned days_in_month(int y, unsigned m) noexcept {
    constexpr unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
}

template <typename T>
bool parse_digits(std::string_view s, T& out) noexcept {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

}  // namespace

// ─── TradingDate ──────────────────────────────────────────────────────────────

TradingDate TradingDate::from_ymd(int year, unsigned month, unsigned day) noexcept {
    return TradingDate{days_from_civil(year, month, day)};
}

std::optional<TradingDate> TradingDate::parse(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (!parse_digits(text.substr(0, 4), y) ||
        !parse_digits(text.substr(5, 2), m) ||
        !parse_digits(text.substr(8, 2), d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    return from_ymd(y, m, d);
}

std::string TradingDate::to_string() const {
    const Civil c = civil_from_days(days);
    return fmt::format("{:04d}-{:02d}-{:02d}", c.y, c.m, c.d);
}

int TradingDate::year() const noexcept { return civil_from_days(days).y; }
unsigned TradingDate::month() const noexcept { return civil_from_days(days).m; }
unsigned TradingDate::day() const noexcept { return civil_from_days(days).d; }

unsigned TradingDate::weekday() const noexcept {
    // 1970-01-01 was a Thursday (ISO 4).
    const int w = ((days % 7) + 7 + 3) % 7;  // 0 = Monday
    return static_cast<unsigned>(w) + 1;
}

}  // namespace sift

namespace sift::core {

// ─── TradingCalendar ──────────────────────────────────────────────────────────

TradingCalendar::TradingCalendar(std::set<TradingDate> holidays)
    : holidays_(std::move(holidays))
{}

std::optional<TradingCalendar>
TradingCalendar::parse_holidays(std::string_view content) {
    std::set<TradingDate> holidays;
    std::istringstream stream{std::string(content)};
    std::string line;
    while (std::getline(stream, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        auto date = TradingDate::parse(
            std::string_view(line).substr(first, last - first + 1));
        if (!date) {
            return std::nullopt;
        }
        holidays.insert(*date);
    }
    return TradingCalendar(std::move(holidays));
}

std::optional<TradingCalendar>
TradingCalendar::load_holidays(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_holidays(contents.str());
}

bool TradingCalendar::is_trading_day(TradingDate d) const noexcept {
    return d.weekday() <= 5 && !holidays_.contains(d);
}

std::vector<TradingDate> TradingCalendar::trading_days(DateRange range) const {
    std::vector<TradingDate> out;
    for (TradingDate d = range.first; d <= range.last; d = d.plus_days(1)) {
        if (is_trading_day(d)) {
            out.push_back(d);
        }
    }
    return out;
}

TradingDate TradingCalendar::previous(TradingDate d) const noexcept {
    // Bounded: no calendar has more than a few weeks of consecutive closures.
    TradingDate p = d.plus_days(-1);
    for (int i = 0; i < 366 && !is_trading_day(p); ++i) {
        p = p.plus_days(-1);
    }
    return p;
}

TradingDate TradingCalendar::next(TradingDate d) const noexcept {
    TradingDate n = d.plus_days(1);
    for (int i = 0; i < 366 && !is_trading_day(n); ++i) {
        n = n.plus_days(1);
    }
    return n;
}

}  // namespace sift::core
