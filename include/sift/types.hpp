#pragma once

/// @file include/sift/types.hpp
/// @brief Shared value types for the SIFT daily screening pipeline.
///
/// Every module includes this file. It defines the calendar date used as the
/// pipeline's unit of work, the instrument/bar/indicator/result records that
/// flow between stages, and the error taxonomy shared by all stages.

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sift {

// ─── TradingDate ──────────────────────────────────────────────────────────────

/// A calendar date, stored as days since 1970-01-01 (proleptic Gregorian).
///
/// Whether a date is an actual trading day is decided by
/// `core::TradingCalendar`; the type itself only carries ordering and
/// arithmetic.
struct TradingDate {
    std::int32_t days = 0;  ///< Days since the Unix epoch

    /// Build from a civil date. No validation beyond the arithmetic.
    [[nodiscard]] static TradingDate from_ymd(int year, unsigned month,
                                              unsigned day) noexcept;

    /// Parse `YYYY-MM-DD`. Returns `nullopt` on any malformed input or an
    /// impossible day-of-month.
    [[nodiscard]] static std::optional<TradingDate>
    parse(std::string_view text) noexcept;

    /// Format as `YYYY-MM-DD`.
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] int      year() const noexcept;
    [[nodiscard]] unsigned month() const noexcept;
    [[nodiscard]] unsigned day() const noexcept;

    /// ISO weekday: 1 = Monday … 7 = Sunday.
    [[nodiscard]] unsigned weekday() const noexcept;

    [[nodiscard]] TradingDate plus_days(std::int32_t n) const noexcept {
        return TradingDate{days + n};
    }

    friend auto operator<=>(const TradingDate&, const TradingDate&) = default;
};

/// Inclusive date range [first, last].
struct DateRange {
    TradingDate first;
    TradingDate last;

    [[nodiscard]] bool contains(TradingDate d) const noexcept {
        return first <= d && d <= last;
    }
};

// ─── Instrument ───────────────────────────────────────────────────────────────

enum class ListingStatus {
    Active,
    Suspended,  ///< Trading halted; fetched but not eligible for strategies
    Delisted,   ///< Never sent upstream; always NotFound
};

[[nodiscard]] std::string_view to_string(ListingStatus s) noexcept;
[[nodiscard]] std::optional<ListingStatus> parse_listing_status(std::string_view s) noexcept;

struct Instrument {
    std::string   code;
    std::string   name;
    ListingStatus status = ListingStatus::Active;
};

// ─── Bar ──────────────────────────────────────────────────────────────────────

/// One instrument's daily OHLCV record. At most one per (code, date).
struct Bar {
    std::string code;
    TradingDate date;
    double open   = 0.0;
    double high   = 0.0;
    double low    = 0.0;
    double close  = 0.0;
    double volume = 0.0;
    double amount = 0.0;  ///< Traded value; close × volume when not supplied

    friend bool operator==(const Bar&, const Bar&) = default;
};

// ─── IndicatorRow ─────────────────────────────────────────────────────────────

/// An indicator value. `nullopt` means *undefined* (insufficient history or a
/// degenerate window) and must never be read as zero.
using IndicatorValue = std::optional<double>;

/// All indicator values for one (code, date). The map is ordered so that
/// iteration, serialisation and comparison are deterministic.
struct IndicatorRow {
    std::string code;
    TradingDate date;
    std::map<std::string, IndicatorValue, std::less<>> values;

    /// Value of `name`, or undefined when the indicator is unknown.
    [[nodiscard]] IndicatorValue get(std::string_view name) const {
        const auto it = values.find(name);
        return it == values.end() ? IndicatorValue{} : it->second;
    }

    [[nodiscard]] bool defined(std::string_view name) const {
        return get(name).has_value();
    }

    friend bool operator==(const IndicatorRow&, const IndicatorRow&) = default;
};

// ─── StrategyResult ───────────────────────────────────────────────────────────

/// A named strategy matched an instrument on a date. Unique on
/// (strategy, code, date).
struct StrategyResult {
    std::string strategy;
    std::string code;
    TradingDate date;
    double      score = 0.0;
    std::map<std::string, double, std::less<>> params;  ///< Values behind the match

    friend bool operator==(const StrategyResult&, const StrategyResult&) = default;
};

// ─── Error taxonomy ───────────────────────────────────────────────────────────

enum class FetchError {
    NotFound,          ///< Delisted / no data for the date; not retried
    RateLimited,       ///< Upstream throttling; retried with backoff + rotation
    Transient,         ///< Network/server fault; retried with backoff
    MalformedPayload,  ///< Unparsable response; not retried (schema change?)
};

/// Not a failure: insufficient history surfaces as an undefined value.
enum class ComputeError {
    InsufficientHistory,
};

enum class StoreError {
    Unavailable,          ///< Backend cannot be reached or the write failed
    ConstraintViolation,  ///< Duplicate key with mismatched content
};

enum class OrchestrationError {
    PartialDateFailure,  ///< A non-commit stage faulted for the whole date
    StoreCommitFailure,  ///< The date's atomic commit did not succeed
};

[[nodiscard]] std::string_view to_string(FetchError e) noexcept;
[[nodiscard]] std::string_view to_string(ComputeError e) noexcept;
[[nodiscard]] std::string_view to_string(StoreError e) noexcept;
[[nodiscard]] std::string_view to_string(OrchestrationError e) noexcept;

}  // namespace sift
