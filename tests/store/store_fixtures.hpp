#pragma once

/// @file tests/store/store_fixtures.hpp
/// @brief Record builders shared by the store tests.

#include "sift/store.hpp"

#include <string>

namespace sift::test {

inline const TradingDate DAY1 = TradingDate::from_ymd(2024, 3, 4);
inline const TradingDate DAY2 = TradingDate::from_ymd(2024, 3, 5);
inline const TradingDate DAY3 = TradingDate::from_ymd(2024, 3, 6);

inline Bar bar(const std::string& code, TradingDate date, double close) {
    return Bar{.code = code, .date = date, .open = close - 0.5, .high = close + 1.0,
               .low = close - 1.0, .close = close, .volume = 1000.0, .amount = close * 1000.0};
}

inline IndicatorRow row(const std::string& code, TradingDate date, IndicatorValue ma5) {
    return IndicatorRow{.code = code, .date = date,
                        .values = {{"ma5", ma5}, {"p_change", 1.5}}};
}

inline StrategyResult result(const std::string& strategy, const std::string& code,
                             TradingDate date, double score = 1.0) {
    return StrategyResult{.strategy = strategy, .code = code, .date = date, .score = score,
                          .params = {{"close", score * 10.0}}};
}

/// Two instruments, one match.
inline store::DateBatch batch_for(TradingDate date, double base = 10.0) {
    return store::DateBatch{
        .date       = date,
        .bars       = {bar("B", date, base + 1.0), bar("A", date, base)},
        .indicators = {row("A", date, base), row("B", date, std::nullopt)},
        .results    = {result("turtle_trade", "A", date, 2.5)},
    };
}

}  // namespace sift::test
