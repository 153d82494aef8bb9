/// @file src/store/date_batch.cpp
/// @brief Batch validation and the read helpers shared by every backend.

#include "sift/store.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <tuple>

namespace sift::store {

namespace {

StoreFailure violation(std::string detail) {
    return StoreFailure{.error = StoreError::ConstraintViolation, .detail = std::move(detail)};
}

/// Sort by `key`, drop identical neighbours, and report the first pair that
/// shares a key but differs in content.
template <typename T, typename Key>
std::optional<StoreFailure> canonicalise(std::vector<T>& items, Key key, std::string_view what) {
    std::stable_sort(items.begin(), items.end(),
                     [&](const T& a, const T& b) { return key(a) < key(b); });

    std::vector<T> out;
    out.reserve(items.size());
    for (auto& item : items) {
        if (!out.empty() && key(out.back()) == key(item)) {
            if (out.back() == item) continue;
            return violation(fmt::format("conflicting duplicate {} in batch", what));
        }
        out.push_back(std::move(item));
    }
    items = std::move(out);
    return std::nullopt;
}

}  // namespace

StoreResult<DateBatch> normalize_batch(DateBatch batch) {
    const std::string day = batch.date.to_string();

    for (const auto& b : batch.bars) {
        if (b.date != batch.date) {
            return violation(fmt::format("bar {} dated {} in batch for {}",
                                         b.code, b.date.to_string(), day));
        }
    }
    for (const auto& r : batch.indicators) {
        if (r.date != batch.date) {
            return violation(fmt::format("indicator row {} dated {} in batch for {}",
                                         r.code, r.date.to_string(), day));
        }
    }
    for (const auto& r : batch.results) {
        if (r.date != batch.date) {
            return violation(fmt::format("result {}/{} dated {} in batch for {}",
                                         r.strategy, r.code, r.date.to_string(), day));
        }
    }

    if (auto f = canonicalise(batch.bars, [](const Bar& b) -> const std::string& { return b.code; },
                              "bar")) {
        return *f;
    }
    if (auto f = canonicalise(batch.indicators,
                              [](const IndicatorRow& r) -> const std::string& { return r.code; },
                              "indicator row")) {
        return *f;
    }
    if (auto f = canonicalise(batch.results,
                              [](const StrategyResult& r) { return std::tie(r.strategy, r.code); },
                              "strategy result")) {
        return *f;
    }
    return batch;
}

StoreResult<std::vector<StrategyResult>> list_matches(const Store& store, TradingDate date) {
    auto results = store.get_strategy_results(date, std::nullopt);
    if (auto* list = std::get_if<std::vector<StrategyResult>>(&results)) {
        // Consumers see the match and its score only.
        for (auto& r : *list) r.params.clear();
    }
    return results;
}

}  // namespace sift::store
