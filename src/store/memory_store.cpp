/// @file src/store/memory_store.cpp
/// @brief In-process Store backed by ordered maps.

#include "sift/store.hpp"

#include <algorithm>
#include <mutex>

namespace sift::store {

std::optional<StoreFailure> MemoryStore::commit(const DateBatch& batch) {
    auto normalized = normalize_batch(batch);
    if (auto* failure = std::get_if<StoreFailure>(&normalized)) {
        return *failure;
    }
    auto& canonical = std::get<DateBatch>(normalized);

    // Build the replacement partition fully before taking the write lock so
    // the swap itself cannot fail halfway.
    Partition fresh;
    for (auto& b : canonical.bars) {
        auto code = b.code;
        fresh.bars.emplace(std::move(code), std::move(b));
    }
    for (auto& r : canonical.indicators) {
        auto code = r.code;
        fresh.indicators.emplace(std::move(code), std::move(r));
    }
    fresh.results = std::move(canonical.results);

    std::unique_lock lock(mtx_);
    partitions_.insert_or_assign(batch.date, std::move(fresh));
    return std::nullopt;
}

StoreResult<std::vector<Bar>>
MemoryStore::get_bars(std::string_view code, DateRange range) const {
    std::shared_lock lock(mtx_);
    std::vector<Bar> out;
    for (auto it = partitions_.lower_bound(range.first);
         it != partitions_.end() && it->first <= range.last; ++it) {
        const auto bar = it->second.bars.find(code);
        if (bar != it->second.bars.end()) out.push_back(bar->second);
    }
    return out;
}

StoreResult<std::optional<IndicatorRow>>
MemoryStore::get_indicators(std::string_view code, TradingDate date) const {
    std::shared_lock lock(mtx_);
    const auto part = partitions_.find(date);
    if (part == partitions_.end()) return std::optional<IndicatorRow>{};
    const auto row = part->second.indicators.find(code);
    if (row == part->second.indicators.end()) return std::optional<IndicatorRow>{};
    return std::optional<IndicatorRow>{row->second};
}

StoreResult<std::vector<StrategyResult>>
MemoryStore::get_strategy_results(TradingDate date,
                                  const std::optional<std::string>& strategy) const {
    std::shared_lock lock(mtx_);
    std::vector<StrategyResult> out;
    const auto part = partitions_.find(date);
    if (part == partitions_.end()) return out;
    for (const auto& r : part->second.results) {
        if (!strategy || r.strategy == *strategy) out.push_back(r);
    }
    return out;
}

StoreResult<std::vector<Bar>>
MemoryStore::bar_history(std::string_view code, TradingDate before, std::size_t max_bars) const {
    std::shared_lock lock(mtx_);
    std::vector<Bar> out;
    auto it = partitions_.lower_bound(before);
    while (it != partitions_.begin() && out.size() < max_bars) {
        --it;
        const auto bar = it->second.bars.find(code);
        if (bar != it->second.bars.end()) out.push_back(bar->second);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

StoreResult<std::vector<TradingDate>> MemoryStore::committed_dates() const {
    std::shared_lock lock(mtx_);
    std::vector<TradingDate> out;
    out.reserve(partitions_.size());
    for (const auto& [date, part] : partitions_) out.push_back(date);
    return out;
}

std::size_t MemoryStore::bar_count() const {
    std::shared_lock lock(mtx_);
    std::size_t n = 0;
    for (const auto& [date, part] : partitions_) n += part.bars.size();
    return n;
}

}  // namespace sift::store
