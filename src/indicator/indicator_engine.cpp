/// @file src/indicator/indicator_engine.cpp
/// @brief IndicatorRegistry, IndicatorSet and IndicatorEngine.

#include "sift/indicators.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace sift::indicator {

namespace {

class FunctionIndicator final : public Indicator {
public:
    FunctionIndicator(std::string name, std::size_t window, IndicatorFn fn)
        : name_(std::move(name))
        , window_(window)
        , fn_(std::move(fn)) {}

    std::string_view name() const noexcept override { return name_; }
    std::size_t window() const noexcept override { return window_; }

    IndicatorValue compute(std::span<const Bar> window) const override {
        return fn_(window);
    }

private:
    std::string name_;
    std::size_t window_;
    IndicatorFn fn_;
};

}  // namespace

IndicatorPtr make_indicator(std::string name, std::size_t window, IndicatorFn fn) {
    return std::make_shared<FunctionIndicator>(std::move(name), window, std::move(fn));
}

// ─── IndicatorSet ─────────────────────────────────────────────────────────────

IndicatorSet::IndicatorSet(std::vector<IndicatorPtr> items)
    : items_(std::move(items)) {
    std::sort(items_.begin(), items_.end(),
              [](const IndicatorPtr& a, const IndicatorPtr& b) { return a->name() < b->name(); });
}

std::size_t IndicatorSet::max_window() const noexcept {
    std::size_t w = 0;
    for (const auto& ind : items_) w = std::max(w, ind->window());
    return w;
}

const Indicator* IndicatorSet::find(std::string_view name) const noexcept {
    const auto it = std::lower_bound(
        items_.begin(), items_.end(), name,
        [](const IndicatorPtr& ind, std::string_view n) { return ind->name() < n; });
    if (it == items_.end() || (*it)->name() != name) return nullptr;
    return it->get();
}

std::vector<std::string> IndicatorSet::names() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& ind : items_) out.emplace_back(ind->name());
    return out;
}

// ─── IndicatorRegistry ────────────────────────────────────────────────────────

bool IndicatorRegistry::add(IndicatorPtr indicator) {
    if (!indicator || indicator->name().empty() || indicator->window() == 0) {
        spdlog::warn("rejected invalid indicator registration");
        return false;
    }
    if (contains(indicator->name())) {
        spdlog::warn("rejected duplicate indicator '{}'", indicator->name());
        return false;
    }
    items_.push_back(std::move(indicator));
    return true;
}

bool IndicatorRegistry::contains(std::string_view name) const noexcept {
    return std::any_of(items_.begin(), items_.end(),
                       [name](const IndicatorPtr& ind) { return ind->name() == name; });
}

IndicatorSet IndicatorRegistry::snapshot() const {
    return IndicatorSet(items_);
}

IndicatorSet builtin_indicator_set() {
    IndicatorRegistry registry;
    register_builtin_indicators(registry);
    return registry.snapshot();
}

IndicatorSet pipeline_indicator_set(bool with_patterns) {
    IndicatorRegistry registry;
    register_builtin_indicators(registry);
    if (with_patterns) {
        register_candlestick_patterns(registry);
    }
    return registry.snapshot();
}

// ─── IndicatorEngine ──────────────────────────────────────────────────────────

IndicatorEngine::IndicatorEngine(IndicatorSet set)
    : set_(std::move(set)) {}

std::optional<IndicatorRow> IndicatorEngine::compute(std::span<const Bar> history) const {
    if (history.empty()) {
        return std::nullopt;
    }

    IndicatorRow row{.code = history.back().code, .date = history.back().date, .values = {}};
    for (const auto& ind : set_.indicators()) {
        const std::size_t w = ind->window();
        IndicatorValue value;
        if (history.size() >= w) {
            try {
                value = ind->compute(history.last(w));
            } catch (const std::exception& e) {
                spdlog::warn("indicator '{}' threw for {} on {}: {}", ind->name(), row.code,
                             row.date.to_string(), e.what());
                value.reset();
            } catch (...) {
                spdlog::warn("indicator '{}' threw a non-standard exception for {} on {}",
                             ind->name(), row.code, row.date.to_string());
                value.reset();
            }
            if (value && !std::isfinite(*value)) {
                value.reset();
            }
        }
        row.values.emplace(std::string(ind->name()), value);
    }
    return row;
}

std::vector<IndicatorRow>
IndicatorEngine::compute_series(std::span<const Bar> history, std::size_t count) const {
    const std::size_t n = std::min(count, history.size());
    std::vector<IndicatorRow> rows;
    rows.reserve(n);
    for (std::size_t end = history.size() - n; end < history.size(); ++end) {
        if (auto row = compute(history.first(end + 1))) {
            rows.push_back(std::move(*row));
        }
    }
    return rows;
}

}  // namespace sift::indicator
