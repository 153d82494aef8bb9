/// @file tests/strategy/test_strategy_engine.cpp
/// @brief StrategyEngine isolation, ordering and eligibility tests.

#include "sift/strategy.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sift;
using namespace sift::strategy;

namespace {

const TradingDate D = TradingDate::from_ymd(2024, 3, 4);

/// Matches every eligible instrument; throws for `poison`.
class ScriptedStrategy final : public Strategy {
public:
    ScriptedStrategy(std::string name, std::string poison = {}, std::size_t lookback = 1)
        : name_(std::move(name)), poison_(std::move(poison)), lookback_(lookback) {}

    std::string_view name() const noexcept override { return name_; }
    std::size_t lookback() const noexcept override { return lookback_; }
    std::optional<Match> evaluate(const StrategyContext& ctx) const override {
        if (ctx.instrument().code == poison_) throw std::runtime_error("boom");
        return Match{.score = ctx.bars().back().close, .params = {{"close", ctx.bars().back().close}}};
    }

private:
    std::string name_;
    std::string poison_;
    std::size_t lookback_;
};

/// Requires an indicator on D.
class NeedsMa5 final : public Strategy {
public:
    std::string_view name() const noexcept override { return "needs_ma5"; }
    std::vector<std::string> required_indicators() const override { return {"ma5"}; }
    std::optional<Match> evaluate(const StrategyContext&) const override { return Match{}; }
};

StrategyInput input(const std::string& code, TradingDate last, std::size_t bars = 3,
                    ListingStatus status = ListingStatus::Active) {
    StrategyInput in{.instrument = Instrument{.code = code, .name = code, .status = status}};
    for (std::size_t i = 0; i < bars; ++i) {
        const auto date = last.plus_days(static_cast<std::int32_t>(i) - static_cast<std::int32_t>(bars - 1));
        in.bars.push_back(Bar{.code = code, .date = date, .open = 10, .high = 11, .low = 9,
                              .close = 10.0 + static_cast<double>(i), .volume = 100, .amount = 1000});
        in.rows.push_back(IndicatorRow{.code = code, .date = date, .values = {{"ma5", std::nullopt}}});
    }
    return in;
}

StrategySet set_of(std::vector<StrategyPtr> items) {
    StrategyRegistry reg;
    for (auto& s : items) reg.add(std::move(s));
    return reg.snapshot();
}

}  // namespace

// ─── Registry ─────────────────────────────────────────────────────────────────

TEST(StrategyRegistry, RejectsNullAndDuplicates) {
    StrategyRegistry reg;
    EXPECT_TRUE(reg.add(std::make_shared<ScriptedStrategy>("a")));
    EXPECT_FALSE(reg.add(std::make_shared<ScriptedStrategy>("a")));
    EXPECT_FALSE(reg.add(std::make_shared<ScriptedStrategy>("")));
    EXPECT_FALSE(reg.add(nullptr));
    EXPECT_EQ(reg.size(), 1u);
}

TEST(StrategyRegistry, AllowListSnapshot) {
    StrategyRegistry reg;
    reg.add(std::make_shared<ScriptedStrategy>("a"));
    reg.add(std::make_shared<ScriptedStrategy>("b"));
    reg.add(std::make_shared<ScriptedStrategy>("c"));

    const std::vector<std::string> allow{"c", "a"};
    const auto set = reg.snapshot(allow);
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->names(), (std::vector<std::string>{"a", "c"}));

    const std::vector<std::string> unknown{"a", "zzz"};
    EXPECT_FALSE(reg.snapshot(unknown).has_value());
}

TEST(StrategyRegistry, BuiltinsAreRegistered) {
    const auto set = builtin_strategy_set();
    EXPECT_NE(set.find("turtle_trade"), nullptr);
    EXPECT_NE(set.find("volume_surge"), nullptr);
    EXPECT_NE(set.find("indicator_buy"), nullptr);
    EXPECT_EQ(set.max_lookback(), 250u);
}

// ─── MarketSnapshot ───────────────────────────────────────────────────────────

TEST(MarketSnapshot, AggregatesRowsOfTheDate) {
    const std::vector<IndicatorRow> rows{
        {.code = "A", .date = D, .values = {{"p_change", 2.0}}},
        {.code = "B", .date = D, .values = {{"p_change", -4.0}}},
        {.code = "C", .date = D, .values = {{"p_change", std::nullopt}}},
        {.code = "X", .date = D.plus_days(-1), .values = {{"p_change", 9.0}}},
    };
    const auto snap = MarketSnapshot::from_rows(D, rows);
    EXPECT_EQ(snap.instruments, 3u);
    EXPECT_EQ(snap.advancing, 1u);
    EXPECT_EQ(snap.declining, 1u);
    ASSERT_TRUE(snap.mean_p_change.has_value());
    EXPECT_DOUBLE_EQ(*snap.mean_p_change, -1.0);
}

// ─── StrategyContext ──────────────────────────────────────────────────────────

TEST(StrategyContext, RowsAlignWithTailOfBars) {
    auto in = input("A", D, 5);
    in.rows.erase(in.rows.begin(), in.rows.begin() + 3);  // rows for the last 2 bars
    in.rows.back().values["ma5"] = 7.0;
    const MarketSnapshot market{.date = D};
    const StrategyContext ctx(in.instrument, in.bars, in.rows, market);

    EXPECT_EQ(ctx.date(), D);
    EXPECT_EQ(ctx.indicator("ma5"), 7.0);
    EXPECT_FALSE(ctx.indicator("ma5", 0).has_value());
    EXPECT_FALSE(ctx.indicator("ma5", 99).has_value());

    const auto earlier = ctx.as_of(3);
    EXPECT_EQ(earlier.bars().size(), 4u);
    EXPECT_EQ(earlier.rows().size(), 1u);
    EXPECT_FALSE(earlier.indicator("ma5").has_value());
}

// ─── Engine ───────────────────────────────────────────────────────────────────

TEST(StrategyEngine, ThrowingPairIsIsolated) {
    StrategyEngine engine(set_of({std::make_shared<ScriptedStrategy>("p", "B")}), 2);
    const std::vector<StrategyInput> inputs{input("A", D), input("B", D), input("C", D)};
    const auto report = engine.evaluate(D, inputs, MarketSnapshot{.date = D});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].code, "A");
    EXPECT_EQ(report.results[1].code, "C");
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].code, "B");
    EXPECT_EQ(report.failures[0].message, "boom");
    EXPECT_EQ(report.evaluated, 3u);
}

TEST(StrategyEngine, ResultsSortedByStrategyThenCode) {
    StrategyEngine engine(set_of({std::make_shared<ScriptedStrategy>("zeta"), std::make_shared<ScriptedStrategy>("alpha")}), 4);
    const std::vector<StrategyInput> inputs{input("C", D), input("A", D), input("B", D)};
    const auto report = engine.evaluate(D, inputs, MarketSnapshot{.date = D});

    ASSERT_EQ(report.results.size(), 6u);
    EXPECT_EQ(report.results.front().strategy, "alpha");
    EXPECT_EQ(report.results.front().code, "A");
    EXPECT_EQ(report.results.back().strategy, "zeta");
    EXPECT_EQ(report.results.back().code, "C");
    for (const auto& r : report.results) EXPECT_EQ(r.date, D);
}

TEST(StrategyEngine, IneligibleInstrumentsAbsent) {
    StrategyEngine engine(set_of({std::make_shared<ScriptedStrategy>("p", "", 3)}), 1);
    const std::vector<StrategyInput> inputs{
        input("ACTIVE", D),
        input("SUSP", D, 3, ListingStatus::Suspended),
        input("SHORT", D, 2),
        input("STALE", D.plus_days(-1)),
    };
    const auto report = engine.evaluate(D, inputs, MarketSnapshot{.date = D});
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].code, "ACTIVE");
    EXPECT_EQ(report.evaluated, 1u);
}

TEST(StrategyEngine, UndefinedRequiredIndicatorIsIneligible) {
    StrategyEngine engine(set_of({std::make_shared<NeedsMa5>()}), 1);
    auto defined = input("DEF", D);
    defined.rows.back().values["ma5"] = 10.0;
    const std::vector<StrategyInput> inputs{input("UNDEF", D), defined};
    const auto report = engine.evaluate(D, inputs, MarketSnapshot{.date = D});
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].code, "DEF");
}

TEST(StrategyEngine, EmptyInputsOrSet) {
    StrategyEngine empty_set(StrategySet{}, 2);
    const std::vector<StrategyInput> inputs{input("A", D)};
    EXPECT_TRUE(empty_set.evaluate(D, inputs, MarketSnapshot{.date = D}).results.empty());

    StrategyEngine engine(set_of({std::make_shared<ScriptedStrategy>("p")}), 2);
    EXPECT_TRUE(engine.evaluate(D, {}, MarketSnapshot{.date = D}).results.empty());
}

TEST(StrategyEngine, WorkerCountDoesNotChangeResults) {
    const std::vector<StrategyInput> inputs{input("A", D), input("B", D), input("C", D), input("D", D)};
    StrategyEngine serial(set_of({std::make_shared<ScriptedStrategy>("x"), std::make_shared<ScriptedStrategy>("y")}), 1);
    StrategyEngine wide(set_of({std::make_shared<ScriptedStrategy>("x"), std::make_shared<ScriptedStrategy>("y")}), 8);
    EXPECT_EQ(serial.evaluate(D, inputs, MarketSnapshot{.date = D}).results,
              wide.evaluate(D, inputs, MarketSnapshot{.date = D}).results);
}
