/// @file tests/store/test_store_contract.cpp
/// @brief Behaviour every Store backend must share, run against each backend.

#include "sift/store.hpp"
#include "store_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

using namespace sift;
using namespace sift::store;
using namespace sift::test;

namespace {

struct Backend {
    std::string name;
    std::function<std::unique_ptr<Store>(const std::filesystem::path&)> make;
};

std::unique_ptr<Store> open_sqlite(const std::string& path) {
    auto r = SqliteStore::open(path);
    if (!ok(r)) {
        ADD_FAILURE() << "open " << path << ": " << std::get<StoreFailure>(r).detail;
        return nullptr;
    }
    return std::move(std::get<std::unique_ptr<SqliteStore>>(r));
}

template <typename T>
T value(StoreResult<T> r) {
    if (!ok(r)) {
        ADD_FAILURE() << std::get<StoreFailure>(r).detail;
        return T{};
    }
    return std::move(std::get<T>(r));
}

}  // namespace

class StoreContract : public ::testing::TestWithParam<Backend> {
protected:
    void SetUp() override {
        std::string test = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::replace(test.begin(), test.end(), '/', '_');
        dir_ = std::filesystem::temp_directory_path() / ("sift_store_" + test);
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        store_ = GetParam().make(dir_);
        ASSERT_NE(store_, nullptr);
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path  dir_;
    std::unique_ptr<Store> store_;
};

TEST_P(StoreContract, CommitThenRead) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());

    const auto& bars = value(store_->get_bars("A", DateRange{DAY1, DAY1}));
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0], bar("A", DAY1, 10.0));

    const auto& ind = value(store_->get_indicators("A", DAY1));
    ASSERT_TRUE(ind.has_value());
    EXPECT_EQ(*ind, row("A", DAY1, 10.0));

    const auto& results = value(store_->get_strategy_results(DAY1, std::nullopt));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0], result("turtle_trade", "A", DAY1, 2.5));
}

TEST_P(StoreContract, UndefinedIndicatorSurvivesRoundTrip) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());
    const auto& ind = value(store_->get_indicators("B", DAY1));
    ASSERT_TRUE(ind.has_value());
    EXPECT_TRUE(ind->values.contains("ma5"));
    EXPECT_FALSE(ind->defined("ma5"));
    EXPECT_EQ(ind->get("p_change"), 1.5);
}

TEST_P(StoreContract, MissingRecordsAreEmptyNotErrors) {
    EXPECT_FALSE(value(store_->get_indicators("A", DAY1)).has_value());
    EXPECT_TRUE(value(store_->get_bars("A", DateRange{DAY1, DAY3})).empty());
    EXPECT_TRUE(value(store_->get_strategy_results(DAY1, std::nullopt)).empty());
    EXPECT_TRUE(value(store_->committed_dates()).empty());
}

TEST_P(StoreContract, RecommitReplacesPartition) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());

    DateBatch replacement{.date = DAY1, .bars = {bar("C", DAY1, 5.0)}};
    ASSERT_FALSE(store_->commit(replacement).has_value());

    EXPECT_TRUE(value(store_->get_bars("A", DateRange{DAY1, DAY1})).empty());
    EXPECT_EQ(value(store_->get_bars("C", DateRange{DAY1, DAY1})).size(), 1u);
    EXPECT_FALSE(value(store_->get_indicators("A", DAY1)).has_value());
    EXPECT_TRUE(value(store_->get_strategy_results(DAY1, std::nullopt)).empty());
}

TEST_P(StoreContract, CommitIsIdempotent) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());
    const auto once = value(store_->get_strategy_results(DAY1, std::nullopt));
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());
    EXPECT_EQ(value(store_->get_strategy_results(DAY1, std::nullopt)), once);
    EXPECT_EQ(value(store_->get_bars("A", DateRange{DAY1, DAY3})).size(), 1u);
    EXPECT_EQ(value(store_->committed_dates()).size(), 1u);
}

TEST_P(StoreContract, ConflictingBatchWritesNothing) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());

    auto bad = batch_for(DAY1, 50.0);
    bad.bars.push_back(bar("A", DAY1, 51.0));
    const auto failure = store_->commit(bad);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->error, StoreError::ConstraintViolation);

    const auto& bars = value(store_->get_bars("A", DateRange{DAY1, DAY1}));
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.0);
}

TEST_P(StoreContract, WrongDateRejected) {
    auto bad = batch_for(DAY1);
    bad.bars.push_back(bar("Z", DAY2, 1.0));
    const auto failure = store_->commit(bad);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->error, StoreError::ConstraintViolation);
    EXPECT_TRUE(value(store_->committed_dates()).empty());
}

TEST_P(StoreContract, PartitionsAreIndependent) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1, 10.0)).has_value());
    ASSERT_FALSE(store_->commit(batch_for(DAY2, 11.0)).has_value());
    ASSERT_FALSE(store_->commit(batch_for(DAY3, 12.0)).has_value());
    ASSERT_FALSE(store_->commit(batch_for(DAY2, 20.0)).has_value());

    const auto& bars = value(store_->get_bars("A", DateRange{DAY1, DAY3}));
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 20.0);
    EXPECT_DOUBLE_EQ(bars[2].close, 12.0);

    const auto& dates = value(store_->committed_dates());
    EXPECT_EQ(dates, (std::vector<TradingDate>{DAY1, DAY2, DAY3}));
}

TEST_P(StoreContract, BarHistoryIsStrictlyBefore) {
    for (int i = 0; i < 5; ++i) {
        const auto d = DAY1.plus_days(i);
        ASSERT_FALSE(store_->commit(DateBatch{.date = d, .bars = {bar("A", d, 10.0 + i)}})
                         .has_value());
    }
    const auto before = DAY1.plus_days(4);
    const auto& hist = value(store_->bar_history("A", before, 3));
    ASSERT_EQ(hist.size(), 3u);
    EXPECT_EQ(hist.front().date, DAY1.plus_days(1));
    EXPECT_EQ(hist.back().date, DAY1.plus_days(3));

    EXPECT_EQ(value(store_->bar_history("A", before, 100)).size(), 4u);
    EXPECT_TRUE(value(store_->bar_history("A", DAY1, 10)).empty());
    EXPECT_TRUE(value(store_->bar_history("A", before, 0)).empty());
}

TEST_P(StoreContract, ResultsFilteredAndOrdered) {
    auto batch = batch_for(DAY1);
    batch.results = {result("zeta", "A", DAY1), result("alpha", "B", DAY1),
                     result("alpha", "A", DAY1)};
    ASSERT_FALSE(store_->commit(batch).has_value());

    const auto& all = value(store_->get_strategy_results(DAY1, std::nullopt));
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].strategy, "alpha");
    EXPECT_EQ(all[0].code, "A");
    EXPECT_EQ(all[1].code, "B");
    EXPECT_EQ(all[2].strategy, "zeta");

    const auto& alpha = value(store_->get_strategy_results(DAY1, std::string("alpha")));
    EXPECT_EQ(alpha.size(), 2u);
    EXPECT_TRUE(value(store_->get_strategy_results(DAY1, std::string("none"))).empty());
}

TEST_P(StoreContract, ListMatchesOmitsParams) {
    ASSERT_FALSE(store_->commit(batch_for(DAY1)).has_value());
    const auto& matches = value(list_matches(*store_, DAY1));
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].code, "A");
    EXPECT_DOUBLE_EQ(matches[0].score, 2.5);
    EXPECT_TRUE(matches[0].params.empty());
}

INSTANTIATE_TEST_SUITE_P(
    Backends, StoreContract,
    ::testing::Values(
        Backend{"memory", [](const std::filesystem::path&) -> std::unique_ptr<Store> {
                    return std::make_unique<MemoryStore>();
                }},
        Backend{"sqlite_memory", [](const std::filesystem::path&) {
                    return open_sqlite(":memory:");
                }},
        Backend{"sqlite_file", [](const std::filesystem::path& dir) {
                    return open_sqlite((dir / "sift.db").string());
                }}),
    [](const ::testing::TestParamInfo<Backend>& info) { return info.param.name; });
