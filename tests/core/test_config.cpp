/// @file tests/core/test_config.cpp
/// @brief Unit tests for PipelineConfig overrides and validation.

#include "sift/config.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace sift::core;

namespace {

Environment fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        const auto it = vars.find(std::string(name));
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

PipelineConfig runnable() {
    PipelineConfig c;
    c.source_dir = "/tmp/bars";
    return c;
}

}  // namespace

TEST(Config, Defaults_NeedASource) {
    const auto errors = validate_for_run(PipelineConfig{});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("no bar source"), std::string::npos);
}

TEST(Config, SourceDir_IsEnough) {
    EXPECT_TRUE(validate_for_run(runnable()).empty());
}

TEST(Config, Environment_OverridesDefaults) {
    PipelineConfig c;
    const auto errors = apply_environment(c, fake_env({
        {"SIFT_DB", "/var/lib/sift.db"},
        {"SIFT_SOURCE_DIR", "/data/bars"},
        {"SIFT_UNIVERSE", "/data/universe.csv"},
        {"SIFT_CREDENTIALS", "/etc/sift/creds"},
        {"SIFT_HOLIDAYS", "/etc/sift/holidays"},
        {"SIFT_WORKERS", "16"},
        {"SIFT_LOG_LEVEL", "debug"},
        {"SIFT_LOG_FILE", "/var/log/sift.log"},
    }));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(c.db_path, "/var/lib/sift.db");
    EXPECT_EQ(c.source_dir, "/data/bars");
    EXPECT_EQ(c.universe_path, "/data/universe.csv");
    EXPECT_EQ(c.credentials_path, "/etc/sift/creds");
    EXPECT_EQ(c.holidays_path, "/etc/sift/holidays");
    EXPECT_EQ(c.fetcher.workers, 16u);
    EXPECT_EQ(c.orchestrator.compute_workers, 16u);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.log_file, "/var/log/sift.log");
}

TEST(Config, Environment_InvalidValuesReported) {
    PipelineConfig c;
    const auto before = c.fetcher.workers;
    const auto errors = apply_environment(c, fake_env({
        {"SIFT_WORKERS", "0"},
        {"SIFT_LOG_LEVEL", "loud"},
        {"SIFT_DB", "ok.db"},
    }));
    EXPECT_EQ(errors.size(), 2u);
    EXPECT_EQ(c.fetcher.workers, before);
    EXPECT_EQ(c.log_level, "info");
    EXPECT_EQ(c.db_path, "ok.db");
}

TEST(Config, BothSources_Rejected) {
    auto c = runnable();
    c.http_url = "https://bars.example";
    EXPECT_FALSE(validate_for_run(c).empty());
}

TEST(Config, HttpUrl_MustBeHttp) {
    PipelineConfig c;
    c.http_url = "ftp://bars.example";
    EXPECT_EQ(validate_for_run(c).size(), 1u);
    c.http_url = "https://bars.example";
    EXPECT_TRUE(validate_for_run(c).empty());
}

TEST(Config, HistoryShorterThanStrategyWindow_Rejected) {
    auto c = runnable();
    c.orchestrator.history_bars  = 10;
    c.orchestrator.strategy_rows = 61;
    EXPECT_EQ(validate_for_run(c).size(), 1u);
}

TEST(Config, ParseCount) {
    EXPECT_EQ(parse_count("8"), 8u);
    EXPECT_FALSE(parse_count("0").has_value());
    EXPECT_FALSE(parse_count("-3").has_value());
    EXPECT_FALSE(parse_count("4x").has_value());
    EXPECT_FALSE(parse_count("").has_value());
}

TEST(Config, SplitList_DropsEmpty) {
    const auto items = split_list(" turtle_trade, ,volume_surge,");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "turtle_trade");
    EXPECT_EQ(items[1], "volume_surge");
}

TEST(Config, ParseSwitch) {
    EXPECT_EQ(parse_switch("on"), true);
    EXPECT_EQ(parse_switch("OFF"), false);
    EXPECT_EQ(parse_switch("1"), true);
    EXPECT_EQ(parse_switch("no"), false);
    EXPECT_FALSE(parse_switch("maybe").has_value());
    EXPECT_FALSE(parse_switch("").has_value());
}

TEST(Config, Environment_Patterns) {
    PipelineConfig c;
    EXPECT_TRUE(c.candlestick_patterns);
    EXPECT_TRUE(apply_environment(c, fake_env({{"SIFT_PATTERNS", "off"}})).empty());
    EXPECT_FALSE(c.candlestick_patterns);

    const auto errors = apply_environment(c, fake_env({{"SIFT_PATTERNS", "sometimes"}}));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("SIFT_PATTERNS"), std::string::npos);
    EXPECT_FALSE(c.candlestick_patterns);
}
