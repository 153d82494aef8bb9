/// @file tests/fetch/test_bar_sources.cpp
/// @brief Tests for FileBarSource and the HTTP response classification.

#include "sift/bar_sources.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace sift;
using namespace sift::fetch;

namespace {

const TradingDate kDay = TradingDate::from_ymd(2024, 3, 15);
const Instrument  kInst{.code = "600000"};

const std::string kCsv =
    "date,open,high,low,close,volume,amount\n"
    "2024-03-14,10,11,9,10.2,1000,10200\n"
    "2024-03-15,10.2,11,10,10.8,1200,12960\n"
    "2024-03-18,10.8,11,x,10.9,1300,14170\n";

FetchError error_of(const FetchOutcome& o) {
    return std::get<FetchFailure>(o).error;
}

}  // namespace

// ─── find_row ─────────────────────────────────────────────────────────────────

TEST(FileBarSource_FindRow, ReturnsBarForDate) {
    const auto outcome = FileBarSource::find_row(kCsv, kInst, kDay);
    ASSERT_TRUE(std::holds_alternative<Bar>(outcome));
    const auto& bar = std::get<Bar>(outcome);
    EXPECT_EQ(bar.code, "600000");
    EXPECT_DOUBLE_EQ(bar.close, 10.8);
    EXPECT_DOUBLE_EQ(bar.amount, 12960);
}

TEST(FileBarSource_FindRow, MissingDate_NotFound) {
    EXPECT_EQ(error_of(FileBarSource::find_row(kCsv, kInst, kDay.plus_days(5))),
              FetchError::NotFound);
}

TEST(FileBarSource_FindRow, UnparsableRow_Malformed) {
    EXPECT_EQ(error_of(FileBarSource::find_row(kCsv, kInst, TradingDate::from_ymd(2024, 3, 18))),
              FetchError::MalformedPayload);
}

TEST(FileBarSource_FindRow, NotBarCsv_Malformed) {
    EXPECT_EQ(error_of(FileBarSource::find_row("<html><body>Service changed</body></html>",
                                               kInst, kDay)),
              FetchError::MalformedPayload);
    EXPECT_EQ(error_of(FileBarSource::find_row(R"({"bars":[]})", kInst, kDay)),
              FetchError::MalformedPayload);
}

TEST(FileBarSource_FindRow, RowsWithoutHeader_Malformed) {
    EXPECT_EQ(error_of(FileBarSource::find_row("2024-03-15,10.2,11,10,10.8,1200,12960\n",
                                               kInst, kDay)),
              FetchError::MalformedPayload);
}

// ─── fetch from disk ──────────────────────────────────────────────────────────

class FileBarSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("sift_bars_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "600000.csv") << kCsv;
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
};

TEST_F(FileBarSourceTest, ReadsInstrumentFile) {
    FileBarSource source(dir_.string());
    const auto outcome = source.fetch(kInst, kDay, Credential{});
    ASSERT_TRUE(std::holds_alternative<Bar>(outcome));
    EXPECT_DOUBLE_EQ(std::get<Bar>(outcome).close, 10.8);
}

TEST_F(FileBarSourceTest, MissingFile_NotFound) {
    FileBarSource source(dir_.string());
    EXPECT_EQ(error_of(source.fetch(Instrument{.code = "000001"}, kDay, Credential{})),
              FetchError::NotFound);
}

TEST_F(FileBarSourceTest, ContentIsCached) {
    FileBarSource source(dir_.string());
    ASSERT_TRUE(std::holds_alternative<Bar>(source.fetch(kInst, kDay, Credential{})));
    std::filesystem::remove(dir_ / "600000.csv");
    EXPECT_TRUE(std::holds_alternative<Bar>(source.fetch(kInst, kDay, Credential{})));
}

// ─── HTTP classification ──────────────────────────────────────────────────────

TEST(HttpBarSource_Classify, Ok_ParsesBody) {
    const auto outcome = HttpBarSource::classify_response(200, kCsv, kInst, kDay);
    ASSERT_TRUE(std::holds_alternative<Bar>(outcome));
}

TEST(HttpBarSource_Classify, OkWithoutRow_NotFound) {
    EXPECT_EQ(error_of(HttpBarSource::classify_response(
                  200, "date,open,high,low,close,volume\n", kInst, kDay)),
              FetchError::NotFound);
}

TEST(HttpBarSource_Classify, OkWithHtmlBody_Malformed) {
    EXPECT_EQ(error_of(HttpBarSource::classify_response(
                  200, "<!DOCTYPE html><html><body>maintenance</body></html>", kInst, kDay)),
              FetchError::MalformedPayload);
}

TEST(HttpBarSource_Classify, OkWithEmptyBody_Malformed) {
    EXPECT_EQ(error_of(HttpBarSource::classify_response(200, "", kInst, kDay)),
              FetchError::MalformedPayload);
}

TEST(HttpBarSource_Classify, StatusMapping) {
    EXPECT_EQ(error_of(HttpBarSource::classify_response(404, "", kInst, kDay)), FetchError::NotFound);
    EXPECT_EQ(error_of(HttpBarSource::classify_response(429, "", kInst, kDay)), FetchError::RateLimited);
    EXPECT_EQ(error_of(HttpBarSource::classify_response(403, "", kInst, kDay)), FetchError::RateLimited);
    EXPECT_EQ(error_of(HttpBarSource::classify_response(503, "", kInst, kDay)), FetchError::Transient);
    EXPECT_EQ(error_of(HttpBarSource::classify_response(408, "", kInst, kDay)), FetchError::Transient);
    EXPECT_EQ(error_of(HttpBarSource::classify_response(302, "", kInst, kDay)), FetchError::MalformedPayload);
}

TEST(HttpBarSource_Url, CodeAndDateInPath) {
    HttpBarSource source(HttpSourceConfig{.base_url = "https://bars.example/v1/daily"});
    EXPECT_EQ(source.url_for(kInst, kDay), "https://bars.example/v1/daily/600000?date=2024-03-15");
}
