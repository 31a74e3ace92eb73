#include <gtest/gtest.h>
#include "quantcore/dates.hpp"
#include "quantcore/errors.hpp"
#include "quantcore/price_provider.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace quantcore;
using namespace quantcore::core;

namespace {

OHLCV bar(double ts, double close) {
    return OHLCV{.timestamp = ts, .open = close, .high = close, .low = close,
                 .close = close, .volume = 0.0};
}

}  // namespace

// ─── DateRange ────────────────────────────────────────────────────────────────

TEST(DateRange, ParseIsInclusive) {
    const auto r = DateRange::parse("2021-01-01", "2021-01-31");
    EXPECT_TRUE(r.contains(parse_iso_date("2021-01-01")));
    EXPECT_TRUE(r.contains(parse_iso_date("2021-01-31")));
    EXPECT_FALSE(r.contains(parse_iso_date("2021-02-01")));
}

TEST(DateRange, StartAfterEnd_Throws) {
    EXPECT_THROW((void)DateRange::parse("2022-01-01", "2021-01-01"), InvalidParameterError);
}

TEST(DateRange, AllContainsEverything) {
    EXPECT_TRUE(DateRange::all().contains(-1e12));
    EXPECT_TRUE(DateRange::all().contains(1e12));
}

// ─── InMemoryPriceProvider ────────────────────────────────────────────────────

TEST(InMemoryPriceProvider, SortsDeduplicatesAndFilters) {
    InMemoryPriceProvider provider;
    provider.add("ABC", {bar(3, 103), bar(1, 101), bar(2, 102), bar(2, 202), bar(9, 109)});

    const auto s = provider.fetch("ABC", DateRange{.start = 1, .end = 3});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.timestamp_at(0), 1.0);
    EXPECT_DOUBLE_EQ(s.close_at(1), 202.0);  // last duplicate wins
    EXPECT_DOUBLE_EQ(s.timestamp_at(2), 3.0);
}

TEST(InMemoryPriceProvider, UnknownSymbolIsEmpty) {
    const InMemoryPriceProvider provider;
    EXPECT_TRUE(provider.fetch("NOPE", DateRange::all()).empty());
}

TEST(InMemoryPriceProvider, AddClosesUsesBarIndices) {
    InMemoryPriceProvider provider;
    provider.add_closes("X", {10.0, 11.0, 12.0});
    const auto s = provider.fetch("X", DateRange::all());
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.timestamp_at(2), 2.0);
}

// ─── CsvPriceProvider ─────────────────────────────────────────────────────────

class CsvPriceProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("quantcore_csv_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
        std::ofstream out(dir_ / "ABC.csv");
        out << "date,open,high,low,close,volume\n"
            << "2021-01-05,11,11,11,11,0\n"
            << "2021-01-04,10,10,10,10,0\n"
            << "2021-01-06,12,12,12,12,0\n"
            << "2021-02-01,20,20,20,20,0\n";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(CsvPriceProviderTest, LoadsSortedRange) {
    const CsvPriceProvider provider(dir_.string());
    const auto s = provider.fetch("ABC", DateRange::parse("2021-01-01", "2021-01-31"));
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.close_at(0), 10.0);
    EXPECT_DOUBLE_EQ(s.close_at(2), 12.0);
    EXPECT_DOUBLE_EQ(s.timestamp_at(0), parse_iso_date("2021-01-04"));
}

TEST_F(CsvPriceProviderTest, MissingSymbolIsEmpty) {
    const CsvPriceProvider provider(dir_.string());
    EXPECT_TRUE(provider.fetch("XYZ", DateRange::all()).empty());
}

TEST_F(CsvPriceProviderTest, PathForSymbol) {
    const CsvPriceProvider provider(dir_.string());
    EXPECT_EQ(std::filesystem::path(provider.path_for("ABC")).filename(), "ABC.csv");
}
