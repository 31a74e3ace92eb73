#include <gtest/gtest.h>
#include "quantcore/data_loader.hpp"
#include "quantcore/dates.hpp"

#include <cmath>
#include <string>

using namespace quantcore;
using namespace quantcore::core;

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(DataLoader_Parse, FullOhlcvRows) {
    const std::string csv =
        "timestamp,open,high,low,close,volume\n"
        "1,100.0,105.0,99.0,103.0,1000000\n"
        "2,103.0,107.0,102.0,106.5,1200000\n";
    const auto bars = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].timestamp, 1.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 106.5);
    EXPECT_DOUBLE_EQ(bars[1].volume, 1200000.0);
}

TEST(DataLoader_Parse, IsoDateTimestamps) {
    const std::string csv =
        "date,open,high,low,close,volume\n"
        "2021-01-04,100,105,99,103,1000\n";
    const auto bars = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].timestamp, parse_iso_date("2021-01-04"));
}

TEST(DataLoader_Parse, CloseOnlyRows) {
    const std::string csv =
        "date,close\n"
        "2021-01-04,103.5\n"
        "2021-01-05,104.25\r\n";
    const auto bars = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[1].close, 104.25);
    EXPECT_DOUBLE_EQ(bars[1].open, 104.25);
    EXPECT_DOUBLE_EQ(bars[1].volume, 0.0);
}

TEST(DataLoader_Parse, SkipsMalformedRows) {
    const std::string csv =
        "# exported prices\n"
        "timestamp,open,high,low,close,volume\n"
        "1,100,105,99,103,1000\n"
        "2,abc,105,99,103,1000\n"         // not a number
        "3,100,105,99,103\n"              // too few fields
        "4,100,98,99,103,1000\n"          // high < low
        "5,100,105,99,103,-1\n"           // negative volume
        "6,0,0,0,0,10\n"                  // zero close
        "7,100,105,99,nan,1000\n"         // non-finite
        "2021-02-30,100,105,99,103,1\n"   // impossible date
        "\n"
        "8,101,106,100,104,1100\n";
    const auto bars = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].timestamp, 1.0);
    EXPECT_DOUBLE_EQ(bars[1].timestamp, 8.0);
}

TEST(DataLoader_Parse, HeaderOnly_Empty) {
    EXPECT_TRUE(DataLoader::parse_csv_string("timestamp,open,high,low,close,volume\n").empty());
    EXPECT_TRUE(DataLoader::parse_csv_string("").empty());
}

// ─── validate_bar ─────────────────────────────────────────────────────────────

TEST(DataLoader_Validate, OhlcConsistency) {
    OHLCV ok{.timestamp = 1, .open = 10, .high = 12, .low = 9, .close = 11, .volume = 0};
    EXPECT_TRUE(DataLoader::validate_bar(ok));

    OHLCV bad = ok;
    bad.close = 13;
    EXPECT_FALSE(DataLoader::validate_bar(bad));

    bad = ok;
    bad.timestamp = std::nan("");
    EXPECT_FALSE(DataLoader::validate_bar(bad));
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(DataLoader_Load, MissingFile_Nullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/quantcore/prices.csv").has_value());
}
