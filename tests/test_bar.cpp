/**
 * @file test_bar.cpp
 * @brief PriceSeries, DateTime and Signal unit tests
 */

#include <gtest/gtest.h>
#include "cbt/bar.hpp"
#include "cbt/datetime.hpp"
#include "cbt/errors.hpp"
#include "cbt/signal.hpp"

using namespace cbt;

namespace {

Bar makeBar(Timestamp ts, Value close, Value volume = 1.0) {
    Bar bar;
    bar.timestamp = ts;
    bar.open = close;
    bar.high = close + 1.0;
    bar.low = close - 1.0;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

} // namespace

// ==================== DateTime ====================

TEST(DateTimeTest, ParseDate) {
    DateTime dt = DateTime::parse("2024-01-01");
    EXPECT_EQ(dt.year, 2024);
    EXPECT_EQ(dt.month, 1);
    EXPECT_EQ(dt.day, 1);
    EXPECT_EQ(dt.toTimestamp(), 1704067200000LL);
}

TEST(DateTimeTest, ParseDateTimeForms) {
    const Timestamp expected = 1582979445000LL;
    EXPECT_EQ(parseTimestamp("2020-02-29 12:30:45"), expected);
    EXPECT_EQ(parseTimestamp("2020-02-29T12:30:45"), expected);
    EXPECT_EQ(parseTimestamp("2020-02-29T12:30:45Z"), expected);
    EXPECT_EQ(parseTimestamp("2020-02-29T12:30:45.250Z"), expected + 250);
}

TEST(DateTimeTest, RejectsMalformedInput) {
    EXPECT_THROW(DateTime::parse("2024/01/01"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2024-01-01 10:00"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2024-01-01 10:00:00+02"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse(""), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2024-02-30"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("2024-04-31 00:00:00"), std::invalid_argument);
    EXPECT_THROW(DateTime::parse("1900-02-29"), std::invalid_argument);
}

TEST(DateTimeTest, AcceptsLeapDays) {
    EXPECT_EQ(DateTime::parse("2024-02-29").day, 29);
    EXPECT_EQ(DateTime::parse("2000-02-29").day, 29);
    EXPECT_EQ(DateTime::parse("2023-12-31").day, 31);
}

TEST(DateTimeTest, FromTimestampBeforeEpoch) {
    DateTime dt = DateTime::fromTimestamp(-1000);
    EXPECT_EQ(dt.year, 1969);
    EXPECT_EQ(dt.month, 12);
    EXPECT_EQ(dt.day, 31);
    EXPECT_EQ(dt.hour, 23);
    EXPECT_EQ(dt.minute, 59);
    EXPECT_EQ(dt.second, 59);
}

TEST(DateTimeTest, FormatRoundTrip) {
    EXPECT_EQ(formatTimestamp(1704067200000LL), "2024-01-01");
    EXPECT_EQ(formatTimestamp(1582979445000LL), "2020-02-29 12:30:45");
}

TEST(DateTimeTest, Ordering) {
    DateTime a(2024, 1, 1);
    DateTime b(2024, 1, 1, 0, 0, 1);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_EQ(a, DateTime::parse("2024-01-01"));
}

// ==================== PriceSeries ====================

TEST(PriceSeriesTest, FromCloses) {
    PriceSeries s = PriceSeries::fromCloses({10, 11, 12}, 1000, 60000);

    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0].timestamp, 1000);
    EXPECT_EQ(s[2].timestamp, 121000);
    EXPECT_DOUBLE_EQ(s[1].open, 11.0);
    EXPECT_DOUBLE_EQ(s[1].close, 11.0);
    EXPECT_NO_THROW(s.validate());
}

TEST(PriceSeriesTest, ColumnExtraction) {
    PriceSeries s({makeBar(1, 10, 5), makeBar(2, 20, 6)}, "BTC/USDT", "1d");

    std::vector<Value> closes = {10, 20};
    std::vector<Value> highs = {11, 21};
    std::vector<Value> lows = {9, 19};
    std::vector<Timestamp> times = {1, 2};
    EXPECT_EQ(s.closes(), closes);
    EXPECT_EQ(s.highs(), highs);
    EXPECT_EQ(s.lows(), lows);
    EXPECT_EQ(s.timestamps(), times);
    EXPECT_EQ(s.symbol(), "BTC/USDT");
    EXPECT_EQ(s.timeframe(), "1d");
}

TEST(PriceSeriesTest, HeadAndSlice) {
    PriceSeries s = PriceSeries::fromCloses({1, 2, 3, 4, 5});
    s.setSymbol("ETH/USDT");

    PriceSeries h = s.head(3);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_DOUBLE_EQ(h.back().close, 3.0);
    EXPECT_EQ(h.symbol(), "ETH/USDT");

    EXPECT_EQ(s.head(100).size(), 5u);

    PriceSeries mid = s.slice(1, 4);
    ASSERT_EQ(mid.size(), 3u);
    EXPECT_DOUBLE_EQ(mid.front().close, 2.0);
    EXPECT_DOUBLE_EQ(mid.back().close, 4.0);

    EXPECT_TRUE(s.slice(4, 2).empty());
}

TEST(PriceSeriesTest, EmptyAndSingleBarAreValid) {
    EXPECT_NO_THROW(PriceSeries().validate());
    EXPECT_NO_THROW(PriceSeries::fromCloses({42}).validate());
}

TEST(PriceSeriesTest, RejectsDuplicateTimestamp) {
    PriceSeries s({makeBar(1000, 10), makeBar(1000, 11)});
    EXPECT_THROW(s.validate(), DataIntegrityError);
}

TEST(PriceSeriesTest, RejectsDecreasingTimestamp) {
    PriceSeries s({makeBar(2000, 10), makeBar(1000, 11)});
    EXPECT_THROW(s.validate(), DataIntegrityError);
}

TEST(PriceSeriesTest, RejectsBadPrices) {
    PriceSeries zero({makeBar(1, 10), makeBar(2, 0.5)});
    Bar b = zero[1];
    b.low = 0.0;
    PriceSeries zeroLow({zero[0], b});
    EXPECT_THROW(zeroLow.validate(), DataIntegrityError);

    PriceSeries negative = PriceSeries::fromCloses({10, -1});
    EXPECT_THROW(negative.validate(), DataIntegrityError);

    PriceSeries nan = PriceSeries::fromCloses({10, NaN});
    EXPECT_THROW(nan.validate(), DataIntegrityError);
}

TEST(PriceSeriesTest, RejectsNegativeVolume) {
    PriceSeries s({makeBar(1, 10, 1.0), makeBar(2, 11, -1.0)});
    EXPECT_THROW(s.validate(), DataIntegrityError);
}

TEST(PriceSeriesTest, ErrorMessageNamesTheBar) {
    PriceSeries s({makeBar(0, 10), makeBar(0, 11)});
    try {
        s.validate();
        FAIL() << "expected DataIntegrityError";
    } catch (const DataIntegrityError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("data integrity error"), std::string::npos);
        EXPECT_NE(what.find("bar 1"), std::string::npos);
    }
}

TEST(PriceSeriesTest, Bounds) {
    PriceSeries s = PriceSeries::fromCloses({1, 2, 3, 4}, 100, 10);  // 100, 110, 120, 130

    EXPECT_EQ(s.lowerBound(0), 0u);
    EXPECT_EQ(s.lowerBound(110), 1u);
    EXPECT_EQ(s.lowerBound(111), 2u);
    EXPECT_EQ(s.lowerBound(1000), 4u);

    EXPECT_EQ(s.upperBound(99), 0u);
    EXPECT_EQ(s.upperBound(110), 2u);
    EXPECT_EQ(s.upperBound(1000), 4u);
}

// ==================== Signal ====================

TEST(SignalTest, Utilities) {
    SignalSequence s = {Signal::Hold, Signal::Enter, Signal::Hold, Signal::Exit, Signal::Enter};

    EXPECT_EQ(signal_utils::count(s, Signal::Enter), 2u);
    EXPECT_EQ(signal_utils::count(s, Signal::Exit), 1u);
    EXPECT_EQ(signal_utils::indicesOf(s, Signal::Enter), (std::vector<Size>{1, 4}));
    EXPECT_EQ(signal_utils::render(s), ".E.XE");
    EXPECT_EQ(signal_utils::name(Signal::Exit), "EXIT");
    EXPECT_EQ(signal_utils::toInt(Signal::Exit), -1);
    EXPECT_EQ(signal_utils::fromInt(3), Signal::Enter);
    EXPECT_EQ(signal_utils::fromInt(0), Signal::Hold);
}
