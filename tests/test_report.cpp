/**
 * @file test_report.cpp
 * @brief PerformanceReport unit tests
 */

#include <gtest/gtest.h>
#include "cbt/report.hpp"

using namespace cbt;

namespace {

std::vector<Trade> tradesWithReturns(const std::vector<Value>& returns) {
    std::vector<Trade> trades;
    Size index = 0;
    for (Value r : returns) {
        Trade t;
        t.entryIndex = index;
        t.exitIndex = index + 1;
        t.entryPrice = 100.0;
        t.exitPrice = 100.0 * (1.0 + r);
        t.returnPct = r;
        trades.push_back(t);
        index += 2;
    }
    return trades;
}

} // namespace

TEST(ReportTest, NoTrades) {
    PerformanceReport report = computeReport({}, {}, 10000.0);

    EXPECT_EQ(report.numTrades, 0u);
    EXPECT_DOUBLE_EQ(report.winRate, 0.0);
    EXPECT_DOUBLE_EQ(report.totalReturnPct, 0.0);
    EXPECT_DOUBLE_EQ(report.averageReturnPct, 0.0);
    EXPECT_DOUBLE_EQ(report.profitFactor, 0.0);
    EXPECT_EQ(report.maxWinStreak, 0u);
    EXPECT_DOUBLE_EQ(report.finalCapital, 10000.0);
}

TEST(ReportTest, TotalReturnIsCompounded) {
    PerformanceReport report = computeReport(tradesWithReturns({0.5, 0.5}), {}, 10000.0);

    EXPECT_DOUBLE_EQ(report.totalReturnPct, 1.25);  // 1.5 * 1.5 - 1
    EXPECT_DOUBLE_EQ(report.averageReturnPct, 0.5);
    EXPECT_DOUBLE_EQ(report.finalCapital, 22500.0);
}

TEST(ReportTest, MixedTrades) {
    PerformanceReport report = computeReport(
        tradesWithReturns({0.1, 0.2, -0.05, -0.1, -0.02, 0.3}), {}, 1000.0);

    EXPECT_EQ(report.numTrades, 6u);
    EXPECT_EQ(report.winningTrades, 3u);
    EXPECT_EQ(report.losingTrades, 3u);
    EXPECT_DOUBLE_EQ(report.winRate, 0.5);
    EXPECT_DOUBLE_EQ(report.bestTradePct, 0.3);
    EXPECT_DOUBLE_EQ(report.worstTradePct, -0.1);
    EXPECT_EQ(report.maxWinStreak, 2u);
    EXPECT_EQ(report.maxLossStreak, 3u);
    EXPECT_NEAR(report.profitFactor, 0.6 / 0.17, 1e-12);

    Value growth = 1.1 * 1.2 * 0.95 * 0.9 * 0.98 * 1.3;
    EXPECT_NEAR(report.totalReturnPct, growth - 1.0, 1e-12);
    EXPECT_NEAR(report.finalCapital, 1000.0 * growth, 1e-9);
}

TEST(ReportTest, ProfitFactorWithoutLosersIsInfinite) {
    PerformanceReport report = computeReport(tradesWithReturns({0.1, 0.05}), {}, 1.0);
    EXPECT_TRUE(std::isinf(report.profitFactor));
    EXPECT_GT(report.profitFactor, 0.0);
}

TEST(ReportTest, ProfitFactorWithoutWinnersIsZero) {
    PerformanceReport report = computeReport(tradesWithReturns({-0.1, -0.05}), {}, 1.0);
    EXPECT_DOUBLE_EQ(report.profitFactor, 0.0);
    EXPECT_DOUBLE_EQ(report.winRate, 0.0);
    EXPECT_DOUBLE_EQ(report.bestTradePct, -0.05);
}

TEST(ReportTest, FlatTradeIsNeitherWinNorLossAndBreaksStreak) {
    PerformanceReport report = computeReport(tradesWithReturns({0.1, 0.0, 0.1}), {}, 1.0);

    EXPECT_EQ(report.winningTrades, 2u);
    EXPECT_EQ(report.losingTrades, 0u);
    EXPECT_EQ(report.maxWinStreak, 1u);
    EXPECT_NEAR(report.winRate, 2.0 / 3.0, 1e-15);
}

TEST(ReportTest, MaxDrawdown) {
    EXPECT_DOUBLE_EQ(maxDrawdown({}), 0.0);
    EXPECT_DOUBLE_EQ(maxDrawdown({100, 110, 120}), 0.0);
    EXPECT_DOUBLE_EQ(maxDrawdown({100, 120, 90, 130, 65}), 0.5);
}

TEST(ReportTest, DrawdownComesFromEquityCurve) {
    PerformanceReport report = computeReport(tradesWithReturns({0.2}), {100, 80, 120}, 100.0);
    EXPECT_DOUBLE_EQ(report.maxDrawdownPct, 0.2);
}

TEST(ReportTest, TradeIsWin) {
    Trade t;
    t.returnPct = 0.01;
    EXPECT_TRUE(t.isWin());
    t.returnPct = 0.0;
    EXPECT_FALSE(t.isWin());
}
