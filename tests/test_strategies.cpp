/**
 * @file test_strategies.cpp
 * @brief Strategy unit tests
 */

#include <gtest/gtest.h>
#include "cbt/indicators.hpp"
#include "cbt/strategy.hpp"
#include "cbt/strategies/sma_crossover.hpp"
#include "cbt/strategies/ema_crossover.hpp"
#include "cbt/strategies/rsi_reversion.hpp"
#include "cbt/strategies/macd_crossover.hpp"
#include "cbt/strategies/bollinger_reversion.hpp"
#include "cbt/strategies/donchian_breakout.hpp"
#include "cbt/strategies/buy_and_hold.hpp"
#include <cmath>

using namespace cbt;

class StrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<Value> closes;
        for (int i = 0; i < 300; ++i) {
            closes.push_back(1000.0 + 80.0 * std::sin(i * 0.07) + 20.0 * std::sin(i * 0.31));
        }
        wave_ = PriceSeries::fromCloses(closes);
    }

    static void expectLeadingHolds(const SignalSequence& signals, Size count) {
        ASSERT_GE(signals.size(), count);
        for (Size i = 0; i < count; ++i) {
            EXPECT_EQ(signals[i], Signal::Hold) << "bar " << i;
        }
    }

    PriceSeries wave_;
};

// ==================== Crossing rules ====================

TEST(CrossingTest, CrossoverNeedsStrictPreviousSide) {
    std::vector<Value> fast = {1, 2, 2, 3, 1};
    std::vector<Value> slow = {2, 2, 2, 2, 2};
    // i=1: 1<2 -> 2>=2 enter; i=2: equal before, no cross; i=4: 3>2 -> 1<=2 exit
    EXPECT_EQ(signal_utils::render(crossing::crossover(fast, slow)), ".E..X");
}

TEST(CrossingTest, CrossoverHoldsAroundNaN) {
    std::vector<Value> fast = {1, 3, 1, 3};
    std::vector<Value> slow = {NaN, 2, NaN, 2};
    EXPECT_EQ(signal_utils::render(crossing::crossover(fast, slow)), "....");
}

TEST(CrossingTest, Thresholds) {
    std::vector<Value> osc = {50, 25, 35, 75, 65, NaN, 20};
    EXPECT_EQ(signal_utils::render(crossing::thresholds(osc, 30, 70)), "..E.X..");
}

// ==================== SMA Crossover ====================

TEST_F(StrategyTest, SMACrossoverSmallExample) {
    SMACrossover strategy(1, 2);
    PriceSeries s = PriceSeries::fromCloses({10, 11, 9, 8, 12, 15});

    SignalSequence signals = strategy.generateSignals(s);
    ASSERT_EQ(signals.size(), s.size());
    // slow is undefined at bar 0; bar 2: 11 > 10.5 then 9 <= 10; bar 4: 8 < 8.5 then 12 >= 10
    EXPECT_EQ(signal_utils::render(signals), "..X.E.");
}

TEST_F(StrategyTest, SMACrossoverWarmup) {
    SMACrossover strategy(10, 30);
    SignalSequence signals = strategy.generateSignals(wave_);

    ASSERT_EQ(signals.size(), wave_.size());
    expectLeadingHolds(signals, 29);
    EXPECT_GT(signal_utils::count(signals, Signal::Enter), 0u);
    EXPECT_GT(signal_utils::count(signals, Signal::Exit), 0u);
}

TEST_F(StrategyTest, SMACrossoverRejectsBadWindows) {
    EXPECT_THROW(SMACrossover(5, 3), ConfigurationError);
    EXPECT_THROW(SMACrossover(3, 3), ConfigurationError);
    EXPECT_THROW(SMACrossover(0, 3), ConfigurationError);

    Params p;
    p.set("fast_window", -2);
    EXPECT_THROW(SMACrossover{p}, ConfigurationError);

    Params fractional;
    fractional.set("fast_window", 2.5);
    EXPECT_THROW(SMACrossover{fractional}, ConfigurationError);

    Params huge;
    huge.set("slow_window", 1e300);
    EXPECT_THROW(SMACrossover{huge}, ConfigurationError);
}

TEST_F(StrategyTest, SMACrossoverDefaultsAndName) {
    SMACrossover strategy;
    EXPECT_EQ(strategy.fastWindow(), 50u);
    EXPECT_EQ(strategy.slowWindow(), 200u);
    EXPECT_EQ(strategy.name(), "SMA Crossover (50/200)");

    Params p;
    p.set("fast_window", 20.0);
    SMACrossover fromDouble(p);
    EXPECT_EQ(fromDouble.fastWindow(), 20u);
    EXPECT_EQ(fromDouble.slowWindow(), 200u);
}

TEST_F(StrategyTest, SMACrossoverShortSeries) {
    SMACrossover strategy(2, 5);
    EXPECT_TRUE(strategy.generateSignals(PriceSeries()).empty());
    EXPECT_EQ(signal_utils::render(strategy.generateSignals(PriceSeries::fromCloses({1, 2, 3}))), "...");
}

// ==================== EMA Crossover ====================

TEST_F(StrategyTest, EMACrossover) {
    EMACrossover strategy(12, 26);
    SignalSequence signals = strategy.generateSignals(wave_);

    expectLeadingHolds(signals, 25);
    EXPECT_GT(signal_utils::count(signals, Signal::Enter), 0u);
    EXPECT_EQ(strategy.name(), "EMA Crossover (12/26)");
    EXPECT_THROW(EMACrossover(26, 12), ConfigurationError);
}

// ==================== RSI Reversion ====================

TEST_F(StrategyTest, RSIReversionSignals) {
    RSIReversion strategy(14, 30, 70);
    SignalSequence signals = strategy.generateSignals(wave_);

    expectLeadingHolds(signals, 14);

    std::vector<Value> rsi = indicators::rsi(wave_.closes(), 14);
    for (Size i : signal_utils::indicesOf(signals, Signal::Enter)) {
        EXPECT_LT(rsi[i - 1], 30.0);
        EXPECT_GE(rsi[i], 30.0);
    }
    for (Size i : signal_utils::indicesOf(signals, Signal::Exit)) {
        EXPECT_GT(rsi[i - 1], 70.0);
        EXPECT_LE(rsi[i], 70.0);
    }
}

TEST_F(StrategyTest, RSIReversionRejectsBadConfig) {
    EXPECT_THROW(RSIReversion(14, 70, 30), ConfigurationError);
    EXPECT_THROW(RSIReversion(14, 50, 50), ConfigurationError);
    EXPECT_THROW(RSIReversion(0, 30, 70), ConfigurationError);
    EXPECT_THROW(RSIReversion(14, NaN, 70), ConfigurationError);
}

TEST_F(StrategyTest, RSIReversionDefaults) {
    RSIReversion strategy;
    EXPECT_EQ(strategy.window(), 14u);
    EXPECT_DOUBLE_EQ(strategy.oversold(), 30.0);
    EXPECT_DOUBLE_EQ(strategy.overbought(), 70.0);
    EXPECT_EQ(strategy.name(), "RSI Reversion (14, 30/70)");
}

// ==================== MACD Crossover ====================

TEST_F(StrategyTest, MACDCrossoverEntersAfterTrough) {
    // accelerating decline, then a steady rise
    std::vector<Value> closes;
    for (int i = 0; i < 60; ++i) closes.push_back(200.0 - 0.02 * i * i);
    const Value trough = closes.back();
    for (int i = 1; i <= 60; ++i) closes.push_back(trough + 1.5 * i);

    MACDCrossover strategy;
    SignalSequence signals = strategy.generateSignals(PriceSeries::fromCloses(closes));

    expectLeadingHolds(signals, 26 + 9 - 1);
    auto enters = signal_utils::indicesOf(signals, Signal::Enter);
    ASSERT_FALSE(enters.empty());
    EXPECT_GE(enters.back(), 60u);
    EXPECT_EQ(strategy.name(), "MACD Crossover (12/26/9)");
}

TEST_F(StrategyTest, MACDCrossoverRejectsBadConfig) {
    Params p;
    p.set("fast", 26);
    p.set("slow", 12);
    EXPECT_THROW(MACDCrossover{p}, ConfigurationError);

    Params zero;
    zero.set("signal", 0);
    EXPECT_THROW(MACDCrossover{zero}, ConfigurationError);
}

// ==================== Bollinger Reversion ====================

TEST_F(StrategyTest, BollingerEntersBelowAndExitsAboveBands) {
    std::vector<Value> closes(20, 100.0);
    closes.push_back(90.0);
    closes.push_back(120.0);

    Params p;
    p.set("use_rsi", false);
    BollingerReversion strategy(p);

    EXPECT_EQ(signal_utils::render(strategy.generateSignals(PriceSeries::fromCloses(closes))),
              std::string(20, '.') + "EX");
    EXPECT_EQ(strategy.name(), "Bollinger (20, 2)");
}

TEST_F(StrategyTest, BollingerRsiOverboughtForcesExit) {
    std::vector<Value> closes;
    for (int i = 0; i < 40; ++i) closes.push_back(100.0 + i);

    BollingerReversion strategy;
    SignalSequence signals = strategy.generateSignals(PriceSeries::fromCloses(closes));

    expectLeadingHolds(signals, 19);
    for (Size i = 19; i < signals.size(); ++i) {
        EXPECT_EQ(signals[i], Signal::Exit) << "bar " << i;
    }
    EXPECT_EQ(strategy.name(), "Bollinger (20, 2) + RSI (14)");
}

TEST_F(StrategyTest, BollingerRejectsBadConfig) {
    Params dev;
    dev.set("devfactor", 0.0);
    EXPECT_THROW(BollingerReversion{dev}, ConfigurationError);

    Params rsi;
    rsi.set("rsi_lower", 80.0);
    EXPECT_THROW(BollingerReversion{rsi}, ConfigurationError);

    // thresholds are irrelevant without the RSI filter
    rsi.set("use_rsi", false);
    EXPECT_NO_THROW(BollingerReversion{rsi});
}

// ==================== Donchian Breakout ====================

TEST_F(StrategyTest, DonchianUsesPreviousChannel) {
    DonchianBreakout strategy(ParamsBuilder().add("window", 2).build());
    PriceSeries s = PriceSeries::fromCloses({10, 10, 10, 12, 9});

    EXPECT_EQ(signal_utils::render(strategy.generateSignals(s)), "...EX");
    EXPECT_EQ(strategy.name(), "Donchian Breakout (2)");
}

TEST_F(StrategyTest, DonchianRejectsZeroWindow) {
    EXPECT_THROW(DonchianBreakout(ParamsBuilder().add("window", 0).build()), ConfigurationError);
}

// ==================== Buy & Hold ====================

TEST_F(StrategyTest, BuyAndHoldEntersEverywhere) {
    BuyAndHold strategy;
    SignalSequence signals = strategy.generateSignals(wave_);

    EXPECT_EQ(signal_utils::count(signals, Signal::Enter), wave_.size());
    EXPECT_EQ(strategy.name(), "Buy & Hold (Benchmark)");
}

// ==================== Factory ====================

TEST(StrategyFactoryTest, CreatesEveryKind) {
    auto kinds = availableStrategies();
    EXPECT_EQ(kinds.size(), 7u);

    PriceSeries s = PriceSeries::fromCloses(std::vector<Value>(250, 50.0));
    for (const auto& kind : kinds) {
        StrategyPtr strategy = makeStrategy(kind);
        ASSERT_NE(strategy, nullptr) << kind;
        EXPECT_EQ(strategy->generateSignals(s).size(), s.size()) << kind;
    }
}

TEST(StrategyFactoryTest, PassesParams) {
    StrategyPtr strategy = makeStrategy("sma_crossover",
        ParamsBuilder().add("fast_window", 1).add("slow_window", 2).build());
    EXPECT_EQ(strategy->name(), "SMA Crossover (1/2)");
    EXPECT_EQ(strategy->params().getInt("fast_window"), 1);
}

TEST(StrategyFactoryTest, ResolvesDefaults) {
    StrategyPtr strategy = makeStrategy("rsi_reversion", ParamsBuilder().add("window", 21).build());
    EXPECT_EQ(strategy->params().getInt("window"), 21);
    EXPECT_DOUBLE_EQ(strategy->params().getNumber("oversold"), 30.0);
}

TEST(StrategyFactoryTest, RejectsUnknownKindAndBadParams) {
    EXPECT_THROW(makeStrategy("moon_phase"), ConfigurationError);
    EXPECT_THROW(makeStrategy("sma_crossover",
        ParamsBuilder().add("fast_window", 5).add("slow_window", 3).build()), ConfigurationError);
}

TEST_F(StrategyTest, GenerateSignalsIsRepeatable) {
    for (const auto& kind : availableStrategies()) {
        StrategyPtr strategy = makeStrategy(kind);
        EXPECT_EQ(strategy->generateSignals(wave_), strategy->generateSignals(wave_)) << kind;
    }
}
