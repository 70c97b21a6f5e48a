/**
 * @file test_optimizer.cpp
 * @brief ThreadPool, ParameterGrid, Optimizer and parallel run tests
 */

#include <gtest/gtest.h>
#include "cbt/optimizer.hpp"
#include "cbt/strategies/sma_crossover.hpp"
#include "cbt/strategies/rsi_reversion.hpp"
#include "cbt/strategies/buy_and_hold.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <random>
#include <thread>

using namespace cbt;

namespace {

PriceSeries noisyTrend(Size n) {
    std::mt19937 gen(42);
    std::normal_distribution<Value> noise(0.0, 1.5);

    std::vector<Value> closes;
    for (Size i = 0; i < n; ++i) {
        closes.push_back(100.0 + 0.05 * static_cast<Value>(i)
                         + 10.0 * std::sin(static_cast<Value>(i) * 0.05) + noise(gen));
    }
    return PriceSeries::fromCloses(closes);
}

} // namespace

// ============================================================================
// ThreadPool
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<ThreadPool>(4);
    }

    std::unique_ptr<ThreadPool> pool;
};

TEST_F(ThreadPoolTest, BasicSubmit) {
    auto future = pool->submit([]() { return 42; });
    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(pool->size(), 4u);
}

TEST_F(ThreadPoolTest, MultipleSubmits) {
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool->submit([i]() { return i * 2; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
}

TEST_F(ThreadPoolTest, MapKeepsInputOrder) {
    std::vector<int> inputs;
    for (int i = 0; i < 50; ++i) inputs.push_back(i);

    auto results = pool->map([](int x) {
        // later items finish first
        std::this_thread::sleep_for(std::chrono::microseconds(50 * (50 - x)));
        return x * x;
    }, inputs);

    ASSERT_EQ(results.size(), inputs.size());
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(results[i], i * i);
    }
}

TEST_F(ThreadPoolTest, MapRethrowsTaskException) {
    std::vector<int> inputs = {1, 2, 3};
    EXPECT_THROW(pool->map([](int x) -> int {
        if (x == 2) throw ConfigurationError("bad item");
        return x;
    }, inputs), ConfigurationError);
}

TEST_F(ThreadPoolTest, WaitAll) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool->submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++counter;
        });
    }

    pool->waitAll();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool->pendingTasks(), 0u);
    EXPECT_EQ(pool->activeJobs(), 0u);
}

// ============================================================================
// ParameterGrid
// ============================================================================

TEST(ParameterGridTest, SingleParam) {
    ParameterGrid grid;
    grid.addParamInt("window", 10, 15);
    EXPECT_EQ(grid.generate().size(), 6u);
}

TEST(ParameterGridTest, LastParamVariesFastest) {
    ParameterGrid grid;
    grid.addParamInt("fast_window", 1, 2);
    grid.addParam("slow_window", std::vector<ParamValue>{10, 20, 30});

    auto combos = grid.generate();
    ASSERT_EQ(combos.size(), 6u);
    EXPECT_EQ(std::get<int>(combos[0].at("fast_window")), 1);
    EXPECT_EQ(std::get<int>(combos[0].at("slow_window")), 10);
    EXPECT_EQ(std::get<int>(combos[1].at("slow_window")), 20);
    EXPECT_EQ(std::get<int>(combos[3].at("fast_window")), 2);
    EXPECT_EQ(std::get<int>(combos[3].at("slow_window")), 10);
}

TEST(ParameterGridTest, DoubleRangeIncludesEnd) {
    ParameterGrid grid;
    grid.addParam("devfactor", 1.0, 2.0, 0.1);

    auto combos = grid.generate();
    ASSERT_EQ(combos.size(), 11u);
    EXPECT_NEAR(std::get<double>(combos.back().at("devfactor")), 2.0, 1e-9);
}

TEST(ParameterGridTest, TotalCombinations) {
    ParameterGrid grid;
    EXPECT_EQ(grid.totalCombinations(), 0u);
    EXPECT_TRUE(grid.generate().empty());

    grid.addParamInt("a", 1, 5);
    grid.addParamInt("b", 1, 3);
    grid.addParamInt("c", 1, 2);
    EXPECT_EQ(grid.totalCombinations(), 30u);

    grid.clear();
    EXPECT_EQ(grid.totalCombinations(), 0u);
}

TEST(ParameterGridTest, RejectsNonPositiveStep) {
    ParameterGrid grid;
    EXPECT_THROW(grid.addParamInt("a", 1, 5, 0), ConfigurationError);
    EXPECT_THROW(grid.addParam("b", 1.0, 2.0, -0.5), ConfigurationError);
}

// ============================================================================
// Optimizer
// ============================================================================

TEST(OptimizerTest, UnknownKindRejected) {
    EXPECT_THROW(Optimizer("does_not_exist"), ConfigurationError);
}

TEST(OptimizerTest, GridSearchKeepsOrderAndRecordsInvalidCombinations) {
    PriceSeries series = noisyTrend(400);

    Optimizer opt("sma_crossover", BacktestConfig{}, OptConfig{3});
    opt.addParam("fast_window", std::vector<ParamValue>{2, 5, 10});
    opt.addParam("slow_window", std::vector<ParamValue>{5, 20});
    EXPECT_EQ(opt.totalCombinations(), 6u);

    const auto& results = opt.optimize(series);
    ASSERT_EQ(results.size(), 6u);

    // (2,5) (2,20) (5,5) (5,20) (10,5) (10,20)
    EXPECT_TRUE(results[0].valid);
    EXPECT_TRUE(results[1].valid);
    EXPECT_FALSE(results[2].valid);
    EXPECT_TRUE(results[3].valid);
    EXPECT_FALSE(results[4].valid);
    EXPECT_TRUE(results[5].valid);
    EXPECT_NE(results[2].error.find("fast_window"), std::string::npos);
    EXPECT_EQ(results[1].strategyName, "SMA Crossover (2/20)");

    // each grid point is an ordinary backtest
    BacktestResult direct = Backtester().run(series, SMACrossover(2, 20));
    EXPECT_EQ(results[1].report, direct.report);
}

TEST(OptimizerTest, SortAndTopResults) {
    PriceSeries series = noisyTrend(400);

    Optimizer opt("sma_crossover");
    opt.addParamInt("fast_window", 2, 10, 4);
    opt.addParamInt("slow_window", 6, 30, 8);
    opt.optimize(series);
    opt.sortResults(OptSortBy::TotalReturn);

    const auto& results = opt.results();
    bool seenInvalid = false;
    for (Size i = 0; i < results.size(); ++i) {
        if (!results[i].valid) {
            seenInvalid = true;
            continue;
        }
        EXPECT_FALSE(seenInvalid) << "valid result after an invalid one";
        if (i > 0 && results[i - 1].valid) {
            EXPECT_GE(results[i - 1].report.totalReturnPct, results[i].report.totalReturnPct);
        }
    }

    auto top = opt.topResults(3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].params, results[0].params);

    opt.sortResults(OptSortBy::MaxDrawdown);
    EXPECT_LE(opt.results()[0].report.maxDrawdownPct, opt.results()[1].report.maxDrawdownPct);
}

TEST(OptimizerTest, BaseParamsApplyToEveryCombination) {
    PriceSeries series = noisyTrend(200);

    Optimizer opt("rsi_reversion");
    opt.setBaseParams(ParamsBuilder().add("oversold", 40.0).add("overbought", 60.0).build());
    opt.addParamInt("window", 5, 9, 2);
    const auto& results = opt.optimize(series);

    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        ASSERT_TRUE(r.valid);
        EXPECT_NE(r.strategyName.find("40/60"), std::string::npos);
    }
    EXPECT_EQ(results[0].describeParams(), "window=5");
}

TEST(OptimizerTest, DataErrorsAbortTheSearch) {
    PriceSeries broken = PriceSeries::fromCloses({10, 11, 12}, 0, 0);

    Optimizer opt("sma_crossover");
    opt.addParamInt("fast_window", 1, 2);
    opt.addParamInt("slow_window", 3, 3);
    EXPECT_THROW(opt.optimize(broken), DataIntegrityError);
}

// ============================================================================
// runStrategies
// ============================================================================

TEST(RunStrategiesTest, MatchesSequentialRuns) {
    PriceSeries series = noisyTrend(300);
    SMACrossover sma(5, 20);
    RSIReversion rsi(14, 30, 70);
    BuyAndHold hold;
    std::vector<const Strategy*> strategies = {&sma, &rsi, &hold};

    ThreadPool pool(3);
    BacktestConfig config;
    config.commission = 0.001;
    auto results = runStrategies(series, strategies, config, pool);

    ASSERT_EQ(results.size(), 3u);
    Backtester backtester(config);
    for (Size i = 0; i < strategies.size(); ++i) {
        BacktestResult expected = backtester.run(series, *strategies[i]);
        EXPECT_EQ(results[i].trades, expected.trades) << strategies[i]->name();
        EXPECT_EQ(results[i].report, expected.report) << strategies[i]->name();
    }
}
