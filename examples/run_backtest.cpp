/**
 * @file run_backtest.cpp
 * @brief Run the strategy roster over a CSV price file and compare results
 *
 * Usage: run_backtest <prices.csv> [start-date] [end-date] [output-dir]
 *
 * Bars before start-date are used for indicator warm-up only.
 */

#include "cbt/cryptobt.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

std::vector<cbt::StrategyPtr> roster() {
    std::vector<cbt::StrategyPtr> strategies;
    strategies.push_back(cbt::makeStrategy("buy_and_hold"));
    strategies.push_back(cbt::makeStrategy("ema_crossover",
        cbt::ParamsBuilder().add("fast_window", 50).add("slow_window", 200)));
    strategies.push_back(cbt::makeStrategy("sma_crossover",
        cbt::ParamsBuilder().add("fast_window", 50).add("slow_window", 200)));
    strategies.push_back(cbt::makeStrategy("rsi_reversion",
        cbt::ParamsBuilder().add("window", 14).add("oversold", 30.0).add("overbought", 70.0)));
    strategies.push_back(cbt::makeStrategy("bollinger_reversion",
        cbt::ParamsBuilder().add("window", 20).add("devfactor", 2.0).add("use_rsi", true)));
    strategies.push_back(cbt::makeStrategy("bollinger_reversion",
        cbt::ParamsBuilder().add("window", 20).add("devfactor", 2.0).add("use_rsi", false)));
    strategies.push_back(cbt::makeStrategy("macd_crossover"));
    strategies.push_back(cbt::makeStrategy("donchian_breakout",
        cbt::ParamsBuilder().add("window", 20)));
    return strategies;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <prices.csv> [start-date] [end-date] [output-dir]\n";
        return 2;
    }

    try {
        cbt::CsvPriceFeed feed(argv[1]);
        feed.setSymbol(std::filesystem::path(argv[1]).stem().string());
        cbt::PriceSeries series = feed.load();

        cbt::BacktestConfig config;
        if (argc > 2) config.startTime = cbt::parseTimestamp(argv[2]);
        if (argc > 3) config.endTime = cbt::parseTimestamp(argv[3]);
        const std::string outDir = argc > 4 ? argv[4] : ".";

        auto strategies = roster();
        std::vector<const cbt::Strategy*> pointers;
        for (const auto& s : strategies) pointers.push_back(s.get());

        std::cout << "=== cryptobt " << cbt::version() << " ===" << std::endl;
        std::cout << "Data: " << series.symbol() << ", " << series.size() << " bars" << std::endl;

        cbt::ThreadPool pool;
        auto results = cbt::runStrategies(series, pointers, config, pool);

        cbt::ReportWriter writer;
        std::vector<std::pair<std::string, cbt::PerformanceReport>> rows;
        std::filesystem::create_directories(outDir);
        const std::string summaryPath = (std::filesystem::path(outDir) / "results.txt").string();
        std::ofstream summary(summaryPath);
        if (!summary.is_open()) {
            throw cbt::IoError("cannot write " + summaryPath);
        }

        for (cbt::Size i = 0; i < results.size(); ++i) {
            const std::string name = strategies[i]->name();
            writer.writeSummary(std::cout, name, results[i].report);
            writer.writeSummary(summary, name, results[i].report);
            rows.emplace_back(name, results[i].report);
        }

        std::cout << std::endl;
        writer.writeComparison(std::cout, rows);
        std::cout << std::endl << "Results saved to " << summaryPath << std::endl;

    } catch (const std::invalid_argument& e) {
        std::cerr << "bad date argument: " << e.what() << std::endl;
        return 2;
    } catch (const cbt::BacktestError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
