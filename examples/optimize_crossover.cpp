/**
 * @file optimize_crossover.cpp
 * @brief Grid search over SMA crossover windows
 *
 * Usage: optimize_crossover <prices.csv> [top-n]
 */

#include "cbt/cryptobt.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <prices.csv> [top-n]\n";
        return 2;
    }
    try {
        const cbt::Size topN = argc > 2 ? static_cast<cbt::Size>(std::stoul(argv[2])) : 10;
        cbt::PriceSeries series = cbt::CsvPriceFeed(argv[1]).load();

        cbt::BacktestConfig config;
        config.commission = 0.001;

        cbt::Optimizer opt("sma_crossover", config);
        opt.addParamInt("fast_window", 5, 50, 5);
        opt.addParamInt("slow_window", 20, 200, 20);

        std::cout << "Testing " << opt.totalCombinations() << " " << opt.kind()
                  << " combinations..." << std::endl;
        opt.optimize(series);
        opt.sortResults(cbt::OptSortBy::TotalReturn);

        std::cout << std::left << std::setw(36) << "Params" << std::right
                  << std::setw(12) << "Return" << std::setw(8) << "Trades"
                  << std::setw(10) << "WinRate" << std::setw(10) << "MaxDD" << std::endl;
        for (const auto& r : opt.topResults(topN)) {
            std::cout << std::left << std::setw(36) << r.describeParams() << std::right
                      << std::setw(12) << cbt::formatPercent(r.report.totalReturnPct)
                      << std::setw(8) << r.report.numTrades
                      << std::setw(10) << cbt::formatPercent(r.report.winRate)
                      << std::setw(10) << cbt::formatPercent(r.report.maxDrawdownPct) << std::endl;
        }

    } catch (const std::logic_error& e) {
        std::cerr << "bad top-n argument: " << e.what() << std::endl;
        return 2;
    } catch (const cbt::BacktestError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
