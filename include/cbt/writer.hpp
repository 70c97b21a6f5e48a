/**
 * @file writer.hpp
 * @brief Result export
 *
 * Output of backtest results for the orchestration side:
 * - CSV trade log
 * - CSV equity curve with running drawdown
 * - summary block per strategy and a comparison table
 *
 * The engine itself never writes anything.
 */

#pragma once

#include "cbt/backtester.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace cbt {

/**
 * @brief Formats BacktestResult / PerformanceReport for humans and spreadsheets
 */
class ReportWriter {
public:
    struct Options {
        char csvsep = ',';
        int indent = 2;
        bool isoTimes = true;  ///< ISO dates instead of epoch milliseconds
    };

    ReportWriter() = default;
    explicit ReportWriter(const Options& options) : options_(options) {}

    /**
     * @brief One row per trade; ReturnPct in percent
     */
    void writeTrades(std::ostream& out, const std::vector<Trade>& trades) const;

    /**
     * @brief One row per simulated bar: time, equity, drawdown in percent
     */
    void writeEquity(std::ostream& out, const PriceSeries& series, const BacktestResult& result) const;

    /**
     * @brief Summary block for one strategy
     */
    void writeSummary(std::ostream& out, const std::string& strategyName,
                      const PerformanceReport& report) const;

    /**
     * @brief Side-by-side table, one row per strategy
     */
    void writeComparison(std::ostream& out,
                         const std::vector<std::pair<std::string, PerformanceReport>>& rows) const;

    // File variants; IoError when the file cannot be written
    void writeTrades(const std::string& path, const std::vector<Trade>& trades) const;
    void writeEquity(const std::string& path, const PriceSeries& series, const BacktestResult& result) const;
    void writeSummary(const std::string& path, const std::string& strategyName,
                      const PerformanceReport& report) const;

    Options& options() { return options_; }
    const Options& options() const { return options_; }

private:
    std::string formatTime(Timestamp ts) const;

    Options options_;
};

/**
 * @brief Fraction as a percentage with two decimals, e.g. 0.25 -> "25.00%"
 */
std::string formatPercent(Value fraction);

} // namespace cbt
