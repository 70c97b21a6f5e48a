/**
 * @file report.hpp
 * @brief Trade records and performance report
 *
 * The report is derived once from the final trade list and equity curve of
 * a run; nothing here is updated incrementally.
 */

#pragma once

#include "cbt/common.hpp"
#include <vector>

namespace cbt {

/**
 * @brief A completed entry/exit pair
 *
 * Indices refer to the full price series the run was given.
 * Invariant: exitIndex > entryIndex.
 */
struct Trade {
    Size entryIndex = 0;
    Size exitIndex = 0;
    Timestamp entryTime = 0;
    Timestamp exitTime = 0;
    Value entryPrice = 0;
    Value exitPrice = 0;
    Value returnPct = 0;       ///< fraction, commission included
    bool forcedClose = false;  ///< closed by the end-of-series rule

    bool isWin() const { return returnPct > 0; }

    bool operator==(const Trade& o) const {
        return entryIndex == o.entryIndex && exitIndex == o.exitIndex
            && entryTime == o.entryTime && exitTime == o.exitTime
            && entryPrice == o.entryPrice && exitPrice == o.exitPrice
            && returnPct == o.returnPct && forcedClose == o.forcedClose;
    }
};

/**
 * @brief Aggregate performance of one run
 *
 * All return figures are fractions (0.25 == 25%).
 */
struct PerformanceReport {
    Value totalReturnPct = 0;    ///< prod(1 + r) - 1 over all trades
    Size numTrades = 0;
    Value winRate = 0;           ///< winning / numTrades, 0 without trades
    Value averageReturnPct = 0;  ///< arithmetic mean of trade returns

    Size winningTrades = 0;      ///< returnPct > 0
    Size losingTrades = 0;       ///< returnPct < 0
    Value bestTradePct = 0;
    Value worstTradePct = 0;
    Value profitFactor = 0;      ///< sum of gains / |sum of losses|
    Size maxWinStreak = 0;
    Size maxLossStreak = 0;
    Value maxDrawdownPct = 0;    ///< largest peak-to-trough fall of the equity curve
    Value initialCapital = 0;
    Value finalCapital = 0;

    bool operator==(const PerformanceReport& o) const;
};

/**
 * @brief Build the report for a finished run
 * @param trades final trade list
 * @param equityCurve per-bar equity over the simulated window (may be empty)
 * @param initialCapital starting capital
 */
PerformanceReport computeReport(const std::vector<Trade>& trades,
                                const std::vector<Value>& equityCurve,
                                Value initialCapital);

/**
 * @brief Largest peak-to-trough decline as a fraction of the peak
 */
Value maxDrawdown(const std::vector<Value>& equityCurve);

} // namespace cbt
