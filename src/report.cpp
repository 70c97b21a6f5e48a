/**
 * @file report.cpp
 * @brief Performance report computation
 */

#include "cbt/report.hpp"
#include <algorithm>

namespace cbt {

bool PerformanceReport::operator==(const PerformanceReport& o) const {
    return totalReturnPct == o.totalReturnPct && numTrades == o.numTrades
        && winRate == o.winRate && averageReturnPct == o.averageReturnPct
        && winningTrades == o.winningTrades && losingTrades == o.losingTrades
        && bestTradePct == o.bestTradePct && worstTradePct == o.worstTradePct
        && profitFactor == o.profitFactor && maxWinStreak == o.maxWinStreak
        && maxLossStreak == o.maxLossStreak && maxDrawdownPct == o.maxDrawdownPct
        && initialCapital == o.initialCapital && finalCapital == o.finalCapital;
}

Value maxDrawdown(const std::vector<Value>& equityCurve) {
    Value peak = 0.0;
    Value worst = 0.0;
    for (Value equity : equityCurve) {
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - equity) / peak);
        }
    }
    return worst;
}

PerformanceReport computeReport(const std::vector<Trade>& trades,
                                const std::vector<Value>& equityCurve,
                                Value initialCapital) {
    PerformanceReport report;
    report.numTrades = trades.size();
    report.initialCapital = initialCapital;
    report.maxDrawdownPct = maxDrawdown(equityCurve);

    Value growth = 1.0;
    Value sumReturns = 0.0;
    Value grossGain = 0.0;
    Value grossLoss = 0.0;
    Size currentStreak = 0;
    bool lastWasWin = false;

    for (Size i = 0; i < trades.size(); ++i) {
        const Value r = trades[i].returnPct;
        // compounded, never summed
        growth *= (1.0 + r);
        sumReturns += r;

        if (i == 0) {
            report.bestTradePct = r;
            report.worstTradePct = r;
        } else {
            report.bestTradePct = std::max(report.bestTradePct, r);
            report.worstTradePct = std::min(report.worstTradePct, r);
        }

        if (r > 0) {
            ++report.winningTrades;
            grossGain += r;
            currentStreak = (lastWasWin && i > 0) ? currentStreak + 1 : 1;
            lastWasWin = true;
            report.maxWinStreak = std::max(report.maxWinStreak, currentStreak);
        } else if (r < 0) {
            ++report.losingTrades;
            grossLoss += -r;
            currentStreak = (!lastWasWin && i > 0) ? currentStreak + 1 : 1;
            lastWasWin = false;
            report.maxLossStreak = std::max(report.maxLossStreak, currentStreak);
        } else {
            // a flat trade breaks any streak
            currentStreak = 0;
        }
    }

    report.totalReturnPct = growth - 1.0;
    report.finalCapital = initialCapital * growth;

    if (report.numTrades > 0) {
        report.winRate = static_cast<Value>(report.winningTrades)
                       / static_cast<Value>(report.numTrades);
        report.averageReturnPct = sumReturns / static_cast<Value>(report.numTrades);
    }

    if (grossLoss > 0.0) {
        report.profitFactor = grossGain / grossLoss;
    } else {
        report.profitFactor = grossGain > 0.0 ? Inf : 0.0;
    }

    return report;
}

} // namespace cbt
