/**
 * @file writer.cpp
 * @brief Result export
 */

#include "cbt/writer.hpp"
#include "cbt/datetime.hpp"
#include "cbt/errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cbt {

namespace {

const char* const kSeparator = "========================================";
const char* const kRule = "----------------------------------------";

std::ofstream openForWrite(const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IoError("cannot write " + path);
    }
    return file;
}

std::string formatValue(Value v) {
    std::ostringstream oss;
    if (std::isinf(v)) {
        oss << (v > 0 ? "inf" : "-inf");
    } else {
        oss << std::fixed << std::setprecision(2) << v;
    }
    return oss.str();
}

} // namespace

std::string formatPercent(Value fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

std::string ReportWriter::formatTime(Timestamp ts) const {
    return options_.isoTimes ? formatTimestamp(ts) : std::to_string(ts);
}

void ReportWriter::writeTrades(std::ostream& out, const std::vector<Trade>& trades) const {
    const char sep = options_.csvsep;
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    out << "Index" << sep << "EntryTime" << sep << "ExitTime" << sep
        << "EntryIndex" << sep << "ExitIndex" << sep
        << "EntryPrice" << sep << "ExitPrice" << sep << "ReturnPct" << sep << "Forced\n";

    for (Size i = 0; i < trades.size(); ++i) {
        const Trade& t = trades[i];
        out << i << sep << formatTime(t.entryTime) << sep << formatTime(t.exitTime) << sep
            << t.entryIndex << sep << t.exitIndex << sep
            << std::setprecision(10) << t.entryPrice << sep << t.exitPrice << sep
            << std::fixed << std::setprecision(4) << t.returnPct * 100.0 << sep
            << (t.forcedClose ? 1 : 0) << '\n';
        out.unsetf(std::ios_base::floatfield);
    }
    out.flags(flags);
    out.precision(precision);
}

void ReportWriter::writeEquity(std::ostream& out, const PriceSeries& series,
                               const BacktestResult& result) const {
    const char sep = options_.csvsep;
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    out << "DateTime" << sep << "Equity" << sep << "DrawDown\n";

    Value peak = 0.0;
    for (Size k = 0; k < result.equityCurve.size(); ++k) {
        const Value equity = result.equityCurve[k];
        peak = std::max(peak, equity);
        const Value dd = peak > 0.0 ? (peak - equity) / peak * 100.0 : 0.0;

        out << formatTime(series[result.firstIndex + k].timestamp) << sep
            << std::fixed << std::setprecision(2) << equity << sep << dd << '\n';
    }
    out.flags(flags);
    out.precision(precision);
}

void ReportWriter::writeSummary(std::ostream& out, const std::string& strategyName,
                                const PerformanceReport& report) const {
    const std::string indent(static_cast<Size>(options_.indent), ' ');
    auto row = [&](const char* key, const std::string& value) {
        out << indent << std::setw(20) << std::left << key << ": " << value << "\n";
    };

    out << kSeparator << "\n";
    out << strategyName << "\n";
    out << kRule << "\n";
    row("Total Return", formatPercent(report.totalReturnPct));
    row("Trades", std::to_string(report.numTrades));
    row("Win Rate", formatPercent(report.winRate));
    row("Average Return", formatPercent(report.averageReturnPct));
    row("Won / Lost", std::to_string(report.winningTrades) + " / " + std::to_string(report.losingTrades));
    row("Best Trade", formatPercent(report.bestTradePct));
    row("Worst Trade", formatPercent(report.worstTradePct));
    row("Profit Factor", formatValue(report.profitFactor));
    row("Win Streak", std::to_string(report.maxWinStreak));
    row("Loss Streak", std::to_string(report.maxLossStreak));
    row("Max Drawdown", formatPercent(report.maxDrawdownPct));
    row("Final Capital", formatValue(report.finalCapital));
    out << kSeparator << "\n";
    out << std::right;
}

void ReportWriter::writeComparison(std::ostream& out,
                                   const std::vector<std::pair<std::string, PerformanceReport>>& rows) const {
    Size nameWidth = 8;
    for (const auto& [name, _] : rows) {
        nameWidth = std::max(nameWidth, name.size());
    }

    out << std::left << std::setw(static_cast<int>(nameWidth)) << "Strategy" << std::right
        << std::setw(12) << "Return" << std::setw(8) << "Trades"
        << std::setw(10) << "WinRate" << std::setw(12) << "AvgReturn"
        << std::setw(12) << "MaxDD" << std::setw(14) << "FinalCapital" << "\n";

    for (const auto& [name, report] : rows) {
        out << std::left << std::setw(static_cast<int>(nameWidth)) << name << std::right
            << std::setw(12) << formatPercent(report.totalReturnPct)
            << std::setw(8) << report.numTrades
            << std::setw(10) << formatPercent(report.winRate)
            << std::setw(12) << formatPercent(report.averageReturnPct)
            << std::setw(12) << formatPercent(report.maxDrawdownPct)
            << std::setw(14) << formatValue(report.finalCapital) << "\n";
    }
}

void ReportWriter::writeTrades(const std::string& path, const std::vector<Trade>& trades) const {
    auto file = openForWrite(path);
    writeTrades(file, trades);
}

void ReportWriter::writeEquity(const std::string& path, const PriceSeries& series,
                               const BacktestResult& result) const {
    auto file = openForWrite(path);
    writeEquity(file, series, result);
}

void ReportWriter::writeSummary(const std::string& path, const std::string& strategyName,
                                const PerformanceReport& report) const {
    auto file = openForWrite(path);
    writeSummary(file, strategyName, report);
}

} // namespace cbt
