/**
 * @file backtester.cpp
 * @brief Backtesting engine implementation
 */

#include "cbt/backtester.hpp"
#include "cbt/errors.hpp"
#include <string>

namespace cbt {

const char* fillPolicyName(FillPolicy policy) {
    switch (policy) {
        case FillPolicy::SignalBarClose: return "signal_bar_close";
        case FillPolicy::NextBarOpen: return "next_bar_open";
    }
    return "unknown";
}

void BacktestConfig::validate() const {
    if (!std::isfinite(initialCapital) || initialCapital <= 0.0) {
        throw ConfigurationError("initial_capital must be > 0, got " + std::to_string(initialCapital));
    }
    if (!std::isfinite(commission) || commission < 0.0 || commission >= 1.0) {
        throw ConfigurationError("commission must lie in [0, 1), got " + std::to_string(commission));
    }
    if (startTime && endTime && *startTime > *endTime) {
        throw ConfigurationError("start_time " + std::to_string(*startTime)
                                 + " is after end_time " + std::to_string(*endTime));
    }
}

Value tradeReturn(Value entryPrice, Value exitPrice, Value commission) {
    if (!std::isfinite(entryPrice) || entryPrice <= 0.0) {
        throw ComputationError("entry price must be positive, got " + std::to_string(entryPrice));
    }
    const Value cost = entryPrice * (1.0 + commission);
    const Value proceeds = exitPrice * (1.0 - commission);
    return (proceeds - cost) / cost;
}

Backtester::Backtester(BacktestConfig config) : config_(std::move(config)) {
    config_.validate();
}

namespace {

// Mutable state of one run
struct Simulation {
    const PriceSeries& series;
    Value commission;
    Value capital;
    Position position;
    std::vector<Trade> trades;

    void open(Size index, Value price) {
        position.isOpen = true;
        position.entryIndex = index;
        position.entryPrice = price;
        position.size = capital / price;
    }

    void close(Size index, Value price, bool forced) {
        Trade trade;
        trade.entryIndex = position.entryIndex;
        trade.exitIndex = index;
        trade.entryTime = series[position.entryIndex].timestamp;
        trade.exitTime = series[index].timestamp;
        trade.entryPrice = position.entryPrice;
        trade.exitPrice = price;
        trade.returnPct = tradeReturn(position.entryPrice, price, commission);
        trade.forcedClose = forced;

        capital *= (1.0 + trade.returnPct);
        trades.push_back(trade);
        position = Position{};
    }

    Value equityAt(Size index) const {
        if (!position.isOpen) {
            return capital;
        }
        return capital * (series[index].close / position.entryPrice);
    }
};

} // namespace

BacktestResult Backtester::run(const PriceSeries& series, const SignalSequence& signals) const {
    if (series.size() != signals.size()) {
        throw DataIntegrityError("price series has " + std::to_string(series.size())
                                 + " bars but signal sequence has " + std::to_string(signals.size()));
    }
    series.validate();

    BacktestResult result;
    result.firstIndex = config_.startTime ? series.lowerBound(*config_.startTime) : 0;
    result.lastIndex = config_.endTime ? series.upperBound(*config_.endTime) : series.size();
    if (result.lastIndex < result.firstIndex) {
        result.lastIndex = result.firstIndex;
    }

    const Size first = result.firstIndex;
    const Size last = result.lastIndex;
    const bool nextBarOpen = config_.fillPolicy == FillPolicy::NextBarOpen;

    Simulation sim{series, config_.commission, config_.initialCapital, Position{}, {}};
    result.equityCurve.reserve(last - first);

    // Signal waiting for the next bar's open (NextBarOpen only)
    Signal pending = Signal::Hold;

    for (Size i = first; i < last; ++i) {
        if (pending == Signal::Enter && !sim.position.isOpen) {
            sim.open(i, series[i].open);
        } else if (pending == Signal::Exit && sim.position.isOpen) {
            sim.close(i, series[i].open, false);
        }
        pending = Signal::Hold;

        const Signal signal = signals[i];
        if (signal == Signal::Enter && !sim.position.isOpen) {
            // The fill bar must leave at least one bar for the exit
            const Size fillIndex = nextBarOpen ? i + 1 : i;
            if (fillIndex + 1 < last) {
                if (nextBarOpen) {
                    pending = Signal::Enter;
                } else {
                    sim.open(i, series[i].close);
                }
            }
        } else if (signal == Signal::Exit && sim.position.isOpen) {
            if (!nextBarOpen) {
                sim.close(i, series[i].close, false);
            } else if (i + 1 < last) {
                pending = Signal::Exit;
            }
        }

        result.equityCurve.push_back(sim.equityAt(i));
    }

    if (sim.position.isOpen) {
        sim.close(last - 1, series[last - 1].close, true);
        result.equityCurve.back() = sim.capital;
    }

    result.trades = std::move(sim.trades);
    result.finalCapital = sim.capital;
    result.report = computeReport(result.trades, result.equityCurve, config_.initialCapital);
    return result;
}

BacktestResult Backtester::run(const PriceSeries& series, const Strategy& strategy) const {
    return run(series, strategy.generateSignals(series));
}

} // namespace cbt
