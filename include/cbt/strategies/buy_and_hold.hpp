/**
 * @file strategies/buy_and_hold.hpp
 * @brief Buy & hold benchmark
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief ENTER on every bar
 *
 * The backtester opens on the first simulated bar and ignores the rest,
 * and the forced close ends the trade at the last bar.
 */
class BuyAndHold : public Strategy {
public:
    explicit BuyAndHold(const Params& params = {}) : Strategy(Params{}, params) {}

    SignalSequence generateSignals(const PriceSeries& series) const override {
        return SignalSequence(series.size(), Signal::Enter);
    }

    std::string name() const override { return "Buy & Hold (Benchmark)"; }
};

} // namespace strategies

using BuyAndHold = strategies::BuyAndHold;

} // namespace cbt
