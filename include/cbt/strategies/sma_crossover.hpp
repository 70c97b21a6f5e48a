/**
 * @file strategies/sma_crossover.hpp
 * @brief Simple moving average crossover
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief SMA crossover
 *
 * ENTER on the bar where SMA(fast_window) of the close crosses up through
 * SMA(slow_window), EXIT on the downward cross, HOLD otherwise.
 *
 * Options: fast_window (default 50), slow_window (default 200);
 * 1 <= fast_window < slow_window.
 */
class SMACrossover : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(fast_window, 50)
        CBT_PARAM(slow_window, 200)
    CBT_PARAMS_END()

    explicit SMACrossover(const Params& params = {});
    SMACrossover(Size fastWindow, Size slowWindow);

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

    Size fastWindow() const { return fast_; }
    Size slowWindow() const { return slow_; }

private:
    Size fast_;
    Size slow_;
};

} // namespace strategies

using SMACrossover = strategies::SMACrossover;

} // namespace cbt
