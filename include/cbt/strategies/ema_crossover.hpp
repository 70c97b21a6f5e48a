/**
 * @file strategies/ema_crossover.hpp
 * @brief Exponential moving average crossover
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief EMA crossover
 *
 * Same crossing rule as SMACrossover on EMA(fast_window) / EMA(slow_window).
 */
class EMACrossover : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(fast_window, 50)
        CBT_PARAM(slow_window, 200)
    CBT_PARAMS_END()

    explicit EMACrossover(const Params& params = {});
    EMACrossover(Size fastWindow, Size slowWindow);

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

    Size fastWindow() const { return fast_; }
    Size slowWindow() const { return slow_; }

private:
    Size fast_;
    Size slow_;
};

} // namespace strategies

using EMACrossover = strategies::EMACrossover;

} // namespace cbt
