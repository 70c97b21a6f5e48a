/**
 * @file strategies/donchian_breakout.hpp
 * @brief Donchian channel breakout
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief Donchian breakout
 *
 * ENTER when the close exceeds the highest high of the `window` bars ending
 * at the previous bar; EXIT when it falls below the lowest low of that
 * channel.
 */
class DonchianBreakout : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(window, 20)
    CBT_PARAMS_END()

    explicit DonchianBreakout(const Params& params = {});

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

private:
    Size window_;
};

} // namespace strategies

using DonchianBreakout = strategies::DonchianBreakout;

} // namespace cbt
