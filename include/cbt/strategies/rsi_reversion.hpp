/**
 * @file strategies/rsi_reversion.hpp
 * @brief RSI oscillator mean reversion
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief RSI mean reversion
 *
 * ENTER when RSI(window) rises through `oversold`, EXIT when it falls
 * through `overbought`. RSI is undefined for the first `window` bars, and
 * a crossing needs the previous value too, so the earliest signal is at
 * bar window + 1.
 *
 * Options: window (14), oversold (30.0), overbought (70.0);
 * window >= 1, oversold < overbought.
 */
class RSIReversion : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(window, 14)
        CBT_PARAM(oversold, 30.0)
        CBT_PARAM(overbought, 70.0)
    CBT_PARAMS_END()

    explicit RSIReversion(const Params& params = {});
    RSIReversion(Size window, Value oversold, Value overbought);

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

    Size window() const { return window_; }
    Value oversold() const { return oversold_; }
    Value overbought() const { return overbought_; }

private:
    Size window_;
    Value oversold_;
    Value overbought_;
};

} // namespace strategies

using RSIReversion = strategies::RSIReversion;

} // namespace cbt
