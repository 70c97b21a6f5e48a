/**
 * @file strategies/bollinger_reversion.hpp
 * @brief Bollinger band mean reversion, optionally confirmed by RSI
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief Bollinger band reversion
 *
 * Level rules, evaluated on every bar:
 * - ENTER while close < lower band (and RSI < rsi_lower when use_rsi)
 * - EXIT while close > upper band (or RSI > rsi_upper when use_rsi)
 * A bar meeting both reads EXIT. Repeated ENTERs are absorbed by the
 * backtester, which never stacks positions.
 */
class BollingerReversion : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(window, 20)
        CBT_PARAM(devfactor, 2.0)
        CBT_PARAM(use_rsi, true)
        CBT_PARAM(rsi_window, 14)
        CBT_PARAM(rsi_lower, 30.0)
        CBT_PARAM(rsi_upper, 70.0)
    CBT_PARAMS_END()

    explicit BollingerReversion(const Params& params = {});

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

private:
    Size window_;
    Value devFactor_;
    bool useRsi_;
    Size rsiWindow_;
    Value rsiLower_;
    Value rsiUpper_;
};

} // namespace strategies

using BollingerReversion = strategies::BollingerReversion;

} // namespace cbt
