/**
 * @file strategies/macd_crossover.hpp
 * @brief MACD / signal line crossover
 */

#pragma once

#include "cbt/strategy.hpp"

namespace cbt {
namespace strategies {

/**
 * @brief MACD crossover
 *
 * ENTER when the MACD line crosses up through its signal line, EXIT on the
 * downward cross. Options: fast (12), slow (26), signal (9); all >= 1,
 * fast < slow.
 */
class MACDCrossover : public Strategy {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(fast, 12)
        CBT_PARAM(slow, 26)
        CBT_PARAM(signal, 9)
    CBT_PARAMS_END()

    explicit MACDCrossover(const Params& params = {});

    SignalSequence generateSignals(const PriceSeries& series) const override;
    std::string name() const override;

private:
    Size fast_;
    Size slow_;
    Size signal_;
};

} // namespace strategies

using MACDCrossover = strategies::MACDCrossover;

} // namespace cbt
