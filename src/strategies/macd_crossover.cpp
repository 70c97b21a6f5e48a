/**
 * @file strategies/macd_crossover.cpp
 * @brief MACD crossover implementation
 */

#include "cbt/strategies/macd_crossover.hpp"
#include "cbt/indicators.hpp"

namespace cbt {
namespace strategies {

MACDCrossover::MACDCrossover(const Params& params)
    : Strategy(getDefaultParams(), params),
      fast_(windowParam("fast")),
      slow_(windowParam("slow")),
      signal_(windowParam("signal")) {
    if (fast_ >= slow_) {
        throw ConfigurationError("fast (" + std::to_string(fast_)
            + ") must be smaller than slow (" + std::to_string(slow_) + ")");
    }
}

SignalSequence MACDCrossover::generateSignals(const PriceSeries& series) const {
    indicators::MacdLines lines = indicators::macd(series.closes(), fast_, slow_, signal_);
    return crossing::crossover(lines.macd, lines.signal);
}

std::string MACDCrossover::name() const {
    return "MACD Crossover (" + std::to_string(fast_) + "/" + std::to_string(slow_)
        + "/" + std::to_string(signal_) + ")";
}

} // namespace strategies
} // namespace cbt
