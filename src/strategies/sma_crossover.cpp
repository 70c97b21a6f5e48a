/**
 * @file strategies/sma_crossover.cpp
 * @brief SMA crossover implementation
 */

#include "cbt/strategies/sma_crossover.hpp"
#include "cbt/indicators.hpp"

namespace cbt {
namespace strategies {

SMACrossover::SMACrossover(const Params& params)
    : Strategy(getDefaultParams(), params),
      fast_(windowParam("fast_window")),
      slow_(windowParam("slow_window")) {
    if (fast_ >= slow_) {
        throw ConfigurationError("fast_window (" + std::to_string(fast_)
            + ") must be smaller than slow_window (" + std::to_string(slow_) + ")");
    }
}

SMACrossover::SMACrossover(Size fastWindow, Size slowWindow)
    : SMACrossover(ParamsBuilder()
        .add("fast_window", static_cast<long>(fastWindow))
        .add("slow_window", static_cast<long>(slowWindow))
        .build()) {}

SignalSequence SMACrossover::generateSignals(const PriceSeries& series) const {
    std::vector<Value> closes = series.closes();
    return crossing::crossover(indicators::sma(closes, fast_),
                               indicators::sma(closes, slow_));
}

std::string SMACrossover::name() const {
    return "SMA Crossover (" + std::to_string(fast_) + "/" + std::to_string(slow_) + ")";
}

} // namespace strategies
} // namespace cbt
