/**
 * @file strategies/ema_crossover.cpp
 * @brief EMA crossover implementation
 */

#include "cbt/strategies/ema_crossover.hpp"
#include "cbt/indicators.hpp"

namespace cbt {
namespace strategies {

EMACrossover::EMACrossover(const Params& params)
    : Strategy(getDefaultParams(), params),
      fast_(windowParam("fast_window")),
      slow_(windowParam("slow_window")) {
    if (fast_ >= slow_) {
        throw ConfigurationError("fast_window (" + std::to_string(fast_)
            + ") must be smaller than slow_window (" + std::to_string(slow_) + ")");
    }
}

EMACrossover::EMACrossover(Size fastWindow, Size slowWindow)
    : EMACrossover(ParamsBuilder()
        .add("fast_window", static_cast<long>(fastWindow))
        .add("slow_window", static_cast<long>(slowWindow))
        .build()) {}

SignalSequence EMACrossover::generateSignals(const PriceSeries& series) const {
    std::vector<Value> closes = series.closes();
    return crossing::crossover(indicators::ema(closes, fast_),
                               indicators::ema(closes, slow_));
}

std::string EMACrossover::name() const {
    return "EMA Crossover (" + std::to_string(fast_) + "/" + std::to_string(slow_) + ")";
}

} // namespace strategies
} // namespace cbt
