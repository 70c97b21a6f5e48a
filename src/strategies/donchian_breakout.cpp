/**
 * @file strategies/donchian_breakout.cpp
 * @brief Donchian breakout implementation
 */

#include "cbt/strategies/donchian_breakout.hpp"
#include "cbt/indicators.hpp"

namespace cbt {
namespace strategies {

DonchianBreakout::DonchianBreakout(const Params& params)
    : Strategy(getDefaultParams(), params),
      window_(windowParam("window")) {}

SignalSequence DonchianBreakout::generateSignals(const PriceSeries& series) const {
    const std::vector<Value> closes = series.closes();
    const std::vector<Value> upper = indicators::rollingMax(series.highs(), window_);
    const std::vector<Value> lower = indicators::rollingMin(series.lows(), window_);

    SignalSequence signals(closes.size(), Signal::Hold);
    for (Size i = 1; i < closes.size(); ++i) {
        // channel of the previous bar: the current bar cannot break itself
        if (isnan(upper[i - 1]) || isnan(lower[i - 1])) {
            continue;
        }
        if (closes[i] < lower[i - 1]) {
            signals[i] = Signal::Exit;
        } else if (closes[i] > upper[i - 1]) {
            signals[i] = Signal::Enter;
        }
    }
    return signals;
}

std::string DonchianBreakout::name() const {
    return "Donchian Breakout (" + std::to_string(window_) + ")";
}

} // namespace strategies
} // namespace cbt
