/**
 * @file strategies/rsi_reversion.cpp
 * @brief RSI mean reversion implementation
 */

#include "cbt/strategies/rsi_reversion.hpp"
#include "cbt/indicators.hpp"
#include <sstream>

namespace cbt {
namespace strategies {

RSIReversion::RSIReversion(const Params& params)
    : Strategy(getDefaultParams(), params),
      window_(windowParam("window")),
      oversold_(this->params().getNumber("oversold")),
      overbought_(this->params().getNumber("overbought")) {
    if (!std::isfinite(oversold_) || !std::isfinite(overbought_)) {
        throw ConfigurationError("oversold and overbought must be finite");
    }
    if (oversold_ >= overbought_) {
        std::ostringstream oss;
        oss << "oversold (" << oversold_ << ") must be smaller than overbought ("
            << overbought_ << ")";
        throw ConfigurationError(oss.str());
    }
}

RSIReversion::RSIReversion(Size window, Value oversold, Value overbought)
    : RSIReversion(ParamsBuilder()
        .add("window", static_cast<long>(window))
        .add("oversold", oversold)
        .add("overbought", overbought)
        .build()) {}

SignalSequence RSIReversion::generateSignals(const PriceSeries& series) const {
    return crossing::thresholds(indicators::rsi(series.closes(), window_),
                                oversold_, overbought_);
}

std::string RSIReversion::name() const {
    std::ostringstream oss;
    oss << "RSI Reversion (" << window_ << ", " << oversold_ << "/" << overbought_ << ")";
    return oss.str();
}

} // namespace strategies
} // namespace cbt
