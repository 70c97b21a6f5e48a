/**
 * @file strategies/bollinger_reversion.cpp
 * @brief Bollinger reversion implementation
 */

#include "cbt/strategies/bollinger_reversion.hpp"
#include "cbt/indicators.hpp"
#include <sstream>

namespace cbt {
namespace strategies {

BollingerReversion::BollingerReversion(const Params& params)
    : Strategy(getDefaultParams(), params),
      window_(windowParam("window")),
      devFactor_(this->params().getNumber("devfactor")),
      useRsi_(this->params().get<bool>("use_rsi")),
      rsiWindow_(windowParam("rsi_window")),
      rsiLower_(this->params().getNumber("rsi_lower")),
      rsiUpper_(this->params().getNumber("rsi_upper")) {
    if (!std::isfinite(devFactor_) || devFactor_ <= 0.0) {
        throw ConfigurationError("devfactor must be positive");
    }
    if (useRsi_ && !(rsiLower_ < rsiUpper_)) {
        throw ConfigurationError("rsi_lower must be smaller than rsi_upper");
    }
}

SignalSequence BollingerReversion::generateSignals(const PriceSeries& series) const {
    const std::vector<Value> closes = series.closes();
    const indicators::Bands bands = indicators::bollinger(closes, window_, devFactor_);
    std::vector<Value> rsi;
    if (useRsi_) {
        rsi = indicators::rsi(closes, rsiWindow_);
    }

    SignalSequence signals(closes.size(), Signal::Hold);
    for (Size i = 0; i < closes.size(); ++i) {
        if (isnan(bands.mid[i]) || (useRsi_ && isnan(rsi[i]))) {
            continue;
        }

        bool enterSignal = closes[i] < bands.lower[i];
        bool exitSignal = closes[i] > bands.upper[i];
        if (useRsi_) {
            enterSignal = enterSignal && rsi[i] < rsiLower_;
            exitSignal = exitSignal || rsi[i] > rsiUpper_;
        }

        if (exitSignal) {
            signals[i] = Signal::Exit;
        } else if (enterSignal) {
            signals[i] = Signal::Enter;
        }
    }
    return signals;
}

std::string BollingerReversion::name() const {
    std::ostringstream oss;
    oss << "Bollinger (" << window_ << ", " << devFactor_ << ")";
    if (useRsi_) {
        oss << " + RSI (" << rsiWindow_ << ")";
    }
    return oss.str();
}

} // namespace strategies
} // namespace cbt
