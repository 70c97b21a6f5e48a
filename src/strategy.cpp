/**
 * @file strategy.cpp
 * @brief Strategy helpers, crossing rules and factory
 */

#include "cbt/strategy.hpp"
#include "cbt/strategies/sma_crossover.hpp"
#include "cbt/strategies/ema_crossover.hpp"
#include "cbt/strategies/rsi_reversion.hpp"
#include "cbt/strategies/macd_crossover.hpp"
#include "cbt/strategies/bollinger_reversion.hpp"
#include "cbt/strategies/donchian_breakout.hpp"
#include "cbt/strategies/buy_and_hold.hpp"
#include <algorithm>
#include <functional>
#include <map>

namespace cbt {

Size Strategy::windowParam(const std::string& key) const {
    long value = params_.getInt(key);
    if (value < 1) {
        throw ConfigurationError(key + " must be >= 1, got " + std::to_string(value));
    }
    return static_cast<Size>(value);
}

namespace crossing {

SignalSequence crossover(const std::vector<Value>& fast, const std::vector<Value>& slow) {
    const Size n = std::min(fast.size(), slow.size());
    SignalSequence signals(n, Signal::Hold);

    for (Size i = 1; i < n; ++i) {
        Value f0 = fast[i - 1], s0 = slow[i - 1];
        Value f1 = fast[i], s1 = slow[i];
        if (isnan(f0) || isnan(s0) || isnan(f1) || isnan(s1)) {
            continue;
        }
        if (f0 < s0 && f1 >= s1) {
            signals[i] = Signal::Enter;
        } else if (f0 > s0 && f1 <= s1) {
            signals[i] = Signal::Exit;
        }
    }
    return signals;
}

SignalSequence thresholds(const std::vector<Value>& oscillator, Value lower, Value upper) {
    SignalSequence signals(oscillator.size(), Signal::Hold);

    for (Size i = 1; i < oscillator.size(); ++i) {
        Value prev = oscillator[i - 1];
        Value curr = oscillator[i];
        if (isnan(prev) || isnan(curr)) {
            continue;
        }
        if (prev < lower && curr >= lower) {
            signals[i] = Signal::Enter;
        } else if (prev > upper && curr <= upper) {
            signals[i] = Signal::Exit;
        }
    }
    return signals;
}

} // namespace crossing

namespace {

using Factory = std::function<StrategyPtr(const Params&)>;

template<typename StrategyT>
Factory factoryFor() {
    return [](const Params& params) -> StrategyPtr {
        return std::make_unique<StrategyT>(params);
    };
}

const std::map<std::string, Factory>& registry() {
    static const std::map<std::string, Factory> factories = {
        {"sma_crossover", factoryFor<strategies::SMACrossover>()},
        {"ema_crossover", factoryFor<strategies::EMACrossover>()},
        {"rsi_reversion", factoryFor<strategies::RSIReversion>()},
        {"macd_crossover", factoryFor<strategies::MACDCrossover>()},
        {"bollinger_reversion", factoryFor<strategies::BollingerReversion>()},
        {"donchian_breakout", factoryFor<strategies::DonchianBreakout>()},
        {"buy_and_hold", factoryFor<strategies::BuyAndHold>()},
    };
    return factories;
}

} // namespace

StrategyPtr makeStrategy(const std::string& kind, const Params& params) {
    const auto& factories = registry();
    auto it = factories.find(kind);
    if (it == factories.end()) {
        throw ConfigurationError("unknown strategy kind: " + kind);
    }
    return it->second(params);
}

std::vector<std::string> availableStrategies() {
    std::vector<std::string> kinds;
    for (const auto& [kind, _] : registry()) {
        kinds.push_back(kind);
    }
    return kinds;
}

} // namespace cbt
