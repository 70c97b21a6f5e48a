/**
 * @file strategy.hpp
 * @brief Strategy interface
 *
 * A strategy is a pure function of its configuration and a price series:
 * generateSignals() returns one Signal per bar, using only the bars up to
 * and including that bar. Implementations hold no mutable state, so one
 * instance may be shared by concurrent runs.
 */

#pragma once

#include "cbt/bar.hpp"
#include "cbt/params.hpp"
#include "cbt/signal.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cbt {

/**
 * @brief Signal generator interface
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    /**
     * @brief Map a price series to a signal sequence of the same length
     */
    virtual SignalSequence generateSignals(const PriceSeries& series) const = 0;

    /**
     * @brief Display name including the key options, e.g. "SMA Crossover (50/200)"
     */
    virtual std::string name() const = 0;

    /**
     * @brief Resolved options (class defaults overridden by user values)
     */
    const Params& params() const { return params_; }

protected:
    Strategy(const Params& defaults, const Params& user)
        : params_(resolveParams(defaults, user)) {}

    /**
     * @brief Window-type option: integer >= 1
     */
    Size windowParam(const std::string& key) const;

private:
    Params params_;
};

using StrategyPtr = std::unique_ptr<Strategy>;

/**
 * @brief Crossing rules shared by the indicator strategies
 *
 * A bar where any involved value (current or previous) is NaN emits HOLD.
 */
namespace crossing {

/**
 * @brief ENTER where fast goes from strictly below slow to at-or-above,
 *        EXIT where it goes from strictly above to at-or-below
 */
SignalSequence crossover(const std::vector<Value>& fast, const std::vector<Value>& slow);

/**
 * @brief ENTER where the oscillator rises through `lower`,
 *        EXIT where it falls through `upper`
 */
SignalSequence thresholds(const std::vector<Value>& oscillator, Value lower, Value upper);

} // namespace crossing

/**
 * @brief Create a strategy by kind name
 *
 * Kinds: sma_crossover, ema_crossover, rsi_reversion, macd_crossover,
 * bollinger_reversion, donchian_breakout, buy_and_hold.
 *
 * @throws ConfigurationError for an unknown kind or invalid options
 */
StrategyPtr makeStrategy(const std::string& kind, const Params& params = {});

/**
 * @brief Kind names accepted by makeStrategy()
 */
std::vector<std::string> availableStrategies();

} // namespace cbt
