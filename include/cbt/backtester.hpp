/**
 * @file backtester.hpp
 * @brief Single-position backtesting engine
 *
 * The engine replays a signal sequence over a price series in one linear
 * pass with an explicit FLAT/LONG state machine. A run owns all of its
 * mutable state, so one Backtester may be used from several threads at once.
 */

#pragma once

#include "cbt/bar.hpp"
#include "cbt/report.hpp"
#include "cbt/signal.hpp"
#include "cbt/strategy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cbt {

/**
 * @brief Price at which ENTER / EXIT signals are filled
 */
enum class FillPolicy {
    SignalBarClose,  ///< close of the bar that produced the signal
    NextBarOpen      ///< open of the following bar
};

const char* fillPolicyName(FillPolicy policy);

/**
 * @brief Run settings
 */
struct BacktestConfig {
    Value initialCapital = 10000.0;
    Value commission = 0.0;  ///< flat fraction charged on entry and on exit
    FillPolicy fillPolicy = FillPolicy::SignalBarClose;
    std::optional<Timestamp> startTime;  ///< first simulated bar (inclusive)
    std::optional<Timestamp> endTime;    ///< last simulated bar (inclusive)

    /**
     * @throws ConfigurationError on non-positive capital, commission outside
     *         [0, 1) or start after end
     */
    void validate() const;
};

/**
 * @brief The single simulated holding
 */
struct Position {
    bool isOpen = false;
    Value entryPrice = 0;
    Size entryIndex = 0;
    Value size = 0;  ///< units bought with the capital at entry
};

/**
 * @brief Everything a run produces
 */
struct BacktestResult {
    std::vector<Trade> trades;
    PerformanceReport report;
    std::vector<Value> equityCurve;  ///< one point per simulated bar
    Size firstIndex = 0;             ///< first simulated bar
    Size lastIndex = 0;              ///< one past the last simulated bar
    Value finalCapital = 0;

    Size simulatedBars() const { return lastIndex - firstIndex; }
};

/**
 * @brief Return of one round trip after commission
 *
 * (exit * (1 - c) - entry * (1 + c)) / (entry * (1 + c))
 *
 * @throws ComputationError when entry is zero, negative or not finite
 */
Value tradeReturn(Value entryPrice, Value exitPrice, Value commission = 0.0);

/**
 * @brief Backtesting engine
 */
class Backtester {
public:
    /**
     * @throws ConfigurationError when the config is invalid
     */
    explicit Backtester(BacktestConfig config = {});

    /**
     * @brief Simulate a precomputed signal sequence
     *
     * Rules, applied bar by bar over the simulation window:
     *  - FLAT + ENTER opens a position (never on the window's last bar)
     *  - LONG + EXIT closes it and appends a Trade
     *  - every other combination is a no-op
     *  - a position still open after the last bar is closed at its close
     *
     * @throws DataIntegrityError on a length mismatch or an invalid series
     */
    BacktestResult run(const PriceSeries& series, const SignalSequence& signals) const;

    /**
     * @brief Generate the strategy's signals on the full series, then simulate
     */
    BacktestResult run(const PriceSeries& series, const Strategy& strategy) const;

    const BacktestConfig& config() const { return config_; }

private:
    BacktestConfig config_;
};

} // namespace cbt
