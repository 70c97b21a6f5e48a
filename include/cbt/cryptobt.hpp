/**
 * @file cryptobt.hpp
 * @brief cryptobt main header
 *
 * Single include for the whole library.
 */

#pragma once

// Core
#include "cbt/common.hpp"
#include "cbt/errors.hpp"
#include "cbt/params.hpp"
#include "cbt/datetime.hpp"
#include "cbt/bar.hpp"
#include "cbt/signal.hpp"

// Indicators and strategies
#include "cbt/indicators.hpp"
#include "cbt/strategy.hpp"
#include "cbt/strategies/sma_crossover.hpp"
#include "cbt/strategies/ema_crossover.hpp"
#include "cbt/strategies/rsi_reversion.hpp"
#include "cbt/strategies/macd_crossover.hpp"
#include "cbt/strategies/bollinger_reversion.hpp"
#include "cbt/strategies/donchian_breakout.hpp"
#include "cbt/strategies/buy_and_hold.hpp"

// Engine
#include "cbt/report.hpp"
#include "cbt/backtester.hpp"

// Parallel runs
#include "cbt/threadpool.hpp"
#include "cbt/optimizer.hpp"

// Collaborators
#include "cbt/log.hpp"
#include "cbt/datafeed.hpp"
#include "cbt/price_cache.hpp"
#include "cbt/writer.hpp"

#include <string>

namespace cbt {

/**
 * @brief Version string
 */
inline std::string version() {
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "."
         + std::to_string(VERSION_PATCH);
}

} // namespace cbt
