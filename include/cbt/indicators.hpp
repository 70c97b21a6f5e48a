/**
 * @file indicators.hpp
 * @brief Vectorised technical indicators
 *
 * Every function maps an input column to an output column of the same
 * length. Output i depends on inputs 0..i only, and positions where the
 * indicator is not yet defined hold NaN.
 */

#pragma once

#include "cbt/common.hpp"
#include <vector>

namespace cbt {
namespace indicators {

/**
 * @brief Simple moving average; first window-1 values are NaN
 */
std::vector<Value> sma(const std::vector<Value>& data, Size window);

/**
 * @brief Exponential moving average
 *
 * alpha = 2 / (period + 1), seeded with the SMA of the first period values.
 */
std::vector<Value> ema(const std::vector<Value>& data, Size period);

/**
 * @brief Relative Strength Index (0..100)
 *
 * Wilder smoothing: the first average gain/loss is the simple mean of the
 * first `period` changes, then avg = (avg * (period - 1) + x) / period.
 * First defined value is at index `period`. A window with no movement at
 * all reads 50; a window with no losses reads 100.
 */
std::vector<Value> rsi(const std::vector<Value>& data, Size period);

/**
 * @brief Rolling population standard deviation
 */
std::vector<Value> rollingStdDev(const std::vector<Value>& data, Size window);

/**
 * @brief Rolling maximum
 */
std::vector<Value> rollingMax(const std::vector<Value>& data, Size window);

/**
 * @brief Rolling minimum
 */
std::vector<Value> rollingMin(const std::vector<Value>& data, Size window);

/**
 * @brief Bollinger bands
 */
struct Bands {
    std::vector<Value> mid;
    std::vector<Value> upper;
    std::vector<Value> lower;
};

Bands bollinger(const std::vector<Value>& data, Size period, Value devFactor);

/**
 * @brief MACD lines
 */
struct MacdLines {
    std::vector<Value> macd;       // fast EMA - slow EMA
    std::vector<Value> signal;     // EMA of macd
    std::vector<Value> histogram;  // macd - signal
};

MacdLines macd(const std::vector<Value>& data, Size fastPeriod, Size slowPeriod, Size signalPeriod);

} // namespace indicators
} // namespace cbt
