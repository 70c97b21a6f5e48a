/**
 * @file indicators.cpp
 * @brief Indicator implementations
 */

#include "cbt/indicators.hpp"
#include <algorithm>

namespace cbt {
namespace indicators {

namespace {

Value windowSum(const std::vector<Value>& data, Size end, Size window) {
    Value sum = 0.0;
    for (Size i = end + 1 - window; i <= end; ++i) {
        sum += data[i];
    }
    return sum;
}

} // namespace

std::vector<Value> sma(const std::vector<Value>& data, Size window) {
    std::vector<Value> result(data.size(), NaN);
    if (window == 0) return result;

    // Each window is summed from scratch so a value never depends on how
    // much of the series follows it.
    const Value divisor = static_cast<Value>(window);
    for (Size i = window - 1; i < data.size(); ++i) {
        result[i] = windowSum(data, i, window) / divisor;
    }
    return result;
}

std::vector<Value> ema(const std::vector<Value>& data, Size period) {
    std::vector<Value> result(data.size(), NaN);
    if (period == 0 || data.size() < period) return result;

    const Value alpha = 2.0 / (static_cast<Value>(period) + 1.0);
    const Value oneMinusAlpha = 1.0 - alpha;

    result[period - 1] = windowSum(data, period - 1, period) / static_cast<Value>(period);
    for (Size i = period; i < data.size(); ++i) {
        result[i] = alpha * data[i] + oneMinusAlpha * result[i - 1];
    }
    return result;
}

std::vector<Value> rsi(const std::vector<Value>& data, Size period) {
    std::vector<Value> result(data.size(), NaN);
    if (period == 0 || data.size() <= period) return result;

    const Value alpha = 1.0 / static_cast<Value>(period);
    Value avgGain = 0.0;
    Value avgLoss = 0.0;

    for (Size i = 1; i < data.size(); ++i) {
        Value change = data[i] - data[i - 1];
        Value gain = change > 0 ? change : 0.0;
        Value loss = change < 0 ? -change : 0.0;

        if (i < period) {
            avgGain += gain;
            avgLoss += loss;
            continue;
        }
        if (i == period) {
            avgGain = (avgGain + gain) / static_cast<Value>(period);
            avgLoss = (avgLoss + loss) / static_cast<Value>(period);
        } else {
            // Wilder smoothing
            avgGain = alpha * gain + (1.0 - alpha) * avgGain;
            avgLoss = alpha * loss + (1.0 - alpha) * avgLoss;
        }

        if (avgLoss == 0.0 && avgGain == 0.0) {
            result[i] = 50.0;
        } else if (avgLoss == 0.0) {
            result[i] = 100.0;
        } else {
            Value rs = avgGain / avgLoss;
            result[i] = 100.0 - 100.0 / (1.0 + rs);
        }
    }
    return result;
}

std::vector<Value> rollingStdDev(const std::vector<Value>& data, Size window) {
    std::vector<Value> result(data.size(), NaN);
    if (window == 0) return result;

    for (Size i = window - 1; i < data.size(); ++i) {
        Value mean = windowSum(data, i, window) / static_cast<Value>(window);
        Value sumSq = 0.0;
        for (Size j = i + 1 - window; j <= i; ++j) {
            Value diff = data[j] - mean;
            sumSq += diff * diff;
        }
        result[i] = std::sqrt(sumSq / static_cast<Value>(window));
    }
    return result;
}

std::vector<Value> rollingMax(const std::vector<Value>& data, Size window) {
    std::vector<Value> result(data.size(), NaN);
    if (window == 0) return result;

    for (Size i = window - 1; i < data.size(); ++i) {
        result[i] = *std::max_element(data.begin() + (i + 1 - window), data.begin() + i + 1);
    }
    return result;
}

std::vector<Value> rollingMin(const std::vector<Value>& data, Size window) {
    std::vector<Value> result(data.size(), NaN);
    if (window == 0) return result;

    for (Size i = window - 1; i < data.size(); ++i) {
        result[i] = *std::min_element(data.begin() + (i + 1 - window), data.begin() + i + 1);
    }
    return result;
}

Bands bollinger(const std::vector<Value>& data, Size period, Value devFactor) {
    Bands bands;
    bands.mid = sma(data, period);
    std::vector<Value> sd = rollingStdDev(data, period);

    bands.upper.assign(data.size(), NaN);
    bands.lower.assign(data.size(), NaN);
    for (Size i = 0; i < data.size(); ++i) {
        if (isnan(bands.mid[i])) continue;
        bands.upper[i] = bands.mid[i] + devFactor * sd[i];
        bands.lower[i] = bands.mid[i] - devFactor * sd[i];
    }
    return bands;
}

MacdLines macd(const std::vector<Value>& data, Size fastPeriod, Size slowPeriod, Size signalPeriod) {
    const Size len = data.size();
    MacdLines lines;
    lines.macd.assign(len, NaN);
    lines.signal.assign(len, NaN);
    lines.histogram.assign(len, NaN);
    if (fastPeriod == 0 || slowPeriod == 0 || signalPeriod == 0 || len < slowPeriod) {
        return lines;
    }

    std::vector<Value> fastEMA = ema(data, fastPeriod);
    std::vector<Value> slowEMA = ema(data, slowPeriod);

    for (Size i = 0; i < len; ++i) {
        if (!isnan(fastEMA[i]) && !isnan(slowEMA[i])) {
            lines.macd[i] = fastEMA[i] - slowEMA[i];
        }
    }

    // Signal line: EMA over the defined part of the MACD line
    const Size firstValid = std::max(fastPeriod, slowPeriod) - 1;
    std::vector<Value> validMacd(lines.macd.begin() + firstValid, lines.macd.end());
    std::vector<Value> validSignal = ema(validMacd, signalPeriod);
    for (Size i = 0; i < validSignal.size(); ++i) {
        lines.signal[firstValid + i] = validSignal[i];
    }

    for (Size i = 0; i < len; ++i) {
        if (!isnan(lines.macd[i]) && !isnan(lines.signal[i])) {
            lines.histogram[i] = lines.macd[i] - lines.signal[i];
        }
    }
    return lines;
}

} // namespace indicators
} // namespace cbt
