/**
 * @file errors.hpp
 * @brief Exception hierarchy
 *
 * All failures are deterministic input-validity failures. They are raised at
 * the earliest point of detection (construction or run entry) and are never
 * retried.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cbt {

/**
 * @brief Common base of every cryptobt error
 */
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Invalid strategy options or run settings
 *
 * e.g. fast_window >= slow_window, a window < 1, oversold >= overbought.
 */
class ConfigurationError : public BacktestError {
public:
    explicit ConfigurationError(const std::string& what)
        : BacktestError("configuration error: " + what) {}
};

/**
 * @brief Input data that cannot be simulated
 *
 * Non-monotonic or duplicate timestamps, non-positive prices,
 * price/signal length mismatches.
 */
class DataIntegrityError : public BacktestError {
public:
    explicit DataIntegrityError(const std::string& what)
        : BacktestError("data integrity error: " + what) {}
};

/**
 * @brief Numeric guard tripped inside a calculation (division by zero)
 */
class ComputationError : public BacktestError {
public:
    explicit ComputationError(const std::string& what)
        : BacktestError("computation error: " + what) {}
};

/**
 * @brief File access or parse failure in the data / export collaborators
 */
class IoError : public BacktestError {
public:
    explicit IoError(const std::string& what)
        : BacktestError("io error: " + what) {}
};

} // namespace cbt
