/**
 * @file common.hpp
 * @brief cryptobt common definitions
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <cmath>

namespace cbt {

// Version
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Basic type aliases
using Size = std::size_t;
using Value = double;            // price / return value type
using Timestamp = std::int64_t;  // epoch milliseconds, UTC

// Special values
constexpr Value NaN = std::numeric_limits<Value>::quiet_NaN();
constexpr Value Inf = std::numeric_limits<Value>::infinity();

inline bool isnan(Value v) { return std::isnan(v); }

// Disable copy
#define CBT_DISABLE_COPY(Class) \
    Class(const Class&) = delete; \
    Class& operator=(const Class&) = delete;

} // namespace cbt
