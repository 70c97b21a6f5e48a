/**
 * @file signal.hpp
 * @brief Per-bar trading signals
 *
 * A strategy emits exactly one Signal per bar, computed from bars
 * 0..i only.
 */

#pragma once

#include "cbt/common.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace cbt {

/**
 * @brief Signal enumeration
 *
 * Numeric values follow the usual +1 / -1 / 0 convention.
 */
enum class Signal : int {
    Exit = -1,   ///< Close the long position
    Hold = 0,    ///< Do nothing
    Enter = 1    ///< Open a long position
};

using SignalSequence = std::vector<Signal>;

/**
 * @brief Signal utilities
 */
namespace signal_utils {

inline std::string name(Signal s) {
    switch (s) {
        case Signal::Enter: return "ENTER";
        case Signal::Exit: return "EXIT";
        case Signal::Hold: return "HOLD";
        default: return "UNKNOWN";
    }
}

inline Signal fromInt(int v) {
    return v > 0 ? Signal::Enter : (v < 0 ? Signal::Exit : Signal::Hold);
}

inline int toInt(Signal s) { return static_cast<int>(s); }

inline Size count(const SignalSequence& signals, Signal s) {
    return static_cast<Size>(std::count(signals.begin(), signals.end(), s));
}

/**
 * @brief Indices of all bars carrying signal s
 */
inline std::vector<Size> indicesOf(const SignalSequence& signals, Signal s) {
    std::vector<Size> out;
    for (Size i = 0; i < signals.size(); ++i) {
        if (signals[i] == s) out.push_back(i);
    }
    return out;
}

/**
 * @brief Compact rendering, one character per bar: E / X / .
 */
inline std::string render(const SignalSequence& signals) {
    std::string out;
    out.reserve(signals.size());
    for (Signal s : signals) {
        out.push_back(s == Signal::Enter ? 'E' : (s == Signal::Exit ? 'X' : '.'));
    }
    return out;
}

} // namespace signal_utils

} // namespace cbt
