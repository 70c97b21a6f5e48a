/**
 * @file params.cpp
 * @brief Params numeric accessors and formatting
 */

#include "cbt/params.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace cbt {

std::string toString(const ParamValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
    }, value);
}

const ParamValue& Params::lookup(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw ConfigurationError("parameter not found: " + name);
    }
    return it->second;
}

long Params::getInt(const std::string& name) const {
    const ParamValue& v = lookup(name);
    if (std::holds_alternative<int>(v)) return std::get<int>(v);
    if (std::holds_alternative<long>(v)) return std::get<long>(v);
    if (std::holds_alternative<double>(v)) {
        double d = std::get<double>(v);
        // -min() is 2^63, exact as a double where max() is not
        const double lowest = static_cast<double>(std::numeric_limits<long>::min());
        if (std::isfinite(d) && d == std::floor(d) && d >= lowest && d < -lowest) {
            return static_cast<long>(d);
        }
        throw ConfigurationError("parameter must be an integer: " + name + "=" + toString(v));
    }
    throw ConfigurationError("parameter must be an integer: " + name);
}

Value Params::getNumber(const std::string& name) const {
    const ParamValue& v = lookup(name);
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<int>(v)) return static_cast<Value>(std::get<int>(v));
    if (std::holds_alternative<long>(v)) return static_cast<Value>(std::get<long>(v));
    throw ConfigurationError("parameter must be numeric: " + name);
}

void Params::merge(const Params& other) {
    // map::insert keeps an existing key untouched
    values_.insert(other.values_.begin(), other.values_.end());
}

void Params::override(const Params& other) {
    for (const auto& entry : other.values_) {
        values_[entry.first] = entry.second;
    }
}

std::vector<std::string> Params::keys() const {
    std::vector<std::string> names;
    names.reserve(values_.size());
    for (const auto& entry : values_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string Params::describe() const {
    std::ostringstream oss;
    for (auto it = values_.begin(); it != values_.end(); ++it) {
        if (it != values_.begin()) oss << ' ';
        oss << it->first << '=' << toString(it->second);
    }
    return oss.str();
}

} // namespace cbt
