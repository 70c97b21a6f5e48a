/**
 * @file params.hpp
 * @brief Named-option system for strategies and feeds
 *
 * - class defaults declared with CBT_PARAMS_BEGIN / CBT_PARAM / CBT_PARAMS_END
 * - user values override defaults
 * - numeric accessors that report bad options as ConfigurationError
 */

#pragma once

#include "cbt/common.hpp"
#include "cbt/errors.hpp"
#include <string>
#include <map>
#include <vector>
#include <variant>
#include <type_traits>

namespace cbt {

/**
 * @brief Parameter value type
 */
using ParamValue = std::variant<
    bool,
    int,
    long,
    double,
    std::string,
    std::nullptr_t
>;

/**
 * @brief Render a parameter value for names and reports
 */
std::string toString(const ParamValue& value);

/**
 * @brief Named options, kept sorted by name
 */
class Params {
public:
    Params() = default;

    template<typename T>
    void set(const std::string& name, T value) {
        values_[name] = ParamValue(value);
    }

    void set(const std::string& name, const char* value) {
        values_[name] = ParamValue(std::string(value));
    }

    /**
     * @brief Value of exactly type T
     * @throws ConfigurationError when missing or held as another type
     */
    template<typename T>
    T get(const std::string& name) const {
        const ParamValue& v = lookup(name);
        if (!std::holds_alternative<T>(v)) {
            throw ConfigurationError("parameter has unexpected type: " + name);
        }
        return std::get<T>(v);
    }

    template<typename T>
    T get(const std::string& name, T fallback) const {
        auto it = values_.find(name);
        if (it != values_.end() && std::holds_alternative<T>(it->second)) {
            return std::get<T>(it->second);
        }
        return fallback;
    }

    /**
     * @brief Integer option; accepts int, long and integral doubles
     */
    long getInt(const std::string& name) const;

    /**
     * @brief Numeric option; accepts int, long and double
     */
    Value getNumber(const std::string& name) const;

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    /// Fill in keys missing here from other
    void merge(const Params& other);

    /// Replace keys here with the values from other
    void override(const Params& other);

    std::vector<std::string> keys() const;

    Size size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    /**
     * @brief "name=value" pairs joined by spaces
     */
    std::string describe() const;

    static Params fromMap(const std::map<std::string, ParamValue>& values) {
        Params p;
        p.values_ = values;
        return p;
    }

private:
    const ParamValue& lookup(const std::string& name) const;

    std::map<std::string, ParamValue> values_;
};

/**
 * @brief Fluent parameter builder
 */
class ParamsBuilder {
public:
    ParamsBuilder() = default;

    template<typename T>
    ParamsBuilder& add(const std::string& name, T value) {
        params_.set(name, value);
        return *this;
    }

    Params build() const { return params_; }

    operator Params() const { return params_; }

private:
    Params params_;
};

/**
 * @brief Defaults overridden by user values
 */
inline Params resolveParams(const Params& defaults, const Params& user) {
    Params resolved = defaults;
    resolved.override(user);
    return resolved;
}

// Class default parameters
#define CBT_PARAMS_BEGIN() \
    static ::cbt::Params getDefaultParams() { \
        return ::cbt::ParamsBuilder()

#define CBT_PARAM(name, value) \
        .add(#name, value)

#define CBT_PARAMS_END() \
        .build(); \
    }

// Usage:
// class MyStrategy : public Strategy {
// public:
//     CBT_PARAMS_BEGIN()
//         CBT_PARAM(window, 14)
//         CBT_PARAM(devfactor, 2.0)
//     CBT_PARAMS_END()
// };

} // namespace cbt
