/**
 * @file bar.hpp
 * @brief OHLCV bar and price series
 */

#pragma once

#include "cbt/common.hpp"
#include <string>
#include <utility>
#include <vector>

namespace cbt {

/**
 * @brief One OHLCV observation for a fixed time interval
 */
struct Bar {
    Timestamp timestamp = 0;
    Value open = 0;
    Value high = 0;
    Value low = 0;
    Value close = 0;
    Value volume = 0;

    bool operator==(const Bar& o) const {
        return timestamp == o.timestamp && open == o.open && high == o.high
            && low == o.low && close == o.close && volume == o.volume;
    }
};

/**
 * @brief Ordered sequence of bars for one symbol and timeframe
 *
 * Construction does not check ordering; validate() does, and the
 * Backtester calls it on entry. Empty and single-bar series are valid.
 */
class PriceSeries {
public:
    PriceSeries() = default;

    explicit PriceSeries(std::vector<Bar> bars,
                         std::string symbol = "",
                         std::string timeframe = "")
        : bars_(std::move(bars)), symbol_(std::move(symbol)), timeframe_(std::move(timeframe)) {}

    /**
     * @brief Build a series from closing prices (open = high = low = close)
     * @param start timestamp of the first bar
     * @param step spacing between bars in milliseconds
     */
    static PriceSeries fromCloses(const std::vector<Value>& closes,
                                  Timestamp start = 0,
                                  Timestamp step = 86400000);

    void addBar(const Bar& bar) { bars_.push_back(bar); }

    Size size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    const Bar& operator[](Size idx) const { return bars_[idx]; }
    const Bar& at(Size idx) const { return bars_.at(idx); }
    const Bar& front() const { return bars_.front(); }
    const Bar& back() const { return bars_.back(); }

    const std::vector<Bar>& bars() const { return bars_; }

    std::vector<Value> opens() const;
    std::vector<Value> highs() const;
    std::vector<Value> lows() const;
    std::vector<Value> closes() const;
    std::vector<Timestamp> timestamps() const;

    /**
     * @brief First k bars (the whole series when k >= size())
     */
    PriceSeries head(Size k) const;

    /**
     * @brief Bars [begin, end)
     */
    PriceSeries slice(Size begin, Size end) const;

    /**
     * @brief Check timestamps strictly increase and prices are usable
     * @throws DataIntegrityError naming the first offending bar
     */
    void validate() const;

    /**
     * @brief Index of the first bar with timestamp >= ts (size() if none)
     */
    Size lowerBound(Timestamp ts) const;

    /**
     * @brief Index one past the last bar with timestamp <= ts
     */
    Size upperBound(Timestamp ts) const;

    const std::string& symbol() const { return symbol_; }
    const std::string& timeframe() const { return timeframe_; }
    void setSymbol(const std::string& symbol) { symbol_ = symbol; }
    void setTimeframe(const std::string& timeframe) { timeframe_ = timeframe; }

private:
    std::vector<Bar> bars_;
    std::string symbol_;
    std::string timeframe_;
};

} // namespace cbt
