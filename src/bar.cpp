/**
 * @file bar.cpp
 * @brief PriceSeries implementation
 */

#include "cbt/bar.hpp"
#include "cbt/datetime.hpp"
#include "cbt/errors.hpp"
#include <algorithm>

namespace cbt {

namespace {

template<typename F>
std::vector<Value> column(const std::vector<Bar>& bars, F field) {
    std::vector<Value> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        out.push_back(field(bar));
    }
    return out;
}

bool usablePrice(Value v) {
    return std::isfinite(v) && v > 0.0;
}

std::string describeBar(Size idx, const Bar& bar) {
    return "bar " + std::to_string(idx) + " (" + formatTimestamp(bar.timestamp) + ")";
}

} // namespace

PriceSeries PriceSeries::fromCloses(const std::vector<Value>& closes,
                                    Timestamp start, Timestamp step) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (Size i = 0; i < closes.size(); ++i) {
        Bar bar;
        bar.timestamp = start + static_cast<Timestamp>(i) * step;
        bar.open = bar.high = bar.low = bar.close = closes[i];
        bars.push_back(bar);
    }
    return PriceSeries(std::move(bars));
}

std::vector<Value> PriceSeries::opens() const {
    return column(bars_, [](const Bar& b) { return b.open; });
}

std::vector<Value> PriceSeries::highs() const {
    return column(bars_, [](const Bar& b) { return b.high; });
}

std::vector<Value> PriceSeries::lows() const {
    return column(bars_, [](const Bar& b) { return b.low; });
}

std::vector<Value> PriceSeries::closes() const {
    return column(bars_, [](const Bar& b) { return b.close; });
}

std::vector<Timestamp> PriceSeries::timestamps() const {
    std::vector<Timestamp> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.timestamp);
    }
    return out;
}

PriceSeries PriceSeries::head(Size k) const {
    return slice(0, std::min(k, bars_.size()));
}

PriceSeries PriceSeries::slice(Size begin, Size end) const {
    end = std::min(end, bars_.size());
    begin = std::min(begin, end);
    return PriceSeries(std::vector<Bar>(bars_.begin() + begin, bars_.begin() + end),
                       symbol_, timeframe_);
}

void PriceSeries::validate() const {
    for (Size i = 0; i < bars_.size(); ++i) {
        const Bar& bar = bars_[i];

        if (i > 0 && bar.timestamp <= bars_[i - 1].timestamp) {
            throw DataIntegrityError(
                describeBar(i, bar) + (bar.timestamp == bars_[i - 1].timestamp
                    ? " duplicates the previous timestamp"
                    : " is earlier than the previous bar"));
        }
        if (!usablePrice(bar.open) || !usablePrice(bar.high)
            || !usablePrice(bar.low) || !usablePrice(bar.close)) {
            throw DataIntegrityError(describeBar(i, bar) + " has a zero, negative or non-finite price");
        }
        if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
            throw DataIntegrityError(describeBar(i, bar) + " has a negative or non-finite volume");
        }
    }
}

Size PriceSeries::lowerBound(Timestamp ts) const {
    auto it = std::lower_bound(bars_.begin(), bars_.end(), ts,
        [](const Bar& bar, Timestamp t) { return bar.timestamp < t; });
    return static_cast<Size>(it - bars_.begin());
}

Size PriceSeries::upperBound(Timestamp ts) const {
    auto it = std::upper_bound(bars_.begin(), bars_.end(), ts,
        [](Timestamp t, const Bar& bar) { return t < bar.timestamp; });
    return static_cast<Size>(it - bars_.begin());
}

} // namespace cbt
