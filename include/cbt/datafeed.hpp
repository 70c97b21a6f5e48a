/**
 * @file datafeed.hpp
 * @brief CSV price data loading
 *
 * Loading happens before any run starts and is the only place file I/O
 * touches price data.
 */

#pragma once

#include "cbt/bar.hpp"
#include "cbt/params.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace cbt {

/**
 * @brief OHLCV bars from a delimited text file
 *
 * The timestamp column holds epoch milliseconds or an ISO date / date-time.
 * Column options are zero-based indices; volume = -1 means absent (0).
 * The loaded series is not validated here; the Backtester does that.
 */
class CsvPriceFeed {
public:
    CBT_PARAMS_BEGIN()
        CBT_PARAM(timestamp, 0)
        CBT_PARAM(open, 1)
        CBT_PARAM(high, 2)
        CBT_PARAM(low, 3)
        CBT_PARAM(close, 4)
        CBT_PARAM(volume, 5)
        CBT_PARAM(header, 1)     // rows to skip
        CBT_PARAM(separator, 0)  // 0 = comma, 1 = tab, 2 = semicolon
    CBT_PARAMS_END()

    explicit CsvPriceFeed(std::string filepath, const Params& params = {});

    /**
     * @throws IoError when the file cannot be opened or a row is malformed
     */
    PriceSeries load() const;

    /**
     * @brief Parse from an already open stream; `source` names it in errors
     */
    PriceSeries read(std::istream& in, const std::string& source = "<stream>") const;

    /**
     * @brief Write "timestamp,open,high,low,close,volume" with a header row
     */
    static void save(const PriceSeries& series, std::ostream& out);

    /**
     * @throws IoError when the file cannot be written
     */
    static void save(const PriceSeries& series, const std::string& filepath);

    const std::string& filepath() const { return filepath_; }
    const Params& params() const { return params_; }

    void setSymbol(const std::string& symbol) { symbol_ = symbol; }
    void setTimeframe(const std::string& timeframe) { timeframe_ = timeframe; }

private:
    static std::vector<std::string> split(const std::string& line, char sep);

    std::string filepath_;
    Params params_;
    std::string symbol_;
    std::string timeframe_;
};

} // namespace cbt
