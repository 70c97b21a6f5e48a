/**
 * @file optimizer.hpp
 * @brief Parallel strategy runs and parameter grid search
 *
 * Every run is an independent Backtester::run over a shared, read-only
 * price series; the ThreadPool only spreads them over workers. Results
 * always come back in submission order.
 */

#pragma once

#include "cbt/backtester.hpp"
#include "cbt/params.hpp"
#include "cbt/threadpool.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cbt {

/**
 * @brief Cartesian product of named value lists
 *
 * The last added parameter varies fastest.
 */
class ParameterGrid {
public:
    using ParamValues = std::vector<ParamValue>;
    using ParamSet = std::map<std::string, ParamValue>;

    void addParam(const std::string& name, const ParamValues& values);

    /**
     * @brief Values start, start + step, ... up to and including end
     * @throws ConfigurationError when step <= 0
     */
    void addParam(const std::string& name, Value start, Value end, Value step = 1.0);

    void addParamInt(const std::string& name, int start, int end, int step = 1);

    /**
     * @brief All combinations; empty when no parameter was added
     */
    std::vector<ParamSet> generate() const;

    Size totalCombinations() const;

    const std::vector<std::string>& names() const { return paramNames_; }

    void clear() {
        paramNames_.clear();
        paramValues_.clear();
    }

private:
    std::vector<std::string> paramNames_;
    std::vector<ParamValues> paramValues_;
};

/**
 * @brief Outcome of one grid point
 */
struct OptResult {
    std::map<std::string, ParamValue> params;
    bool valid = false;        ///< false when the combination was rejected
    std::string error;         ///< rejection message
    std::string strategyName;
    PerformanceReport report;

    std::string describeParams() const;
};

struct OptConfig {
    Size maxThreads = 0;  ///< 0 = hardware concurrency
};

enum class OptSortBy {
    TotalReturn,
    WinRate,
    AverageReturn,
    MaxDrawdown,   ///< smaller is better
    NumTrades
};

/**
 * @brief Grid search over one strategy kind
 *
 *   Optimizer opt("sma_crossover", BacktestConfig{});
 *   opt.addParamInt("fast_window", 5, 50, 5);
 *   opt.addParamInt("slow_window", 20, 200, 20);
 *   opt.optimize(series);
 *   opt.sortResults(OptSortBy::TotalReturn);
 */
class Optimizer {
public:
    /**
     * @throws ConfigurationError for an unknown kind or an invalid config
     */
    Optimizer(std::string kind, BacktestConfig btConfig = {}, OptConfig config = {});

    void addParam(const std::string& name, const std::vector<ParamValue>& values) {
        grid_.addParam(name, values);
    }

    void addParam(const std::string& name, Value start, Value end, Value step = 1.0) {
        grid_.addParam(name, start, end, step);
    }

    void addParamInt(const std::string& name, int start, int end, int step = 1) {
        grid_.addParamInt(name, start, end, step);
    }

    /**
     * @brief Options applied to every combination (grid values win)
     */
    void setBaseParams(const Params& params) { baseParams_ = params; }

    /**
     * @brief Run every combination
     *
     * Combinations the strategy rejects are kept as invalid results.
     * Data errors abort the whole search.
     */
    const std::vector<OptResult>& optimize(const PriceSeries& series);

    const std::vector<OptResult>& results() const { return results_; }

    /**
     * @brief Order results best first (descending) or worst first;
     *        invalid results always go last
     */
    void sortResults(OptSortBy sortBy = OptSortBy::TotalReturn, bool descending = true);

    /**
     * @brief First n valid results in the current order
     */
    std::vector<OptResult> topResults(Size topN = 10) const;

    Size totalCombinations() const { return grid_.totalCombinations(); }

    const std::string& kind() const { return kind_; }

    void clear() {
        grid_.clear();
        results_.clear();
    }

private:
    OptResult evaluate(const PriceSeries& series, const ParameterGrid::ParamSet& paramSet) const;

    std::string kind_;
    Backtester backtester_;
    OptConfig config_;
    Params baseParams_;
    ParameterGrid grid_;
    std::vector<OptResult> results_;
    std::unique_ptr<ThreadPool> pool_;
};

/**
 * @brief Run several strategies over the same series in parallel
 * @return one result per strategy, in input order
 */
std::vector<BacktestResult> runStrategies(const PriceSeries& series,
                                          const std::vector<const Strategy*>& strategies,
                                          const BacktestConfig& config,
                                          ThreadPool& pool);

} // namespace cbt
