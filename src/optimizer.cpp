/**
 * @file optimizer.cpp
 * @brief Grid search and parallel runs
 */

#include "cbt/optimizer.hpp"
#include "cbt/errors.hpp"
#include "cbt/log.hpp"
#include <algorithm>
#include <chrono>

namespace cbt {

// ---------------------------------------------------------------------------
// ParameterGrid

void ParameterGrid::addParam(const std::string& name, const ParamValues& values) {
    paramNames_.push_back(name);
    paramValues_.push_back(values);
}

void ParameterGrid::addParam(const std::string& name, Value start, Value end, Value step) {
    if (!(step > 0.0)) {
        throw ConfigurationError("grid step for " + name + " must be > 0");
    }
    ParamValues values;
    // tolerate accumulated rounding on the last step
    const Value limit = end + step * 1e-9;
    for (Size k = 0;; ++k) {
        Value v = start + static_cast<Value>(k) * step;
        if (v > limit) break;
        values.push_back(v);
    }
    addParam(name, values);
}

void ParameterGrid::addParamInt(const std::string& name, int start, int end, int step) {
    if (step <= 0) {
        throw ConfigurationError("grid step for " + name + " must be > 0");
    }
    ParamValues values;
    for (int v = start; v <= end; v += step) {
        values.push_back(v);
    }
    addParam(name, values);
}

Size ParameterGrid::totalCombinations() const {
    if (paramNames_.empty()) return 0;
    Size total = 1;
    for (const auto& values : paramValues_) {
        total *= values.size();
    }
    return total;
}

std::vector<ParameterGrid::ParamSet> ParameterGrid::generate() const {
    std::vector<ParamSet> results;
    const Size total = totalCombinations();
    if (total == 0) {
        return results;
    }
    results.reserve(total);

    std::vector<Size> indices(paramNames_.size(), 0);
    for (Size i = 0; i < total; ++i) {
        ParamSet paramSet;
        for (Size j = 0; j < paramNames_.size(); ++j) {
            paramSet[paramNames_[j]] = paramValues_[j][indices[j]];
        }
        results.push_back(std::move(paramSet));

        // odometer increment, last parameter fastest
        for (Size j = paramNames_.size(); j > 0; --j) {
            Size idx = j - 1;
            ++indices[idx];
            if (indices[idx] < paramValues_[idx].size()) {
                break;
            }
            indices[idx] = 0;
        }
    }
    return results;
}

// ---------------------------------------------------------------------------
// OptResult

std::string OptResult::describeParams() const {
    return Params::fromMap(params).describe();
}

// ---------------------------------------------------------------------------
// Optimizer

Optimizer::Optimizer(std::string kind, BacktestConfig btConfig, OptConfig config)
    : kind_(std::move(kind)), backtester_(std::move(btConfig)), config_(config) {

    auto kinds = availableStrategies();
    if (std::find(kinds.begin(), kinds.end(), kind_) == kinds.end()) {
        throw ConfigurationError("unknown strategy kind: " + kind_);
    }
    pool_ = std::make_unique<ThreadPool>(config_.maxThreads);
}

OptResult Optimizer::evaluate(const PriceSeries& series, const ParameterGrid::ParamSet& paramSet) const {
    OptResult result;
    result.params = paramSet;

    Params params = baseParams_;
    params.override(Params::fromMap(paramSet));

    StrategyPtr strategy;
    try {
        strategy = makeStrategy(kind_, params);
    } catch (const ConfigurationError& e) {
        result.error = e.what();
        CBT_LOG_DEBUG("skipping " << params.describe() << ": " << e.what());
        return result;
    }

    result.strategyName = strategy->name();
    result.report = backtester_.run(series, *strategy).report;
    result.valid = true;
    return result;
}

const std::vector<OptResult>& Optimizer::optimize(const PriceSeries& series) {
    const auto combos = grid_.generate();
    CBT_LOG_INFO("optimizing " << kind_ << ": " << combos.size()
                 << " combinations on " << pool_->size() << " threads");

    auto start = std::chrono::steady_clock::now();
    results_ = pool_->map([this, &series](const ParameterGrid::ParamSet& paramSet) {
        return evaluate(series, paramSet);
    }, combos);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    Size skipped = static_cast<Size>(std::count_if(results_.begin(), results_.end(),
                                                   [](const OptResult& r) { return !r.valid; }));
    CBT_LOG_INFO("optimization finished in " << elapsed << "s, "
                 << (results_.size() - skipped) << " runs, " << skipped << " skipped");
    return results_;
}

namespace {

Value sortKey(const OptResult& r, OptSortBy sortBy) {
    switch (sortBy) {
        case OptSortBy::TotalReturn: return r.report.totalReturnPct;
        case OptSortBy::WinRate: return r.report.winRate;
        case OptSortBy::AverageReturn: return r.report.averageReturnPct;
        case OptSortBy::MaxDrawdown: return -r.report.maxDrawdownPct;
        case OptSortBy::NumTrades: return static_cast<Value>(r.report.numTrades);
    }
    return 0.0;
}

} // namespace

void Optimizer::sortResults(OptSortBy sortBy, bool descending) {
    std::stable_sort(results_.begin(), results_.end(),
                     [sortBy, descending](const OptResult& a, const OptResult& b) {
        if (a.valid != b.valid) {
            return a.valid;
        }
        if (!a.valid) {
            return false;
        }
        Value valA = sortKey(a, sortBy);
        Value valB = sortKey(b, sortBy);
        return descending ? (valA > valB) : (valA < valB);
    });
}

std::vector<OptResult> Optimizer::topResults(Size topN) const {
    std::vector<OptResult> top;
    for (const auto& result : results_) {
        if (top.size() >= topN) break;
        if (result.valid) {
            top.push_back(result);
        }
    }
    return top;
}

// ---------------------------------------------------------------------------

std::vector<BacktestResult> runStrategies(const PriceSeries& series,
                                          const std::vector<const Strategy*>& strategies,
                                          const BacktestConfig& config,
                                          ThreadPool& pool) {
    Backtester backtester(config);
    return pool.map([&backtester, &series](const Strategy* strategy) {
        return backtester.run(series, *strategy);
    }, strategies);
}

} // namespace cbt
