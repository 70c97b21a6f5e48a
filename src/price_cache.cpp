/**
 * @file price_cache.cpp
 * @brief Price data cache
 */

#include "cbt/price_cache.hpp"
#include "cbt/datafeed.hpp"
#include "cbt/errors.hpp"
#include "cbt/log.hpp"
#include <algorithm>
#include <filesystem>
#include <tuple>

namespace fs = std::filesystem;

namespace cbt {

std::string CacheKey::fileName() const {
    std::string sym = symbol;
    std::replace(sym.begin(), sym.end(), '/', '_');
    return sym + "_" + timeframe + "_" + std::to_string(start) + "_" + std::to_string(end) + ".csv";
}

bool CacheKey::operator<(const CacheKey& o) const {
    return std::tie(symbol, timeframe, start, end) < std::tie(o.symbol, o.timeframe, o.start, o.end);
}

bool CacheKey::operator==(const CacheKey& o) const {
    return std::tie(symbol, timeframe, start, end) == std::tie(o.symbol, o.timeframe, o.start, o.end);
}

PriceCache::PriceCache(std::string directory, Fetcher fetcher)
    : directory_(std::move(directory)), fetcher_(std::move(fetcher)) {}

std::string PriceCache::pathFor(const CacheKey& key) const {
    return (fs::path(directory_) / key.fileName()).string();
}

PriceSeries PriceCache::get(const CacheKey& key) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [&] { return loading_.count(key) == 0; });

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++stats_.memoryHits;
        return it->second;
    }

    // disk reads and fetches run unlocked; other callers of this key wait on ready_
    loading_.insert(key);
    lock.unlock();

    bool fromDisk = false;
    PriceSeries series;
    try {
        series = load(key, fromDisk);
    } catch (...) {
        lock.lock();
        loading_.erase(key);
        lock.unlock();
        ready_.notify_all();
        throw;
    }

    lock.lock();
    loading_.erase(key);
    ++(fromDisk ? stats_.diskHits : stats_.fetches);
    PriceSeries result = entries_.emplace(key, std::move(series)).first->second;
    lock.unlock();
    ready_.notify_all();
    return result;
}

PriceSeries PriceCache::load(const CacheKey& key, bool& fromDisk) const {
    if (!directory_.empty()) {
        const std::string path = pathFor(key);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            CsvPriceFeed feed(path);
            feed.setSymbol(key.symbol);
            feed.setTimeframe(key.timeframe);
            PriceSeries series = feed.load();
            series.validate();
            fromDisk = true;
            CBT_LOG_DEBUG("cache disk hit " << path);
            return series;
        }
    }

    if (!fetcher_) {
        throw IoError("no cached data for " + key.fileName() + " and no fetcher configured");
    }

    CBT_LOG_INFO("fetching " << key.symbol << " " << key.timeframe
                 << " [" << key.start << ", " << key.end << "]");
    PriceSeries series = fetcher_(key);
    series.validate();
    series.setSymbol(key.symbol);
    series.setTimeframe(key.timeframe);

    if (!directory_.empty()) {
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw IoError("cannot create cache directory " + directory_ + ": " + ec.message());
        }
        CsvPriceFeed::save(series, pathFor(key));
    }
    fromDisk = false;
    return series;
}

bool PriceCache::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(key) > 0) {
        return true;
    }
    std::error_code ec;
    return !directory_.empty() && fs::exists(pathFor(key), ec);
}

Size PriceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void PriceCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

PriceCache::Stats PriceCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace cbt
