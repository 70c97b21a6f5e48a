/**
 * @file price_cache.hpp
 * @brief Process-scoped price data cache
 *
 * Lifecycle is explicit: an entry is created on the first miss and stays
 * until clear() is called. Nothing in the engine refers to the cache; the
 * caller hands the returned series to the Backtester.
 */

#pragma once

#include "cbt/bar.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace cbt {

/**
 * @brief Identity of one cached download
 */
struct CacheKey {
    std::string symbol;     ///< e.g. "BTC/USDT"
    std::string timeframe;  ///< e.g. "1d"
    Timestamp start = 0;
    Timestamp end = 0;

    /**
     * @brief "BTC_USDT_1d_<start>_<end>.csv"
     */
    std::string fileName() const;

    bool operator<(const CacheKey& o) const;
    bool operator==(const CacheKey& o) const;
};

/**
 * @brief Memory, then disk, then fetcher
 *
 * Disk and fetched series are validated before they are stored, so a bad
 * download never reaches the disk. Safe to share between threads: the
 * fetcher runs without the lock held, and concurrent misses on one key
 * wait for a single load.
 */
class PriceCache {
public:
    using Fetcher = std::function<PriceSeries(const CacheKey&)>;

    struct Stats {
        Size memoryHits = 0;
        Size diskHits = 0;
        Size fetches = 0;
    };

    /**
     * @param directory on-disk layer, created on first write; empty disables it
     * @param fetcher called on a full miss; may be empty
     */
    PriceCache(std::string directory, Fetcher fetcher);

    CBT_DISABLE_COPY(PriceCache)

    /**
     * @brief Series for key, as an independent copy
     * @throws IoError on a full miss without fetcher or on disk failures
     * @throws DataIntegrityError when fetched data does not validate
     */
    PriceSeries get(const CacheKey& key);

    /**
     * @brief In memory or on disk
     */
    bool contains(const CacheKey& key) const;

    /**
     * @brief Number of entries in memory
     */
    Size size() const;

    /**
     * @brief Drop the memory layer (files stay)
     */
    void clear();

    Stats stats() const;

    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const CacheKey& key) const;
    PriceSeries load(const CacheKey& key, bool& fromDisk) const;

    std::string directory_;
    Fetcher fetcher_;
    std::map<CacheKey, PriceSeries> entries_;
    std::set<CacheKey> loading_;
    Stats stats_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
};

} // namespace cbt
