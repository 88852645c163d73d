#ifndef DISTANCE_CACHE_H
#define DISTANCE_CACHE_H

#include "CacheConfig.h"
#include "ConcurrentHashMap.hpp"
#include "Coordinate.h"
#include "DistanceCacheMetrics.h"
#include "FreshnessState.h"
#include "FreshnessTracker.h"
#include "IDistanceProvider.h"

#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

namespace core
{

    /// @brief The remote fetch behind an awaited cache entry failed.
    class DistanceFetchError : public std::runtime_error
    {
    public:
        explicit DistanceFetchError(const std::string &message)
            : std::runtime_error(message)
        {
        }
    };

    /// @brief The entry did not complete within the configured fetch timeout.
    class FetchTimeoutError : public DistanceFetchError
    {
    public:
        explicit FetchTimeoutError(const std::string &message)
            : DistanceFetchError(message)
        {
        }
    };

    /// @brief Distance result together with the time it was fetched.
    struct StampedDistance
    {
        int distance_meters = 0;
        int64_t computed_at_ms = 0;
    };

    /**
     * @class CacheEntry
     * @brief Single-flight handle of one remote fetch.
     *
     * Pending until the fetch completes, then immutable. A stale or failed
     * entry is replaced by a new one, never reset.
     */
    class CacheEntry
    {
    public:
        CacheEntry();

        CacheEntry(const CacheEntry &) = delete;
        CacheEntry &operator=(const CacheEntry &) = delete;

        bool isDone() const;
        bool isFailed() const;

        /// @brief Fetch time of a successfully completed entry.
        int64_t computedAtMillis() const;

        std::shared_future<StampedDistance> result() const { return m_result; }

        void complete(int distance_meters);
        void fail(std::exception_ptr error);

    private:
        std::promise<StampedDistance> m_promise;
        std::shared_future<StampedDistance> m_result;
        std::atomic<bool> m_failed{false};
    };

    /**
     * @class DistanceCache
     * @brief Memoizes road distances of an IDistanceProvider.
     *
     * Entries are keyed origin -> destination -> CacheEntry. Concurrent lookups
     * of one pair share a single remote fetch. An entry fetched before the last
     * known road network update is refetched on its next lookup, so results are
     * eventually consistent within one polling interval.
     *
     * Thread safe. Locks are striped per key; a lookup never holds a lock while
     * waiting for a fetch. The caller that installs an entry performs its
     * fetch, so lookups of other pairs never wait behind it.
     */
    class DistanceCache
    {
    public:
        DistanceCache(std::shared_ptr<IDistanceProvider> provider, const CacheConfig &config);
        DistanceCache(std::shared_ptr<IDistanceProvider> provider, std::chrono::milliseconds poll_interval);
        ~DistanceCache();

        DistanceCache(const DistanceCache &) = delete;
        DistanceCache &operator=(const DistanceCache &) = delete;

        /**
         * @brief Road distance between two coordinates in meters.
         *
         * Returns a fresh cached value, joins an in-flight fetch for the same
         * pair, or runs a new fetch on the calling thread. Blocks until the
         * value is available.
         * @throws std::invalid_argument for invalid coordinates
         * @throws DistanceFetchError when the fetch failed
         * @throws FetchTimeoutError when fetch_timeout elapsed first
         */
        int distanceInMeters(const Coordinate &from, const Coordinate &to);

        DistanceCacheMetrics getMetrics() const;

        /// @brief Number of (from, to) entries, pending ones included.
        std::size_t size() const;

        void clear();

        /// @brief Polls the provider for its last update now instead of waiting for the next tick.
        bool refreshFreshness();

        SystemClock::time_point lastKnownUpdate() const;

        const CacheConfig &config() const { return m_config; }

    private:
        using EntryPtr = std::shared_ptr<CacheEntry>;
        using DestinationMap = ConcurrentHashMap<Coordinate, EntryPtr>;
        using DestinationMapPtr = std::shared_ptr<DestinationMap>;

        bool isUpdateNeeded(const CacheEntry &entry) const;
        void fetchInto(const Coordinate &from, const Coordinate &to,
                       const DestinationMapPtr &destinations, const EntryPtr &entry);
        int awaitResult(const Coordinate &from, const Coordinate &to,
                        const DestinationMapPtr &destinations, const EntryPtr &entry) const;

        CacheConfig m_config;
        std::shared_ptr<IDistanceProvider> m_provider;
        std::shared_ptr<FreshnessState> m_freshness;
        ConcurrentHashMap<Coordinate, DestinationMapPtr> m_cache;
        CacheMetricsRecorder m_metrics;
        FreshnessTracker m_tracker;
    };

} // namespace core

#endif // DISTANCE_CACHE_H
