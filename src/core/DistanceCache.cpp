#include "DistanceCache.h"

#include <utility>
#include <spdlog/spdlog.h>

namespace core
{
    namespace
    {
        const CacheConfig &checkedConfig(const CacheConfig &config)
        {
            config.validate();
            return config;
        }

        CacheConfig configWithInterval(std::chrono::milliseconds poll_interval)
        {
            CacheConfig config;
            config.poll_interval = poll_interval;
            return config;
        }

        std::shared_ptr<IDistanceProvider> requireProvider(std::shared_ptr<IDistanceProvider> provider)
        {
            if (!provider)
            {
                throw std::invalid_argument("DistanceCache: distance provider is required");
            }
            return provider;
        }

        std::string describe(const std::exception_ptr &error)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception &ex)
            {
                return ex.what();
            }
            catch (...)
            {
                return "unknown error";
            }
        }

        std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }
    } // namespace

    CacheEntry::CacheEntry()
        : m_result(m_promise.get_future().share())
    {
    }

    bool CacheEntry::isDone() const
    {
        return m_result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    bool CacheEntry::isFailed() const
    {
        return m_failed.load(std::memory_order_acquire);
    }

    int64_t CacheEntry::computedAtMillis() const
    {
        return m_result.get().computed_at_ms;
    }

    void CacheEntry::complete(int distance_meters)
    {
        StampedDistance stamped;
        stamped.distance_meters = distance_meters;
        stamped.computed_at_ms = nowEpochMillis();
        m_promise.set_value(stamped);
    }

    void CacheEntry::fail(std::exception_ptr error)
    {
        // Flag first: anyone seeing the ready future must also see the failure
        m_failed.store(true, std::memory_order_release);
        m_promise.set_exception(std::move(error));
    }

    DistanceCache::DistanceCache(std::shared_ptr<IDistanceProvider> provider, const CacheConfig &config)
        : m_config(checkedConfig(config))
        , m_provider(requireProvider(std::move(provider)))
        , m_freshness(std::make_shared<FreshnessState>())
        , m_cache(m_config.stripe_count)
        , m_metrics(m_config.stripe_count)
        , m_tracker(m_provider, m_freshness, m_config.poll_interval)
    {
        m_tracker.start();
        spdlog::info("DistanceCache: created (poll_interval={} ms, fetch_timeout={} ms)",
                     m_config.poll_interval.count(), m_config.fetch_timeout.count());
    }

    DistanceCache::DistanceCache(std::shared_ptr<IDistanceProvider> provider, std::chrono::milliseconds poll_interval)
        : DistanceCache(std::move(provider), configWithInterval(poll_interval))
    {
    }

    DistanceCache::~DistanceCache()
    {
        m_tracker.stop();
    }

    int DistanceCache::distanceInMeters(const Coordinate &from, const Coordinate &to)
    {
        if (!from.isValid())
        {
            throw std::invalid_argument("DistanceCache: invalid origin coordinate " + from.toString());
        }
        if (!to.isValid())
        {
            throw std::invalid_argument("DistanceCache: invalid destination coordinate " + to.toString());
        }

        DestinationMapPtr destinations = m_cache.computeIfAbsent(from, [this]
                                                                 { return std::make_shared<DestinationMap>(m_config.stripe_count); });

        // Get-or-replace in one step under the destination's stripe lock
        EntryPtr created;
        EntryPtr entry = destinations->compute(to, [this, &created](const EntryPtr *current)
                                               {
            if (current && !isUpdateNeeded(**current))
            {
                return *current;
            }
            created = std::make_shared<CacheEntry>();
            return created; });

        m_metrics.recordLookup(from, to);

        if (entry == created)
        {
            m_metrics.recordMiss();
            spdlog::debug("DistanceCache: miss ({}, {}) -> ({}, {}), fetching",
                          from.latitude(), from.longitude(), to.latitude(), to.longitude());
            fetchInto(from, to, destinations, entry);
        }
        else
        {
            spdlog::debug("DistanceCache: {} ({}, {}) -> ({}, {})", entry->isDone() ? "hit" : "joined pending fetch",
                          from.latitude(), from.longitude(), to.latitude(), to.longitude());
        }

        return awaitResult(from, to, destinations, entry);
    }

    bool DistanceCache::isUpdateNeeded(const CacheEntry &entry) const
    {
        if (!entry.isDone())
        {
            // In flight: join it
            return false;
        }
        if (entry.isFailed())
        {
            return true;
        }
        return m_freshness->isStale(entry.computedAtMillis());
    }

    void DistanceCache::fetchInto(const Coordinate &from, const Coordinate &to,
                                  const DestinationMapPtr &destinations, const EntryPtr &entry)
    {
        auto started = std::chrono::steady_clock::now();
        try
        {
            int distance = m_provider->fetchDistanceInMeters(from, to);
            m_metrics.recordExecution(elapsedSince(started), true);
            entry->complete(distance);
            spdlog::debug("DistanceCache: fetched ({}, {}) -> ({}, {}) = {} m",
                          from.latitude(), from.longitude(), to.latitude(), to.longitude(), distance);
        }
        catch (...)
        {
            std::exception_ptr error = std::current_exception();
            m_metrics.recordExecution(elapsedSince(started), false);
            spdlog::warn("DistanceCache: fetch ({}, {}) -> ({}, {}) failed: {}",
                         from.latitude(), from.longitude(), to.latitude(), to.longitude(), describe(error));
            // Free the slot before waking waiters so their retry installs a new entry
            destinations->removeIf(to, entry);
            entry->fail(error);
        }
    }

    int DistanceCache::awaitResult(const Coordinate &from, const Coordinate &to,
                                   const DestinationMapPtr &destinations, const EntryPtr &entry) const
    {
        std::shared_future<StampedDistance> result = entry->result();

        if (m_config.fetch_timeout.count() > 0 &&
            result.wait_for(m_config.fetch_timeout) != std::future_status::ready)
        {
            // A hung fetch must not hold the slot: the next lookup starts over
            destinations->removeIf(to, entry);
            spdlog::warn("DistanceCache: fetch ({}, {}) -> ({}, {}) timed out after {} ms",
                         from.latitude(), from.longitude(), to.latitude(), to.longitude(), m_config.fetch_timeout.count());
            throw FetchTimeoutError("DistanceCache: fetch " + from.toString() + " -> " + to.toString() +
                                    " timed out after " + std::to_string(m_config.fetch_timeout.count()) + " ms");
        }

        try
        {
            return result.get().distance_meters;
        }
        catch (const std::exception &ex)
        {
            throw DistanceFetchError("DistanceCache: fetch " + from.toString() + " -> " + to.toString() +
                                     " failed: " + ex.what());
        }
    }

    DistanceCacheMetrics DistanceCache::getMetrics() const
    {
        return m_metrics.snapshot(size(), m_config.top_locations);
    }

    std::size_t DistanceCache::size() const
    {
        std::size_t total = 0;
        m_cache.forEach([&total](const Coordinate &, const DestinationMapPtr &destinations)
                        { total += destinations->size(); });
        return total;
    }

    void DistanceCache::clear()
    {
        m_cache.clear();
        spdlog::info("DistanceCache: cleared");
    }

    bool DistanceCache::refreshFreshness()
    {
        return m_tracker.pollOnce();
    }

    SystemClock::time_point DistanceCache::lastKnownUpdate() const
    {
        return m_freshness->lastKnownUpdate();
    }

} // namespace core
