#ifndef FRESHNESS_STATE_H
#define FRESHNESS_STATE_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace core
{
    using SystemClock = std::chrono::system_clock;

    inline int64_t toEpochMillis(SystemClock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    inline SystemClock::time_point fromEpochMillis(int64_t ms)
    {
        return SystemClock::time_point(std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(ms)));
    }

    inline int64_t nowEpochMillis()
    {
        return toEpochMillis(SystemClock::now());
    }

    /**
     * @class FreshnessState
     * @brief Last road network update seen by the freshness tracker.
     *
     * Single writer (the tracker), many readers (cache lookups). Starts at the
     * construction time so nothing is stale before the first observed update.
     */
    class FreshnessState
    {
    public:
        FreshnessState()
            : m_last_update_ms(nowEpochMillis())
        {
        }

        explicit FreshnessState(SystemClock::time_point initial)
            : m_last_update_ms(toEpochMillis(initial))
        {
        }

        FreshnessState(const FreshnessState &) = delete;
        FreshnessState &operator=(const FreshnessState &) = delete;

        /// @brief Overwrites the stored timestamp. Last observed value wins.
        void update(SystemClock::time_point last_update)
        {
            m_last_update_ms.store(toEpochMillis(last_update), std::memory_order_release);
        }

        int64_t lastKnownUpdateMillis() const
        {
            return m_last_update_ms.load(std::memory_order_acquire);
        }

        SystemClock::time_point lastKnownUpdate() const
        {
            return fromEpochMillis(lastKnownUpdateMillis());
        }

        /// @brief An entry computed before the last known update is stale.
        bool isStale(int64_t computed_at_ms) const
        {
            return computed_at_ms < lastKnownUpdateMillis();
        }

    private:
        std::atomic<int64_t> m_last_update_ms;
    };

} // namespace core

#endif // FRESHNESS_STATE_H
