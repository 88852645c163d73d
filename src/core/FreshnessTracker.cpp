#include "FreshnessTracker.h"

#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace core
{

    FreshnessTracker::FreshnessTracker(std::shared_ptr<IDistanceProvider> provider,
                                       std::shared_ptr<FreshnessState> state,
                                       std::chrono::milliseconds interval)
        : m_provider(std::move(provider))
        , m_state(std::move(state))
        , m_interval(interval)
    {
        if (!m_provider)
        {
            throw std::invalid_argument("FreshnessTracker: provider is required");
        }
        if (!m_state)
        {
            throw std::invalid_argument("FreshnessTracker: freshness state is required");
        }
        if (m_interval.count() <= 0)
        {
            throw std::invalid_argument("FreshnessTracker: polling interval must be positive");
        }
    }

    FreshnessTracker::~FreshnessTracker()
    {
        stop();
    }

    void FreshnessTracker::start()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_thread.joinable())
        {
            return;
        }
        m_stop_requested = false;
        m_thread = std::thread(&FreshnessTracker::run, this);
        spdlog::info("FreshnessTracker: started with interval {} ms", m_interval.count());
    }

    void FreshnessTracker::stop()
    {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_thread.joinable())
            {
                return;
            }
            m_stop_requested = true;
            worker = std::move(m_thread);
        }
        m_cv.notify_all();
        worker.join();
        spdlog::info("FreshnessTracker: stopped");
    }

    bool FreshnessTracker::isRunning() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_thread.joinable() && !m_stop_requested;
    }

    bool FreshnessTracker::pollOnce()
    {
        try
        {
            SystemClock::time_point last_update = m_provider->lastRoadNetworkUpdate();
            m_state->update(last_update);
            spdlog::debug("FreshnessTracker: last road network update is now {} ms", toEpochMillis(last_update));
            return true;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("FreshnessTracker: poll failed, keeping last update {} ms: {}",
                         m_state->lastKnownUpdateMillis(), ex.what());
            return false;
        }
        catch (...)
        {
            spdlog::warn("FreshnessTracker: poll failed, keeping last update {} ms: unknown error",
                         m_state->lastKnownUpdateMillis());
            return false;
        }
    }

    void FreshnessTracker::run()
    {
        // Fixed rate: deadlines advance by whole intervals regardless of poll duration
        auto next_tick = std::chrono::steady_clock::now() + m_interval;
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stop_requested)
        {
            if (m_cv.wait_until(lock, next_tick, [this]
                                { return m_stop_requested; }))
            {
                break;
            }

            lock.unlock();
            pollOnce();
            lock.lock();

            next_tick += m_interval;
            auto now = std::chrono::steady_clock::now();
            if (next_tick < now)
            {
                // Skip missed ticks instead of polling in a burst
                next_tick = now + m_interval;
            }
        }
    }

} // namespace core
