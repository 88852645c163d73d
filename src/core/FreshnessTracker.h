#ifndef FRESHNESS_TRACKER_H
#define FRESHNESS_TRACKER_H

#include "FreshnessState.h"
#include "IDistanceProvider.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace core
{

    /**
     * @class FreshnessTracker
     * @brief Background task polling the provider for its last road network update.
     *
     * The first poll happens one interval after start(). A failed poll keeps
     * the previous value and the loop continues.
     */
    class FreshnessTracker
    {
    public:
        FreshnessTracker(std::shared_ptr<IDistanceProvider> provider,
                         std::shared_ptr<FreshnessState> state,
                         std::chrono::milliseconds interval);
        ~FreshnessTracker();

        FreshnessTracker(const FreshnessTracker &) = delete;
        FreshnessTracker &operator=(const FreshnessTracker &) = delete;

        void start();

        /// @brief Stops the polling thread and waits for it. Safe to call twice.
        void stop();

        /**
         * @brief Polls the provider once on the calling thread.
         * @return true if the state was updated
         */
        bool pollOnce();

        bool isRunning() const;

        std::chrono::milliseconds interval() const { return m_interval; }

    private:
        void run();

        std::shared_ptr<IDistanceProvider> m_provider;
        std::shared_ptr<FreshnessState> m_state;
        std::chrono::milliseconds m_interval;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop_requested = false;
        std::thread m_thread;
    };

} // namespace core

#endif // FRESHNESS_TRACKER_H
