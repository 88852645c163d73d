#ifndef CONCURRENT_HASH_MAP_HPP
#define CONCURRENT_HASH_MAP_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace core
{

    /**
     * @class ConcurrentHashMap
     * @brief Hash map split into independently locked stripes.
     *
     * Every key maps to exactly one stripe. Operations on a key only lock that
     * stripe, readers share it, and no operation ever holds two stripe locks.
     * Callbacks passed to computeIfAbsent/compute run under the stripe lock and
     * must not call back into the same map.
     */
    template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
    class ConcurrentHashMap
    {
    public:
        static constexpr std::size_t DEFAULT_STRIPE_COUNT = 64;

        explicit ConcurrentHashMap(std::size_t stripe_count = DEFAULT_STRIPE_COUNT)
            : m_stripe_count(stripe_count)
        {
            if (stripe_count == 0)
            {
                throw std::invalid_argument("ConcurrentHashMap: stripe count must be positive");
            }
            m_stripes = std::make_unique<Stripe[]>(stripe_count);
        }

        ConcurrentHashMap(const ConcurrentHashMap &) = delete;
        ConcurrentHashMap &operator=(const ConcurrentHashMap &) = delete;

        std::optional<V> get(const K &key) const
        {
            const Stripe &stripe = stripeFor(key);
            std::shared_lock<std::shared_mutex> lock(stripe.mutex);
            auto it = stripe.map.find(key);
            if (it == stripe.map.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        /// @brief Returns the value for key, inserting factory() first if absent.
        template <typename Factory>
        V computeIfAbsent(const K &key, Factory &&factory)
        {
            Stripe &stripe = stripeFor(key);
            {
                std::shared_lock<std::shared_mutex> lock(stripe.mutex);
                auto it = stripe.map.find(key);
                if (it != stripe.map.end())
                {
                    return it->second;
                }
            }

            std::unique_lock<std::shared_mutex> lock(stripe.mutex);
            // Another writer may have inserted between the two locks
            auto it = stripe.map.find(key);
            if (it == stripe.map.end())
            {
                it = stripe.map.emplace(key, factory()).first;
            }
            return it->second;
        }

        /**
         * @brief Atomically replaces the value for key with remap(current).
         *
         * remap receives a pointer to the current value, or nullptr when the key
         * is absent, and returns the value to store. The read and the write
         * happen under one exclusive stripe lock.
         * @return The value now stored for key.
         */
        template <typename Remap>
        V compute(const K &key, Remap &&remap)
        {
            Stripe &stripe = stripeFor(key);
            std::unique_lock<std::shared_mutex> lock(stripe.mutex);
            auto it = stripe.map.find(key);
            if (it == stripe.map.end())
            {
                return stripe.map.emplace(key, remap(static_cast<const V *>(nullptr))).first->second;
            }
            it->second = remap(static_cast<const V *>(&it->second));
            return it->second;
        }

        /// @brief Removes key only while its current value equals expected.
        bool removeIf(const K &key, const V &expected)
        {
            Stripe &stripe = stripeFor(key);
            std::unique_lock<std::shared_mutex> lock(stripe.mutex);
            auto it = stripe.map.find(key);
            if (it == stripe.map.end() || !(it->second == expected))
            {
                return false;
            }
            stripe.map.erase(it);
            return true;
        }

        bool contains(const K &key) const
        {
            const Stripe &stripe = stripeFor(key);
            std::shared_lock<std::shared_mutex> lock(stripe.mutex);
            return stripe.map.find(key) != stripe.map.end();
        }

        /// @brief Sum of stripe sizes. Not a snapshot under concurrent writes.
        std::size_t size() const
        {
            std::size_t total = 0;
            for (std::size_t i = 0; i < m_stripe_count; ++i)
            {
                std::shared_lock<std::shared_mutex> lock(m_stripes[i].mutex);
                total += m_stripes[i].map.size();
            }
            return total;
        }

        /// @brief Visits every entry, one stripe at a time under its shared lock.
        template <typename Visitor>
        void forEach(Visitor &&visitor) const
        {
            for (std::size_t i = 0; i < m_stripe_count; ++i)
            {
                std::shared_lock<std::shared_mutex> lock(m_stripes[i].mutex);
                for (const auto &entry : m_stripes[i].map)
                {
                    visitor(entry.first, entry.second);
                }
            }
        }

        void clear()
        {
            for (std::size_t i = 0; i < m_stripe_count; ++i)
            {
                std::unique_lock<std::shared_mutex> lock(m_stripes[i].mutex);
                m_stripes[i].map.clear();
            }
        }

        std::size_t stripeCount() const
        {
            return m_stripe_count;
        }

    private:
        struct Stripe
        {
            mutable std::shared_mutex mutex;
            std::unordered_map<K, V, Hash, KeyEqual> map;
        };

        Stripe &stripeFor(const K &key)
        {
            return m_stripes[Hash{}(key) % m_stripe_count];
        }

        const Stripe &stripeFor(const K &key) const
        {
            return m_stripes[Hash{}(key) % m_stripe_count];
        }

        std::size_t m_stripe_count;
        std::unique_ptr<Stripe[]> m_stripes;
    };

} // namespace core

#endif // CONCURRENT_HASH_MAP_HPP
