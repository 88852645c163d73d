#include <gtest/gtest.h>
#include "core/ConcurrentHashMap.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using IntMap = core::ConcurrentHashMap<int, int>;

TEST(ConcurrentHashMap, RejectsZeroStripes)
{
    EXPECT_THROW(IntMap map(0), std::invalid_argument);
}

TEST(ConcurrentHashMap, GetMissingKey)
{
    IntMap map;
    EXPECT_FALSE(map.get(42).has_value());
    EXPECT_FALSE(map.contains(42));
    EXPECT_EQ(map.size(), 0u);
}

TEST(ConcurrentHashMap, ComputeIfAbsentInsertsOnce)
{
    IntMap map;
    int factory_calls = 0;

    int first = map.computeIfAbsent(1, [&]
                                    { ++factory_calls; return 10; });
    int second = map.computeIfAbsent(1, [&]
                                     { ++factory_calls; return 20; });

    EXPECT_EQ(first, 10);
    EXPECT_EQ(second, 10);
    EXPECT_EQ(factory_calls, 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST(ConcurrentHashMap, ComputeSeesCurrentValue)
{
    IntMap map;

    int inserted = map.compute(7, [](const int *current)
                               {
        EXPECT_EQ(current, nullptr);
        return 1; });
    int replaced = map.compute(7, [](const int *current)
                               { return *current + 1; });

    EXPECT_EQ(inserted, 1);
    EXPECT_EQ(replaced, 2);
    EXPECT_EQ(map.get(7).value(), 2);
}

TEST(ConcurrentHashMap, RemoveIfOnlyMatchingValue)
{
    IntMap map;
    map.compute(3, [](const int *)
                { return 30; });

    EXPECT_FALSE(map.removeIf(3, 31));
    EXPECT_TRUE(map.contains(3));

    EXPECT_TRUE(map.removeIf(3, 30));
    EXPECT_FALSE(map.contains(3));
    EXPECT_FALSE(map.removeIf(3, 30));
}

TEST(ConcurrentHashMap, ForEachVisitsAllEntries)
{
    IntMap map(4);
    for (int i = 0; i < 100; ++i)
    {
        map.computeIfAbsent(i, [i]
                            { return i * 2; });
    }

    int sum = 0;
    int count = 0;
    map.forEach([&](const int &, const int &value)
                { sum += value; ++count; });

    EXPECT_EQ(count, 100);
    EXPECT_EQ(sum, 2 * (99 * 100 / 2));
    EXPECT_EQ(map.stripeCount(), 4u);
}

TEST(ConcurrentHashMap, ClearRemovesEverything)
{
    IntMap map;
    for (int i = 0; i < 10; ++i)
    {
        map.computeIfAbsent(i, []
                            { return 0; });
    }
    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

TEST(ConcurrentHashMap, ConcurrentComputeIsAtomicPerKey)
{
    IntMap map(8);
    const int threads = 8;
    const int increments = 10000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([&]
                             {
            for (int i = 0; i < increments; ++i)
            {
                map.compute(i % 16, [](const int *current)
                            { return current ? *current + 1 : 1; });
            } });
    }
    for (auto &w : workers)
    {
        w.join();
    }

    int total = 0;
    map.forEach([&](const int &, const int &value)
                { total += value; });
    EXPECT_EQ(total, threads * increments);
    EXPECT_EQ(map.size(), 16u);
}

TEST(ConcurrentHashMap, ConcurrentComputeIfAbsentCreatesSingleValue)
{
    core::ConcurrentHashMap<std::string, std::shared_ptr<int>> map;
    std::atomic<int> factory_calls{0};
    std::vector<std::shared_ptr<int>> seen(16);

    std::vector<std::thread> workers;
    for (int t = 0; t < 16; ++t)
    {
        workers.emplace_back([&, t]
                             { seen[t] = map.computeIfAbsent("origin", [&]
                                                             {
                ++factory_calls;
                return std::make_shared<int>(t); }); });
    }
    for (auto &w : workers)
    {
        w.join();
    }

    EXPECT_EQ(factory_calls.load(), 1);
    for (const auto &value : seen)
    {
        EXPECT_EQ(value, seen[0]);
    }
}
