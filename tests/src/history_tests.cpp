#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "bytecache/history.h"

using namespace bytecache;

using TestHistory = History<uint32_t>;
using Usage       = std::vector<uint64_t>;

std::vector<uint32_t> spill_and_get_sorted(TestHistory& history)
{
    std::set<std::pair<uint32_t, uint64_t>> spilled;
    history.spill(spilled);

    std::vector<uint32_t> keys;
    for (const auto& [key, cost] : spilled) {
        keys.push_back(key);
    }
    return keys;
}

uint64_t sum(const Usage& bands)
{
    uint64_t total = 0;
    for (auto band : bands) {
        total += band;
    }
    return total;
}

TEST(History, SpillsOldest)
{
    TestHistory history{2, 2};
    history.hit(1, 2);
    history.hit(2, 2);
    history.hit(3, 2);

    EXPECT_EQ(history.simple_usage(), (Usage{2, 2, 2, 0}));
    EXPECT_EQ(history.usage(), 6);

    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{1});

    EXPECT_EQ(history.simple_usage(), (Usage{0, 2, 2, 0}));
    EXPECT_EQ(history.usage(), 4);
}

TEST(History, SupportsOversizedItems)
{
    TestHistory history{2, 2};

    // Every item is larger than a generation, so every hit seals its own generation.
    history.hit(1, 4);
    history.hit(2, 5);
    history.hit(3, 6);

    EXPECT_EQ(history.simple_usage(), (Usage{4, 5, 6, 0}));
    EXPECT_EQ(history.usage(), 15);

    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{1});

    EXPECT_EQ(history.simple_usage(), (Usage{0, 5, 6, 0}));
    EXPECT_EQ(history.usage(), 11);
}

TEST(History, SupportsSmallItems)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    history.hit(3, 1);

    EXPECT_EQ(history.simple_usage(), (Usage{0, 2, 1}));
    EXPECT_EQ(history.usage(), 3);

    history.hit(4, 1);
    history.hit(5, 1);

    EXPECT_EQ(history.simple_usage(), (Usage{2, 2, 1}));
    EXPECT_EQ(history.usage(), 5);

    EXPECT_EQ(spill_and_get_sorted(history), (std::vector<uint32_t>{1, 2}));

    EXPECT_EQ(history.simple_usage(), (Usage{0, 2, 1}));
    EXPECT_EQ(history.usage(), 3);
}

TEST(History, DigsOutWhenUsedAgain)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);

    history.hit(1, 1);

    EXPECT_EQ(history.simple_usage(), (Usage{0, 1, 1}));
    EXPECT_EQ(history.usage(), 2);
}

TEST(History, DigsOutOfOldBand)
{
    TestHistory history{1, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    EXPECT_EQ(history.simple_usage(), (Usage{1, 1, 0}));

    // Key 1 is due for reclamation, hitting it again brings it back.
    history.hit(1, 1);

    EXPECT_EQ(history.simple_usage(), (Usage{1, 1, 0}));
    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{2});
    EXPECT_TRUE(history.contains(1));
}

TEST(History, RepeatedHitIsIdempotent)
{
    TestHistory history{10, 2};
    history.hit(1, 3);
    history.hit(2, 4);

    const auto usage_before = history.simple_usage();

    history.hit(1, 3);
    history.hit(1, 3);

    EXPECT_EQ(history.simple_usage(), usage_before);
    EXPECT_EQ(history.usage(), 7);
}

TEST(History, CostChangeUpdatesInPlace)
{
    TestHistory history{10, 2};
    history.hit(1, 3);
    history.hit(1, 5);

    EXPECT_EQ(history.simple_usage(), (Usage{0, 5}));
    EXPECT_EQ(history.usage(), 5);

    // Growing past the threshold seals the generation.
    history.hit(1, 12);
    EXPECT_EQ(history.simple_usage(), (Usage{0, 12, 0}));
}

TEST(History, RemovesRecent)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    history.hit(3, 1);

    EXPECT_TRUE(history.remove(3));

    EXPECT_EQ(history.simple_usage(), (Usage{0, 2, 0}));
    EXPECT_EQ(history.usage(), 2);
}

TEST(History, RemovesSealed)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    history.hit(3, 1);

    EXPECT_TRUE(history.remove(1));
    EXPECT_TRUE(history.remove(2));

    EXPECT_EQ(history.simple_usage(), (Usage{0, 0, 1}));
    EXPECT_EQ(history.usage(), 1);
}

TEST(History, RemovesOld)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    history.hit(3, 1);
    history.hit(4, 1);
    history.hit(5, 1);

    EXPECT_EQ(history.simple_usage(), (Usage{2, 2, 1}));

    EXPECT_TRUE(history.remove(1));

    EXPECT_EQ(history.simple_usage(), (Usage{1, 2, 1}));
    EXPECT_EQ(history.usage(), 4);
    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{2});
}

TEST(History, RemoveAbsentIsNoOp)
{
    TestHistory history{2, 1};
    history.hit(1, 1);
    history.hit(2, 1);
    history.hit(3, 1);

    EXPECT_FALSE(history.remove(42));

    EXPECT_EQ(history.simple_usage(), (Usage{0, 2, 1}));
    EXPECT_EQ(history.usage(), 3);
}

TEST(History, SecondSpillIsEmpty)
{
    TestHistory history{2, 2};
    history.hit(1, 2);
    history.hit(2, 2);
    history.hit(3, 2);

    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{1});
    EXPECT_TRUE(spill_and_get_sorted(history).empty());
}

TEST(History, SpillsOnlyAfterEnoughRotations)
{
    // With a threshold of one byte, every hit seals a generation.
    TestHistory history{1, 2};

    for (uint32_t key = 0; key < 10; ++key) {
        history.hit(key, 1);

        const auto spilled = spill_and_get_sorted(history);
        if (key < 2) {
            EXPECT_TRUE(spilled.empty());
        } else {
            // A key is reclaimed after its own rotation and two more.
            EXPECT_EQ(spilled, std::vector<uint32_t>{key - 2});
        }
    }
}

TEST(History, LargeGenerationsRotateInSteadyState)
{
    // Generations large enough for the recycled buckets to hold hundreds of slots.
    constexpr uint32_t generation_size = 1000;
    TestHistory        history{generation_size, 2};

    for (uint32_t generation = 0; generation < 10; ++generation) {
        const uint32_t first_key = generation * generation_size;
        for (uint32_t key = first_key; key < first_key + generation_size; ++key) {
            history.hit(key, 1);
        }

        const auto spilled = spill_and_get_sorted(history);
        if (generation < 2) {
            EXPECT_TRUE(spilled.empty());
            continue;
        }

        ASSERT_EQ(spilled.size(), generation_size);
        EXPECT_EQ(spilled.front(), first_key - 2 * generation_size);
        EXPECT_EQ(spilled.back(), first_key - generation_size - 1);
        EXPECT_EQ(history.simple_usage(), (Usage{0, generation_size, generation_size, 0}));
        EXPECT_FALSE(history.contains(spilled.front()));
        EXPECT_TRUE(history.contains(first_key));
    }
}

TEST(History, HitDelaysSpill)
{
    TestHistory history{1, 2};
    history.hit(0, 1);
    history.hit(1, 1);

    // Key 0 is about to fall out of the ring, refresh it.
    history.hit(0, 1);
    history.hit(2, 1);

    EXPECT_EQ(spill_and_get_sorted(history), std::vector<uint32_t>{1});
    EXPECT_TRUE(history.contains(0));
}

TEST(History, DetailedUsage)
{
    TestHistory history{2, 2};
    EXPECT_EQ(history.detailed_usage(), (std::vector<TestHistory::BandUsage>{{0, std::nullopt}, {0, 2}}));

    history.hit(1, 2);
    history.hit(2, 2);
    history.hit(3, 2);
    history.hit(4, 1);

    const std::vector<TestHistory::BandUsage> expected{{2, std::nullopt}, {2, 2}, {2, 2}, {1, 2}};
    EXPECT_EQ(history.detailed_usage(), expected);
}

TEST(History, WithoutSealedGenerations)
{
    TestHistory history{2, 0};
    history.hit(1, 1);
    EXPECT_EQ(history.simple_usage(), (Usage{0, 1}));

    history.hit(2, 1);
    EXPECT_EQ(history.simple_usage(), (Usage{2, 0}));

    EXPECT_EQ(spill_and_get_sorted(history), (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(history.usage(), 0);
}

TEST(History, Clear)
{
    TestHistory history{2, 2};
    history.hit(1, 2);
    history.hit(2, 2);
    history.hit(3, 2);

    history.clear();

    EXPECT_EQ(history.usage(), 0);
    EXPECT_EQ(history.simple_usage(), (Usage{0, 0}));
    EXPECT_FALSE(history.contains(1));
    EXPECT_TRUE(spill_and_get_sorted(history).empty());
}

TEST(History, SpillIntoVariousContainers)
{
    auto make_history = []() {
        TestHistory history{1, 1};
        history.hit(1, 3);
        history.hit(2, 4);
        history.hit(3, 5);
        return history;
    };

    {
        auto                                    history = make_history();
        std::vector<std::pair<uint32_t, uint64_t>> spilled;
        history.spill(spilled);
        std::sort(spilled.begin(), spilled.end());
        EXPECT_EQ(spilled, (std::vector<std::pair<uint32_t, uint64_t>>{{1, 3}, {2, 4}}));
    }

    {
        auto                         history = make_history();
        std::map<uint32_t, uint64_t> spilled;
        history.spill(spilled);
        EXPECT_EQ(spilled, (std::map<uint32_t, uint64_t>{{1, 3}, {2, 4}}));
    }

    {
        // A collector that supports neither size nor reserve.
        struct CustomCollector {
            void emplace(const uint32_t& key, const uint64_t& cost)
            {
                m_total += cost;
                m_keys.insert(key);
            }

            std::set<uint32_t> m_keys;
            uint64_t           m_total = 0;
        };

        auto            history = make_history();
        CustomCollector spilled;
        history.spill(spilled);
        EXPECT_EQ(spilled.m_keys, (std::set<uint32_t>{1, 2}));
        EXPECT_EQ(spilled.m_total, 7);
    }
}

TEST(History, StringKeys)
{
    History<std::string> history{4, 1};
    history.hit("asdf", 4);
    history.hit("hjkl", 4);

    std::vector<std::pair<std::string, uint64_t>> spilled;
    history.spill(spilled);

    ASSERT_EQ(spilled.size(), 1);
    EXPECT_EQ(spilled.front().first, "asdf");
    EXPECT_EQ(history.usage(), 4);
    EXPECT_TRUE(history.contains("hjkl"));
}

TEST(History, RandomOperationsKeepAccountingExact)
{
    TestHistory                  history{16, 3};
    std::map<uint32_t, uint64_t> tracked;

    std::default_random_engine              rng{42};
    std::uniform_int_distribution<uint32_t> key_distribution{0, 63};
    std::uniform_int_distribution<uint64_t> cost_distribution{0, 9};
    std::uniform_int_distribution<int>      operation_distribution{0, 9};

    for (int i = 0; i < 10000; ++i) {
        const uint32_t key       = key_distribution(rng);
        const int      operation = operation_distribution(rng);

        if (operation < 7) {
            const uint64_t cost = cost_distribution(rng);
            history.hit(key, cost);
            tracked[key] = cost;
        } else if (operation < 9) {
            EXPECT_EQ(history.remove(key), tracked.erase(key) == 1);
        } else {
            std::vector<std::pair<uint32_t, uint64_t>> spilled;
            history.spill(spilled);
            for (const auto& [spilled_key, spilled_cost] : spilled) {
                ASSERT_EQ(tracked.at(spilled_key), spilled_cost);
                tracked.erase(spilled_key);
            }
        }

        uint64_t expected_usage = 0;
        for (const auto& [tracked_key, tracked_cost] : tracked) {
            expected_usage += tracked_cost;
        }

        // A key tracked in two bands would be counted twice.
        ASSERT_EQ(history.usage(), expected_usage);
        ASSERT_EQ(sum(history.simple_usage()), expected_usage);
        ASSERT_EQ(history.contains(key), tracked.find(key) != tracked.end());
        ASSERT_LE(history.simple_usage().size(), 3 + 2);
    }
}
