#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rota/scheduler/wrr_scheduler.hpp"

using namespace rota;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

class WrrSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    template <typename Scheduler>
    static auto drain(const Scheduler& scheduler, std::size_t n)
        -> std::vector<std::string> {
        std::vector<std::string> picked;
        for (std::size_t i = 0; i < n; ++i) {
            auto item = scheduler.select();
            if (!item) {
                break;
            }
            picked.push_back(item->data());
        }
        return picked;
    }

    // The five-backend scenario: three publications, total weight 13
    static void fillBackends(WrrScheduler<std::string>& scheduler) {
        scheduler.insertMany({{"a", 1}, {"b", 2}});
        scheduler.insert("c", 3);
        scheduler.insertMany({{"d", 5}, {"e", 2}});
    }
};

TEST_F(WrrSchedulerTest, EmptySchedulerSelectsNothing) {
    WrrScheduler<std::string> scheduler;
    EXPECT_TRUE(scheduler.empty());
    EXPECT_EQ(scheduler.size(), 0u);
    EXPECT_EQ(scheduler.generation(), 0u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(scheduler.select(), nullptr);
    }
    EXPECT_EQ(scheduler.cursor(), 0u);
    EXPECT_TRUE(scheduler.selectMany(3).empty());
}

TEST_F(WrrSchedulerTest, TwoEntriesAlternateByWeight) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 1}, {"b", 2}});
    EXPECT_THAT(drain(scheduler, 9),
                ElementsAre("b", "a", "b", "b", "a", "b", "b", "a", "b"));
}

TEST_F(WrrSchedulerTest, EqualWeightsAlternate) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 1}, {"b", 1}});
    EXPECT_THAT(drain(scheduler, 6), ElementsAre("a", "b", "a", "b", "a", "b"));
}

TEST_F(WrrSchedulerTest, FiveBackendScenario) {
    WrrScheduler<std::string> scheduler;
    fillBackends(scheduler);
    EXPECT_EQ(scheduler.size(), 5u);
    EXPECT_EQ(scheduler.totalWeight(), 13u);
    EXPECT_EQ(scheduler.generation(), 3u);

    // Earlier publications advanced nothing, so the cycle starts at slot 0
    ASSERT_EQ(scheduler.cursor(), 0u);
    auto cycle = drain(scheduler, 13);
    EXPECT_THAT(cycle, ElementsAreArray({"d", "c", "b", "e", "d", "a", "d",
                                         "c", "d", "b", "e", "c", "d"}));

    std::map<std::string, int> counts;
    for (const auto& name : cycle) {
        counts[name]++;
    }
    EXPECT_EQ(counts["a"], 1);
    EXPECT_EQ(counts["b"], 2);
    EXPECT_EQ(counts["c"], 3);
    EXPECT_EQ(counts["d"], 5);
    EXPECT_EQ(counts["e"], 2);

    for (std::size_t i = 1; i < cycle.size(); ++i) {
        EXPECT_FALSE(cycle[i] == "d" && cycle[i - 1] == "d")
            << "adjacent d at " << i;
    }

    EXPECT_EQ(drain(scheduler, 13), cycle);
}

TEST_F(WrrSchedulerTest, CursorWalksEveryPositionOncePerCycle) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"x", 3}, {"y", 1}, {"z", 2}});
    auto schedule = scheduler.snapshot();
    ASSERT_EQ(schedule->length(), 6u);

    for (std::uint64_t call = 0; call < 18; ++call) {
        EXPECT_EQ(scheduler.cursor(), call);
        auto item = scheduler.select();
        ASSERT_NE(item, nullptr);
        EXPECT_EQ(item, schedule->at(call));
    }
}

TEST_F(WrrSchedulerTest, CursorSurvivesRegeneration) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 1}, {"b", 1}});
    (void)scheduler.selectMany(3);
    ASSERT_EQ(scheduler.cursor(), 3u);

    scheduler.insert("c", 1);
    EXPECT_EQ(scheduler.cursor(), 3u);
    // Slot 3 % 3 of the new cycle [a, b, c]
    EXPECT_EQ(scheduler.select()->data(), "a");
}

TEST_F(WrrSchedulerTest, DefaultWeightFromOptions) {
    SchedulerOptions options;
    options.defaultWeight = 3;
    WrrScheduler<std::string> scheduler(options);
    scheduler.insert("only");
    EXPECT_EQ(scheduler.totalWeight(), 3u);
    EXPECT_EQ(scheduler.snapshot()->entries()[0]->weight(), 3u);
}

TEST_F(WrrSchedulerTest, DuplicatePayloadsAreDistinctEntries) {
    WrrScheduler<std::string> scheduler;
    scheduler.insert("same", 1);
    scheduler.insert("same", 2);
    EXPECT_EQ(scheduler.size(), 2u);
    EXPECT_EQ(scheduler.totalWeight(), 3u);
}

TEST_F(WrrSchedulerTest, ZeroWeightRejected) {
    WrrScheduler<std::string> scheduler;
    scheduler.insert("a", 1);
    EXPECT_THROW(scheduler.insert("b", 0), algorithm::InvalidWeight);
    EXPECT_EQ(scheduler.size(), 1u);
    EXPECT_EQ(scheduler.generation(), 1u);
}

TEST_F(WrrSchedulerTest, BatchIsAllOrNothing) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 1}, {"b", 2}});
    auto before = scheduler.snapshot();

    EXPECT_THROW(scheduler.insertMany({{"c", 3}, {"d", 0}, {"e", 1}}),
                 algorithm::InvalidWeight);

    EXPECT_EQ(scheduler.snapshot(), before);
    EXPECT_EQ(scheduler.size(), 2u);
    EXPECT_EQ(scheduler.generation(), 1u);
    EXPECT_THAT(drain(scheduler, 3), ElementsAre("b", "a", "b"));
}

TEST_F(WrrSchedulerTest, NegativePairWeightRejected) {
    WrrScheduler<std::string> scheduler;
    std::vector<std::pair<std::string, int>> batch = {{"a", 1}, {"b", -2}};
    EXPECT_THROW(scheduler.insertMany(batch), algorithm::InvalidWeight);
    EXPECT_TRUE(scheduler.empty());
}

TEST_F(WrrSchedulerTest, CapacityExceeded) {
    SchedulerOptions options;
    options.maxTotalWeight = 10;
    WrrScheduler<std::string> scheduler(options);
    scheduler.insert("a", 6);

    EXPECT_THROW(scheduler.insert("b", 5), algorithm::CapacityExceeded);
    EXPECT_THROW(scheduler.insertMany({{"b", 2}, {"c", 3}}),
                 algorithm::CapacityExceeded);
    EXPECT_EQ(scheduler.totalWeight(), 6u);

    scheduler.insert("b", 4);
    EXPECT_EQ(scheduler.totalWeight(), 10u);
}

TEST_F(WrrSchedulerTest, EmptyBatchIsNoop) {
    WrrScheduler<std::string> scheduler;
    std::vector<Entry<std::string>> batch;
    scheduler.insertMany(batch);
    EXPECT_EQ(scheduler.generation(), 0u);
}

TEST_F(WrrSchedulerTest, InsertManyAcceptsEntries) {
    WrrScheduler<std::string> scheduler;
    std::vector<Entry<std::string>> batch = {{"a", 2}, {"b", 1}};
    scheduler.insertMany(batch);
    EXPECT_THAT(drain(scheduler, 3), ElementsAre("a", "b", "a"));
}

TEST_F(WrrSchedulerTest, UpdateWeightRegenerates) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 1}, {"b", 1}});
    auto held = scheduler.snapshot()->entries()[0];

    scheduler.updateWeight(0, 3);
    EXPECT_EQ(scheduler.totalWeight(), 4u);
    EXPECT_EQ(scheduler.generation(), 2u);
    EXPECT_EQ(scheduler.snapshot()->entries()[0]->weight(), 3u);
    EXPECT_EQ(held->weight(), 1u);

    EXPECT_THROW(scheduler.updateWeight(5, 1), std::out_of_range);
    EXPECT_THROW(scheduler.updateWeight(1, 0), algorithm::InvalidWeight);
    EXPECT_EQ(scheduler.generation(), 2u);
}

TEST_F(WrrSchedulerTest, RemoveKeepsHeldReferencesAlive) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"a", 2}, {"b", 1}, {"c", 1}});
    auto picked = scheduler.select();
    ASSERT_EQ(picked->data(), "a");

    scheduler.remove(0);
    EXPECT_EQ(scheduler.size(), 2u);
    EXPECT_EQ(picked->data(), "a");
    EXPECT_EQ(picked->weight(), 2u);

    for (const auto& name : drain(scheduler, 4)) {
        EXPECT_NE(name, "a");
    }
    EXPECT_THROW(scheduler.remove(2), std::out_of_range);
}

TEST_F(WrrSchedulerTest, RemoveIfCountsRemovals) {
    WrrScheduler<std::string> scheduler;
    scheduler.insertMany({{"keep", 1}, {"drop", 1}, {"drop", 4}});
    const auto generation = scheduler.generation();

    EXPECT_EQ(scheduler.removeIf(
                  [](const std::string& s) { return s == "missing"; }),
              0u);
    EXPECT_EQ(scheduler.generation(), generation);

    EXPECT_EQ(
        scheduler.removeIf([](const std::string& s) { return s == "drop"; }),
        2u);
    EXPECT_EQ(scheduler.size(), 1u);
    EXPECT_EQ(scheduler.generation(), generation + 1);
}

TEST_F(WrrSchedulerTest, RemovingLastEntryEmptiesSchedule) {
    WrrScheduler<std::string> scheduler;
    scheduler.insert("a", 2);
    scheduler.remove(0);
    EXPECT_TRUE(scheduler.empty());
    EXPECT_EQ(scheduler.select(), nullptr);
}

TEST_F(WrrSchedulerTest, ClearResetsCursor) {
    WrrScheduler<std::string> scheduler;
    fillBackends(scheduler);
    (void)scheduler.selectMany(7);
    ASSERT_EQ(scheduler.cursor(), 7u);

    scheduler.clear();
    EXPECT_TRUE(scheduler.empty());
    EXPECT_EQ(scheduler.cursor(), 0u);
    EXPECT_EQ(scheduler.generation(), 4u);
    EXPECT_EQ(scheduler.select(), nullptr);

    fillBackends(scheduler);
    EXPECT_EQ(scheduler.select()->data(), "d");
}

TEST_F(WrrSchedulerTest, SnapshotOutlivesPublication) {
    WrrScheduler<std::string> scheduler;
    scheduler.insert("a", 1);
    auto old = scheduler.snapshot();
    scheduler.insert("b", 1);

    EXPECT_EQ(old->size(), 1u);
    EXPECT_EQ(old->generation(), 1u);
    ASSERT_EQ(old->length(), 1u);
    EXPECT_EQ(old->cycle()[0], 0u);
    EXPECT_EQ(scheduler.snapshot()->length(), 2u);
}

TEST_F(WrrSchedulerTest, MoveOnlyPayload) {
    WrrScheduler<std::unique_ptr<int>> scheduler;
    scheduler.insert(std::make_unique<int>(7), 2);
    auto picked = scheduler.select();
    ASSERT_NE(picked, nullptr);
    EXPECT_EQ(*picked->data(), 7);
}

TEST_F(WrrSchedulerTest, InvalidOptionsRejected) {
    SchedulerOptions options;
    options.maxTotalWeight = 0;
    EXPECT_THROW(WrrScheduler<int>{options}, std::invalid_argument);
}

template <typename Scheduler>
class SchedulerFlavorTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

using SchedulerFlavors =
    ::testing::Types<BlockingWrrScheduler<int>, SpinningWrrScheduler<int>>;
TYPED_TEST_SUITE(SchedulerFlavorTest, SchedulerFlavors);

TYPED_TEST(SchedulerFlavorTest, FlavorsProduceTheSameCycle) {
    TypeParam scheduler;
    scheduler.insertMany({{1, 1}, {2, 2}, {3, 3}, {4, 5}, {5, 2}});
    std::vector<int> picked;
    for (int i = 0; i < 13; ++i) {
        picked.push_back(scheduler.select()->data());
    }
    EXPECT_THAT(picked, ElementsAre(4, 3, 2, 5, 4, 1, 4, 3, 4, 2, 5, 3, 4));
}
