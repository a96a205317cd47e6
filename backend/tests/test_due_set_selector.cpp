#include "core/DueSetSelector.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>
#include <random>

namespace {

constexpr std::time_t T0 = 1700000000;
constexpr std::time_t DAY = SECONDS_PER_DAY;

} // namespace

class DueSetSelectorTest : public ::testing::Test {
protected:
    DueSetSelector selector;
    std::vector<ScheduledItem> pool;

    // Item whose next due date is dueAt, reviewed intervalDays before that.
    void add(const std::string& id, std::time_t dueAt, double ease = 2.5, int intervalDays = 1) {
        ScheduledItem e{ ReviewItem(id, "ref-" + id, T0 - 100 * DAY), SchedulingState::initial(T0 - 100 * DAY) };
        e.state.ease_factor = ease;
        e.state.interval_days = intervalDays;
        e.state.streak = 1;
        e.state.review_count = 1;
        e.state.last_reviewed_at = dueAt - intervalDays * DAY;
        pool.push_back(e);
    }

    static std::vector<std::string> ids(const std::vector<const ScheduledItem*>& list) {
        std::vector<std::string> out;
        for (auto* e : list) out.push_back(e->item.id);
        return out;
    }
};

TEST_F(DueSetSelectorTest, NewItemIsDueAtCreation) {
    ScheduledItem e{ ReviewItem("new", "ref", T0), SchedulingState::initial(T0) };
    pool.push_back(e);

    EXPECT_EQ(selector.selectDue(pool, T0, 10).size(), 1u);
    EXPECT_EQ(selector.selectDue(pool, T0 + 10 * DAY, 10).size(), 1u);
    EXPECT_TRUE(selector.selectDue(pool, T0 - 1, 10).empty());
}

TEST_F(DueSetSelectorTest, MostOverdueFirst) {
    add("a", T0 - 1 * DAY);
    add("b", T0 - 5 * DAY);
    add("c", T0);
    add("future", T0 + DAY);

    auto due = selector.selectDue(pool, T0, 10);
    EXPECT_EQ(ids(due), (std::vector<std::string>{"b", "a", "c"}));
}

TEST_F(DueSetSelectorTest, HarderItemWinsTie) {
    add("easy", T0 - DAY, 2.7);
    add("hard", T0 - DAY, 1.4);
    add("medium", T0 - DAY, 2.0);

    auto due = selector.selectDue(pool, T0, 10);
    EXPECT_EQ(ids(due), (std::vector<std::string>{"hard", "medium", "easy"}));
}

TEST_F(DueSetSelectorTest, LimitTruncatesWithoutTouchingExcluded) {
    for (int i = 0; i < 6; ++i) {
        add("item" + std::to_string(i), T0 - i * DAY);
    }
    std::vector<std::time_t> dueBefore;
    for (const auto& e : pool) dueBefore.push_back(e.state.nextDueAt());

    auto due = selector.selectDue(pool, T0, 2);
    EXPECT_EQ(ids(due), (std::vector<std::string>{"item5", "item4"}));

    for (size_t i = 0; i < pool.size(); ++i) {
        EXPECT_EQ(pool[i].state.nextDueAt(), dueBefore[i]);
    }
}

TEST_F(DueSetSelectorTest, EmptyWhenNothingDue) {
    add("later", T0 + 3 * DAY);
    EXPECT_TRUE(selector.selectDue(pool, T0, 5).empty());
    EXPECT_EQ(selector.countDue(pool, T0), 0u);
}

TEST_F(DueSetSelectorTest, ZeroLimitIsRejected) {
    add("a", T0);
    EXPECT_THROW(selector.selectDue(pool, T0, 0), InvalidArgumentError);
    EXPECT_THROW(selector.selectDueWithTag(pool, T0, 0, "x"), InvalidArgumentError);
}

TEST_F(DueSetSelectorTest, TagFilter) {
    add("bio", T0 - DAY);
    add("chem", T0 - 2 * DAY);
    pool[0].item.addTag("biology");

    auto due = selector.selectDueWithTag(pool, T0, 10, "biology");
    EXPECT_EQ(ids(due), (std::vector<std::string>{"bio"}));
}

TEST_F(DueSetSelectorTest, NeverReturnsFutureItems) {
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> offset(-30, 30);
    std::uniform_real_distribution<double> ease(1.3, 3.0);
    for (int i = 0; i < 300; ++i) {
        add("r" + std::to_string(i), T0 + offset(rng) * DAY / 2, ease(rng));
    }

    auto due = selector.selectDue(pool, T0, 1000);
    EXPECT_EQ(due.size(), selector.countDue(pool, T0));
    for (size_t i = 0; i < due.size(); ++i) {
        EXPECT_LE(due[i]->state.nextDueAt(), T0);
        if (i > 0) {
            EXPECT_LE(due[i - 1]->state.nextDueAt(), due[i]->state.nextDueAt());
        }
    }
}
