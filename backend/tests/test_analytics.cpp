#include "core/ReviewAnalytics.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>

namespace {

constexpr std::time_t T0 = 1700000000;
constexpr std::time_t DAY = SECONDS_PER_DAY;

ReviewEvent eventFor(const std::string& id, std::time_t when, double quality) {
    ReviewEvent ev;
    ev.item_id = id;
    ev.timestamp = when;
    ev.quality = quality;
    ev.raw = RawSignal::rated(quality);
    return ev;
}

ScheduledItem dueAt(const std::string& id, std::time_t when, double ease = 2.5) {
    ScheduledItem e{ ReviewItem(id, "ref", T0 - 30 * DAY), SchedulingState::initial(T0 - 30 * DAY) };
    e.state.ease_factor = ease;
    e.state.interval_days = 0;
    e.state.review_count = 1;
    e.state.last_reviewed_at = when;
    return e;
}

} // namespace

TEST(AnalyticsTest, MasteryScore) {
    SchedulingState s = SchedulingState::initial(T0);
    EXPECT_DOUBLE_EQ(Analytics::masteryScore(s), 0.5);

    s.streak = 10;
    s.review_count = 10;
    EXPECT_DOUBLE_EQ(Analytics::masteryScore(s), 1.0);

    s.ease_factor = 1.3;
    s.streak = 0;
    EXPECT_DOUBLE_EQ(Analytics::masteryScore(s), 0.0);
}

TEST(AnalyticsTest, PerformanceReportFlagsDifficultAndImproving) {
    std::vector<ReviewEvent> events;
    double qualities[] = {1, 1, 1, 5, 5, 5};
    for (int i = 0; i < 6; ++i) {
        events.push_back(eventFor("climber", T0 + i * DAY, qualities[i]));
    }
    events.push_back(eventFor("steady", T0, 5));
    events.push_back(eventFor("steady", T0 + DAY, 5));

    PerformanceReport report = Analytics::analyzePerformance(events);

    ASSERT_EQ(report.items.size(), 2u);
    const ItemPerformance& climber = report.items.at("climber");
    EXPECT_EQ(climber.review_count, 6u);
    EXPECT_DOUBLE_EQ(climber.average_quality, 3.0);
    EXPECT_DOUBLE_EQ(climber.pass_rate, 0.5);
    EXPECT_NEAR(climber.trend, 0.8, 1e-12);

    EXPECT_DOUBLE_EQ(report.items.at("steady").trend, 0.0);
    EXPECT_DOUBLE_EQ(report.overall_pass_rate, 5.0 / 8.0);
    EXPECT_EQ(report.difficult_items, (std::vector<std::string>{"climber"}));
    EXPECT_EQ(report.improving_items, (std::vector<std::string>{"climber"}));
}

TEST(AnalyticsTest, EmptyHistoryGivesEmptyReport) {
    PerformanceReport report = Analytics::analyzePerformance({});
    EXPECT_TRUE(report.items.empty());
    EXPECT_DOUBLE_EQ(report.overall_pass_rate, 0.0);
}

TEST(AnalyticsTest, ForecastBucketsByDay) {
    std::vector<ScheduledItem> items = {
        dueAt("overdue", T0 - DAY),
        dueAt("today", T0 + DAY / 2),
        dueAt("in2", T0 + 2 * DAY + 60),
        dueAt("far", T0 + 30 * DAY),
    };

    auto counts = Analytics::forecastDue(items, T0, 7);
    ASSERT_EQ(counts.size(), 7u);
    EXPECT_EQ(counts[0], 2u);
    EXPECT_EQ(counts[1], 0u);
    EXPECT_EQ(counts[2], 1u);

    EXPECT_THROW(Analytics::forecastDue(items, T0, 0), InvalidArgumentError);
}

TEST(AnalyticsTest, EaseDistribution) {
    std::vector<ScheduledItem> items = {
        dueAt("a", T0, 1.3), dueAt("b", T0, 1.6), dueAt("c", T0, 2.0),
        dueAt("d", T0, 2.3), dueAt("e", T0, 2.5), dueAt("f", T0, 2.9),
    };

    auto bands = Analytics::easeDistribution(items);
    ASSERT_EQ(bands.size(), 5u);
    EXPECT_EQ(bands[0].count, 1u);
    EXPECT_EQ(bands[1].count, 1u);
    EXPECT_EQ(bands[2].count, 1u);
    EXPECT_EQ(bands[3].count, 1u);
    EXPECT_EQ(bands[4].count, 2u);
}

TEST(ReviewLogTest, KeepsPerItemOrderAndRejectsBackdating) {
    ReviewLog log;
    log.append(eventFor("x", T0, 4));
    log.append(eventFor("y", T0 - DAY, 2));
    log.append(eventFor("x", T0 + DAY, 5));

    EXPECT_EQ(log.size(), 3u);
    ASSERT_EQ(log.eventsFor("x").size(), 2u);
    EXPECT_EQ(log.eventsFor("x")[1].timestamp, T0 + DAY);
    EXPECT_TRUE(log.eventsFor("missing").empty());

    auto all = log.all();
    EXPECT_EQ(all.front().item_id, "y");

    EXPECT_THROW(log.append(eventFor("x", T0, 3)), InvalidArgumentError);
    EXPECT_EQ(log.size(), 3u);
}
