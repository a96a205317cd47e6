#include "storage/Storage.hpp"
#include "core/SchedulingEngine.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr std::time_t T0 = 1700000000;
constexpr std::time_t DAY = SECONDS_PER_DAY;

} // namespace

class StorageTest : public ::testing::Test {
protected:
    fs::path test_dir = fs::temp_directory_path() / "retain_storage_test";

    void SetUp() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    std::string path(const std::string& name) const {
        return (test_dir / name).string();
    }
};

TEST_F(StorageTest, DeckKeepsStateAndNeverReviewedMarker) {
    SchedulingEngine engine;
    std::vector<ScheduledItem> items;

    ScheduledItem reviewed{ ReviewItem("r1", "note:7", T0), SchedulingState::initial(T0) };
    reviewed.item.setTags({"math", "proofs"});
    reviewed.state = engine.apply(reviewed.state, 5, T0 + DAY);
    reviewed.state = engine.apply(reviewed.state, 2, T0 + 2 * DAY);
    items.push_back(reviewed);

    items.push_back(ScheduledItem{ ReviewItem("n1", "note:8", T0 + 5), SchedulingState::initial(T0 + 5) });

    ASSERT_TRUE(Storage::saveDeck(items, path("deck.txt")));

    std::vector<ScheduledItem> loaded;
    ASSERT_TRUE(Storage::loadDeck(loaded, path("deck.txt")));
    ASSERT_EQ(loaded.size(), 2u);

    const SchedulingState& s = loaded[0].state;
    EXPECT_EQ(loaded[0].item.id, "r1");
    EXPECT_EQ(loaded[0].item.content_ref, "note:7");
    EXPECT_EQ(loaded[0].item.tags, (std::vector<std::string>{"math", "proofs"}));
    EXPECT_DOUBLE_EQ(s.ease_factor, reviewed.state.ease_factor);
    EXPECT_EQ(s.interval_days, 1);
    EXPECT_EQ(s.streak, 0);
    EXPECT_EQ(s.review_count, 2);
    EXPECT_EQ(s.lapses, 1);
    EXPECT_EQ(s.last_reviewed_at, reviewed.state.last_reviewed_at);
    EXPECT_DOUBLE_EQ(s.decay_half_life_days, reviewed.state.decay_half_life_days);
    EXPECT_EQ(s.nextDueAt(), reviewed.state.nextDueAt());

    EXPECT_FALSE(loaded[1].state.last_reviewed_at.has_value());
    EXPECT_EQ(loaded[1].state.nextDueAt(), T0 + 5);
    EXPECT_NO_THROW(loaded[1].state.validate(EngineConfig{}));
}

TEST_F(StorageTest, MissingFilesAreEmpty) {
    std::vector<ScheduledItem> items;
    EXPECT_TRUE(Storage::loadDeck(items, path("nope.txt")));
    EXPECT_TRUE(items.empty());

    ReviewLog log;
    EXPECT_TRUE(Storage::loadEvents(log, path("nope-events.txt")));
    EXPECT_TRUE(log.empty());
}

TEST_F(StorageTest, MalformedDeckIsRejected) {
    {
        std::ofstream out(path("bad.txt"));
        out << "id\nref\nnot-a-time\ntags\n2.5 0 0 0 0\n-\n2\n---\n";
    }
    std::vector<ScheduledItem> items;
    EXPECT_FALSE(Storage::loadDeck(items, path("bad.txt")));
    EXPECT_TRUE(items.empty());
}

TEST_F(StorageTest, EventLogKeepsSignalsAndSnapshots) {
    SchedulingEngine engine;
    SchedulingState s = SchedulingState::initial(T0);
    ReviewLog log;

    ReviewEvent first = engine.review("c1", s, RawSignal::answered(true, 2.5), T0);
    log.append(first);
    ReviewEvent second = engine.review("c1", first.resulting_state, RawSignal::graded(ReviewGrade::AGAIN), T0 + DAY);
    log.append(second);
    log.append(engine.review("c2", s, RawSignal::rated(3.5), T0 + 10));

    ASSERT_TRUE(Storage::saveEvents(log, path("events.txt")));

    ReviewLog loaded;
    ASSERT_TRUE(Storage::loadEvents(loaded, path("events.txt")));
    ASSERT_EQ(loaded.size(), 3u);

    const auto& c1 = loaded.eventsFor("c1");
    ASSERT_EQ(c1.size(), 2u);
    ASSERT_TRUE(c1[0].raw.correct.has_value());
    EXPECT_TRUE(*c1[0].raw.correct);
    EXPECT_DOUBLE_EQ(*c1[0].raw.response_seconds, 2.5);
    ASSERT_TRUE(c1[1].raw.grade.has_value());
    EXPECT_EQ(*c1[1].raw.grade, ReviewGrade::AGAIN);
    EXPECT_EQ(c1[1].resulting_state.lapses, 1);
    EXPECT_EQ(c1[1].resulting_state.last_reviewed_at, T0 + DAY);

    // the stored trail is enough to rebuild the latest state
    SchedulingState rebuilt = engine.replay(SchedulingState::initial(T0), c1);
    EXPECT_EQ(rebuilt.interval_days, second.resulting_state.interval_days);
    EXPECT_DOUBLE_EQ(rebuilt.ease_factor, second.resulting_state.ease_factor);
}

TEST_F(StorageTest, IdsWithSpacesAndNewlinesSurvive) {
    SchedulingEngine engine;
    std::vector<ScheduledItem> items;
    ScheduledItem card{ ReviewItem("card 1", "line one\nline\\two", T0), SchedulingState::initial(T0) };
    card.item.setTags({"set theory", "tab\there"});
    items.push_back(card);
    items.push_back(ScheduledItem{ ReviewItem("card2", "", T0 + 1), SchedulingState::initial(T0 + 1) });

    ASSERT_TRUE(Storage::saveDeck(items, path("deck.txt")));
    std::vector<ScheduledItem> loaded;
    ASSERT_TRUE(Storage::loadDeck(loaded, path("deck.txt")));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].item.id, "card 1");
    EXPECT_EQ(loaded[0].item.content_ref, "line one\nline\\two");
    EXPECT_EQ(loaded[0].item.tags, (std::vector<std::string>{"set theory", "tab\there"}));
    EXPECT_EQ(loaded[1].item.id, "card2");
    EXPECT_EQ(loaded[1].item.content_ref, "");

    ReviewLog log;
    log.append(engine.review("card 1", card.state, RawSignal::rated(4), T0 + DAY));
    log.append(engine.review("multi\nline", card.state, RawSignal::rated(2), T0 + DAY));
    ASSERT_TRUE(Storage::saveEvents(log, path("events.txt")));

    ReviewLog reloaded;
    ASSERT_TRUE(Storage::loadEvents(reloaded, path("events.txt")));
    ASSERT_EQ(reloaded.size(), 2u);
    ASSERT_EQ(reloaded.eventsFor("card 1").size(), 1u);
    EXPECT_EQ(reloaded.eventsFor("card 1")[0].quality, 4);
    ASSERT_EQ(reloaded.eventsFor("multi\nline").size(), 1u);
    EXPECT_EQ(reloaded.eventsFor("multi\nline")[0].quality, 2);
}

TEST_F(StorageTest, EmptyIdsAreRefused) {
    std::vector<ScheduledItem> items;
    items.push_back(ScheduledItem{ ReviewItem("", "note:1", T0), SchedulingState::initial(T0) });
    EXPECT_FALSE(Storage::saveDeck(items, path("deck.txt")));

    SchedulingEngine engine;
    ReviewLog log;
    log.append(engine.review("", SchedulingState::initial(T0), RawSignal::rated(4), T0));
    EXPECT_FALSE(Storage::saveEvents(log, path("events.txt")));

    // a blank id line inside a deck is malformed, not skipped
    {
        std::ofstream out(path("blank.txt"));
        out << "\nnote:1\n" << T0 << "\n\n2.5 0 0 0 0\n-\n2\n---\n";
    }
    std::vector<ScheduledItem> loaded;
    EXPECT_FALSE(Storage::loadDeck(loaded, path("blank.txt")));
    EXPECT_TRUE(loaded.empty());
}
