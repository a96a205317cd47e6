#pragma once
#include <vector>
#include <string>
#include "../core/ReviewEvent.hpp"
#include "../core/SchedulingState.hpp"

// Storage persists the engine's state layout as plain text.
//
// Deck file, one block per item:
//   id / content_ref / created_at / tags (CSV) /
//   "ease interval streak review_count lapses" /
//   last_reviewed_at or "-" / half_life / "---"
//
// Event file, one line per review:
//   item_id timestamp quality signal ease interval streak review_count lapses half_life created_at
// where signal is r:<rating>, g:<grade>, c:<0|1>:<seconds|->.
//
// Ids, content refs and tag lines are backslash-escaped (\\ \n \r \t, and
// \s for a space). Saving refuses empty item ids.
//
// Loading never repairs values; the engine validates state before using it.

class Storage {
public:
    static bool saveDeck(const std::vector<ScheduledItem>& items, const std::string& filename);
    static bool loadDeck(std::vector<ScheduledItem>& items, const std::string& filename);

    static bool saveEvents(const ReviewLog& log, const std::string& filename);
    static bool loadEvents(ReviewLog& log, const std::string& filename);

    static std::string serializeDeck(const std::vector<ScheduledItem>& items);
    static bool parseDeck(const std::string& plain, std::vector<ScheduledItem>& items);
};
