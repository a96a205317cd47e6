#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "SchedulingState.hpp"

/*
  Picks the items due at "now" (now >= nextDueAt), ordered by:
    1. most overdue first,
    2. lower ease factor first (harder items win ties),
    3. item id, for a stable order across calls.
  Truncating to "limit" never touches the excluded items' state; they simply
  rank higher next time because they are more overdue.
*/
class DueSetSelector {
public:
    // Throws InvalidArgumentError when limit is 0.
    std::vector<const ScheduledItem*> selectDue(const std::vector<ScheduledItem>& items,
        std::time_t now, size_t limit) const;

    // Same, restricted to items carrying tag.
    std::vector<const ScheduledItem*> selectDueWithTag(const std::vector<ScheduledItem>& items,
        std::time_t now, size_t limit, const std::string& tag) const;

    size_t countDue(const std::vector<ScheduledItem>& items, std::time_t now) const;

private:
    std::vector<const ScheduledItem*> rankAndTruncate(std::vector<const ScheduledItem*> due, size_t limit) const;
};
