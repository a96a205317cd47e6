#include "DueSetSelector.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

std::vector<const ScheduledItem*> DueSetSelector::selectDue(const std::vector<ScheduledItem>& items,
    std::time_t now, size_t limit) const {
    if (limit == 0) {
        throw InvalidArgumentError("due-set limit must be positive");
    }

    std::vector<const ScheduledItem*> due;
    due.reserve(items.size() / 4 + 8);
    for (const auto& entry : items) {
        if (entry.state.isDue(now)) {
            due.push_back(&entry);
        }
    }
    return rankAndTruncate(std::move(due), limit);
}

std::vector<const ScheduledItem*> DueSetSelector::selectDueWithTag(const std::vector<ScheduledItem>& items,
    std::time_t now, size_t limit, const std::string& tag) const {
    if (limit == 0) {
        throw InvalidArgumentError("due-set limit must be positive");
    }

    std::vector<const ScheduledItem*> due;
    for (const auto& entry : items) {
        if (entry.item.hasTag(tag) && entry.state.isDue(now)) {
            due.push_back(&entry);
        }
    }
    return rankAndTruncate(std::move(due), limit);
}

size_t DueSetSelector::countDue(const std::vector<ScheduledItem>& items, std::time_t now) const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
        [now](const ScheduledItem& e) { return e.state.isDue(now); }));
}

std::vector<const ScheduledItem*> DueSetSelector::rankAndTruncate(std::vector<const ScheduledItem*> due,
    size_t limit) const {
    auto moreUrgent = [](const ScheduledItem* a, const ScheduledItem* b) {
        // now - nextDueAt descending == nextDueAt ascending
        std::time_t da = a->state.nextDueAt();
        std::time_t db = b->state.nextDueAt();
        if (da != db) return da < db;
        if (a->state.ease_factor != b->state.ease_factor)
            return a->state.ease_factor < b->state.ease_factor;
        return a->item.id < b->item.id;
    };

    size_t total = due.size();
    if (total > limit) {
        std::partial_sort(due.begin(), due.begin() + static_cast<std::ptrdiff_t>(limit), due.end(), moreUrgent);
        due.resize(limit);
    }
    else {
        std::sort(due.begin(), due.end(), moreUrgent);
    }

    spdlog::debug("selectDue: {} due, returning {} (limit {})", total, due.size(), limit);
    return due;
}
