#include "ReviewEvent.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

void ReviewLog::append(const ReviewEvent& event) {
    auto& events = by_item[event.item_id];
    if (!events.empty() && event.timestamp < events.back().timestamp) {
        throw InvalidArgumentError("review event for '" + event.item_id + "' predates the last recorded one");
    }
    events.push_back(event);
    ++total;
    spdlog::debug("ReviewLog: item={} t={} q={:.2f} (total={})",
        event.item_id, event.timestamp, event.quality, total);
}

const std::vector<ReviewEvent>& ReviewLog::eventsFor(const std::string& itemId) const {
    static const std::vector<ReviewEvent> none;
    auto it = by_item.find(itemId);
    if (it == by_item.end()) return none;
    return it->second;
}

std::vector<ReviewEvent> ReviewLog::all() const {
    std::vector<ReviewEvent> out;
    out.reserve(total);
    for (const auto& p : by_item) {
        out.insert(out.end(), p.second.begin(), p.second.end());
    }
    std::stable_sort(out.begin(), out.end(),
        [](const ReviewEvent& a, const ReviewEvent& b) {
            if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
            return a.item_id < b.item_id;
        });
    return out;
}
