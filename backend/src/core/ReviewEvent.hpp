#pragma once
#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>
#include "ReviewOutcomeEvaluator.hpp"
#include "SchedulingState.hpp"

// Immutable audit record of one applied review.
struct ReviewEvent {
    std::string item_id;
    std::time_t timestamp = 0;
    RawSignal raw;
    double quality = 0.0;
    SchedulingState resulting_state;
};

/*
  Append-only event log keyed by item id. Events for one item are kept in
  timestamp order; an append that would go back in time for the same item is
  rejected with InvalidArgumentError.
*/
class ReviewLog {
public:
    void append(const ReviewEvent& event);

    const std::vector<ReviewEvent>& eventsFor(const std::string& itemId) const;
    std::vector<ReviewEvent> all() const;  // every event, timestamp order

    size_t size() const { return total; }
    bool empty() const { return total == 0; }

private:
    std::unordered_map<std::string, std::vector<ReviewEvent>> by_item;
    size_t total = 0;
};
