#pragma once
#include <ctime>
#include <optional>
#include <string>
#include "EngineConfig.hpp"
#include "ReviewItem.hpp"

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

/*
  Per-item scheduling state. Only SchedulingEngine produces new values; every
  other component reads it. nextDueAt() is derived on demand so it can never
  go stale relative to last_reviewed_at / interval_days.
*/
struct SchedulingState {
    double ease_factor = 2.5;
    int interval_days = 0;          // 0 = due immediately (new item)
    int streak = 0;                 // consecutive passing reviews
    int review_count = 0;           // total reviews ever applied
    int lapses = 0;                 // total failing reviews ever applied
    std::optional<std::time_t> last_reviewed_at;
    double decay_half_life_days = 2.0;
    std::time_t created_at = 0;     // anchor for never-reviewed items

    // Fresh state for an item registered at createdAt.
    static SchedulingState initial(std::time_t createdAt, const EngineConfig& cfg = EngineConfig{});

    std::time_t nextDueAt() const;
    bool isDue(std::time_t now) const { return now >= nextDueAt(); }
    bool isLeech(const EngineConfig& cfg) const { return lapses >= cfg.leech_threshold; }

    // Throws InvalidStateError if an invariant is broken.
    void validate(const EngineConfig& cfg) const;
};

// A caller-owned item paired with its engine-owned state.
struct ScheduledItem {
    ReviewItem item;
    SchedulingState state;
};

double daysBetween(std::time_t from, std::time_t to);
