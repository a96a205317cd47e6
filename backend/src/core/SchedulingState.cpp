#include "SchedulingState.hpp"
#include "Errors.hpp"
#include <cmath>

SchedulingState SchedulingState::initial(std::time_t createdAt, const EngineConfig& cfg) {
    SchedulingState s;
    s.ease_factor = cfg.initial_ease;
    s.decay_half_life_days = cfg.initial_half_life_days;
    s.created_at = createdAt;
    return s;
}

std::time_t SchedulingState::nextDueAt() const {
    if (!last_reviewed_at) return created_at;
    return *last_reviewed_at + static_cast<std::time_t>(interval_days) * SECONDS_PER_DAY;
}

void SchedulingState::validate(const EngineConfig& cfg) const {
    if (!std::isfinite(ease_factor) || ease_factor < cfg.ease_floor) {
        throw InvalidStateError("ease factor " + std::to_string(ease_factor)
            + " below floor " + std::to_string(cfg.ease_floor));
    }
    if (interval_days < 0) {
        throw InvalidStateError("negative interval " + std::to_string(interval_days));
    }
    if (streak < 0 || review_count < 0 || lapses < 0) {
        throw InvalidStateError("negative review counters");
    }
    if (streak > review_count || lapses > review_count) {
        throw InvalidStateError("streak/lapses exceed review count");
    }
    if (!std::isfinite(decay_half_life_days) || decay_half_life_days < 1.0) {
        throw InvalidStateError("decay half-life " + std::to_string(decay_half_life_days) + " below 1 day");
    }
}

double daysBetween(std::time_t from, std::time_t to) {
    return std::difftime(to, from) / static_cast<double>(SECONDS_PER_DAY);
}
