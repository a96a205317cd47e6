#include "SchedulingEngine.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

SchedulingEngine::SchedulingEngine(const EngineConfig& cfg)
    : config(cfg),
    evaluator(cfg)
{
    config.validate();
    spdlog::debug("SchedulingEngine initialized (ease floor {}, pass threshold {})",
        config.ease_floor, config.pass_threshold);
}

SchedulingState SchedulingEngine::apply(const SchedulingState& state, double quality, std::time_t now) const {
    state.validate(config);

    if (!std::isfinite(quality) || quality < 0.0 || quality > 5.0) {
        throw InvalidOutcomeError("quality outside [0,5]: " + std::to_string(quality));
    }
    if (state.last_reviewed_at && now < *state.last_reviewed_at) {
        throw InvalidArgumentError("review time precedes last review");
    }

    SchedulingState next = state;
    const bool passed = isPassing(quality);

    next.ease_factor = updateEase(state.ease_factor, quality);

    if (!passed) {
        next.streak = 0;
        next.interval_days = 1;
        handleLapse(next);
    }
    else {
        next.streak = state.streak + 1;
        next.interval_days = computeNewInterval(state, next.streak);
    }

    next.review_count = state.review_count + 1;
    next.last_reviewed_at = now;
    next.decay_half_life_days = updateHalfLife(state.decay_half_life_days, passed);

    spdlog::debug("apply: q={:.2f} ease {:.3f}->{:.3f} interval {}->{}d streak {}->{} half-life {:.2f}->{:.2f}",
        quality, state.ease_factor, next.ease_factor, state.interval_days, next.interval_days,
        state.streak, next.streak, state.decay_half_life_days, next.decay_half_life_days);

    return next;
}

ReviewEvent SchedulingEngine::review(const std::string& itemId, const SchedulingState& state,
    const RawSignal& signal, std::time_t now) const {
    ReviewEvent ev;
    ev.item_id = itemId;
    ev.timestamp = now;
    ev.raw = signal;
    ev.quality = evaluator.normalize(signal);
    ev.resulting_state = apply(state, ev.quality, now);

    spdlog::info("Review item {} | {} -> q={:.1f}, next due in {}d",
        itemId, signal.describe(), ev.quality, ev.resulting_state.interval_days);
    return ev;
}

SchedulingState SchedulingEngine::replay(const SchedulingState& initial, const std::vector<ReviewEvent>& events) const {
    SchedulingState s = initial;
    for (const auto& ev : events) {
        s = apply(s, ev.quality, ev.timestamp);
    }
    return s;
}

/* -------------------------
   SM-2 ease update
   -------------------------
   EF' = EF + (0.1 - (5-q) * (0.08 + (5-q) * 0.02)), floored.
   q=5 adds 0.1, q=4 leaves EF unchanged, q=3 subtracts 0.14, q<3 drops fast.
*/
double SchedulingEngine::updateEase(double ease, double quality) const {
    double miss = 5.0 - quality;
    double updated = ease + (0.1 - miss * (0.08 + miss * 0.02));
    return std::max(config.ease_floor, updated);
}

/* -------------------------
   Interval progression
   -------------------------
   streak 1 -> 1 day, streak 2 -> 6 days, afterwards the previous interval is
   multiplied by the ease factor the item had before this review.
   Capped at max_interval_days.
*/
int SchedulingEngine::computeNewInterval(const SchedulingState& state, int newStreak) const {
    if (newStreak == 1) return 1;
    if (newStreak == 2) return std::min(6, config.max_interval_days);

    double grown = std::round(static_cast<double>(state.interval_days) * state.ease_factor);
    if (grown >= static_cast<double>(config.max_interval_days)) {
        return config.max_interval_days;
    }
    return std::max(1, static_cast<int>(grown));
}

/* -------------------------
   Forgetting-curve half-life
   -------------------------
   Multiplicative nudge: grows slowly while the learner keeps passing, shrinks
   faster on a failure. Bounded to [min_half_life_days, max_half_life_days].
*/
double SchedulingEngine::updateHalfLife(double halfLife, bool passed) const {
    double h = passed ? halfLife * config.half_life_growth : halfLife * config.half_life_decay;
    return std::clamp(h, config.min_half_life_days, config.max_half_life_days);
}

/* -------------------------
   Lapse & leech handling
   -------------------------
*/
void SchedulingEngine::handleLapse(SchedulingState& next) const {
    bool wasLeech = next.isLeech(config);
    next.lapses++;

    if (!wasLeech && next.isLeech(config)) {
        spdlog::warn("Item became a leech after {} lapses", next.lapses);
    }
    else {
        spdlog::debug("Lapse recorded. lapses={}", next.lapses);
    }
}
