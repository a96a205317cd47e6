#pragma once
#include <ctime>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "EngineConfig.hpp"
#include "ReviewEvent.hpp"
#include "ReviewOutcomeEvaluator.hpp"
#include "SchedulingState.hpp"

/*
  SM-2 scheduler with an adaptive forgetting-curve half-life:
   - ease factor update with a hard floor
   - 1 / 6 / interval*ease progression while the streak holds (ease as of
     the previous review)
   - any failing review resets streak and interval to one day
   - lapse counting & leech detection
   - half-life nudged up on passes and down on failures

  apply() is a pure state transition: same input, same successor, no I/O
  beyond debug logging. Callers serialize updates per item id.
*/
class SchedulingEngine {
public:
    explicit SchedulingEngine(const EngineConfig& cfg = EngineConfig{});

    // Successor state for a canonical quality in [0,5].
    // Throws InvalidStateError, InvalidOutcomeError, InvalidArgumentError.
    SchedulingState apply(const SchedulingState& state, double quality, std::time_t now) const;

    // Normalize a raw signal, apply it, and describe the result as an event.
    ReviewEvent review(const std::string& itemId, const SchedulingState& state,
        const RawSignal& signal, std::time_t now) const;

    // Rebuild a state from its audit trail.
    SchedulingState replay(const SchedulingState& initial, const std::vector<ReviewEvent>& events) const;

    bool isPassing(double quality) const { return quality >= config.pass_threshold; }

    const EngineConfig& getConfig() const { return config; }
    const ReviewOutcomeEvaluator& getEvaluator() const { return evaluator; }

private:
    EngineConfig config;
    ReviewOutcomeEvaluator evaluator;

    double updateEase(double ease, double quality) const;
    int computeNewInterval(const SchedulingState& state, int newStreak) const;
    double updateHalfLife(double halfLife, bool passed) const;
    void handleLapse(SchedulingState& next) const;
};
