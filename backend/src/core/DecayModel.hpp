#pragma once
#include <ctime>
#include "EngineConfig.hpp"
#include "SchedulingState.hpp"

/*
  Exponential forgetting curve:
      p = 2^(-elapsed_days / half_life)
  Never-reviewed items have p = 1. Results are clamped to retention_floor so
  rankings that divide by p stay finite.
*/
class DecayModel {
public:
    explicit DecayModel(const EngineConfig& cfg = EngineConfig{});

    double retentionProbability(const SchedulingState& state, std::time_t now) const;

    // Days after the last review at which retention falls to target (0,1].
    // Throws InvalidArgumentError for targets outside that range.
    double daysUntilRetention(const SchedulingState& state, double target) const;

private:
    EngineConfig config;
};
