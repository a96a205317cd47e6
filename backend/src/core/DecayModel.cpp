#include "DecayModel.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

DecayModel::DecayModel(const EngineConfig& cfg)
    : config(cfg)
{
}

double DecayModel::retentionProbability(const SchedulingState& state, std::time_t now) const {
    if (!state.last_reviewed_at) return 1.0;

    // Clock skew: a "now" before the last review counts as no elapsed time.
    double elapsed = std::max(0.0, daysBetween(*state.last_reviewed_at, now));
    double halfLife = std::max(1.0, state.decay_half_life_days);

    double p = std::exp2(-elapsed / halfLife);
    return std::clamp(p, config.retention_floor, 1.0);
}

double DecayModel::daysUntilRetention(const SchedulingState& state, double target) const {
    if (!std::isfinite(target) || target <= 0.0 || target > 1.0) {
        throw InvalidArgumentError("retention target must be in (0,1]");
    }
    double halfLife = std::max(1.0, state.decay_half_life_days);
    return halfLife * std::log2(1.0 / target);
}
