#include "RefreshSuggestionGenerator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

RefreshSuggestionGenerator::RefreshSuggestionGenerator(const DecayModel& model)
    : decay(model)
{
}

std::vector<RefreshSuggestion> RefreshSuggestionGenerator::rank(const std::vector<ScheduledItem>& items,
    std::time_t now, std::optional<double> threshold) const {
    if (!threshold) {
        throw InvalidArgumentError("refresh threshold is required");
    }
    double limit = *threshold;
    if (!std::isfinite(limit) || limit <= 0.0 || limit > 1.0) {
        throw InvalidArgumentError("refresh threshold must be in (0,1]");
    }

    std::vector<RefreshSuggestion> out;
    for (const auto& entry : items) {
        double p = decay.retentionProbability(entry.state, now);
        if (p >= limit) continue;

        RefreshSuggestion s;
        s.entry = &entry;
        s.retention = p;
        s.urgency = 1.0 / p;
        s.formally_due = entry.state.isDue(now);
        out.push_back(s);
    }

    std::sort(out.begin(), out.end(),
        [](const RefreshSuggestion& a, const RefreshSuggestion& b) {
            if (a.retention != b.retention) return a.retention < b.retention;
            return a.entry->item.id < b.entry->item.id;
        });

    spdlog::debug("Refresh suggestions: {} of {} items below retention {:.2f}",
        out.size(), items.size(), limit);
    return out;
}
