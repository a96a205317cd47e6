#pragma once
#include <ctime>
#include <optional>
#include <vector>
#include "DecayModel.hpp"
#include "SchedulingState.hpp"

struct RefreshSuggestion {
    const ScheduledItem* entry = nullptr;
    double retention = 1.0;
    double urgency = 1.0;     // 1 / retention
    bool formally_due = false;
};

/*
  Soft decay warnings, independent of due dates: every item whose estimated
  retention has dropped below the caller's threshold, most at-risk first.
*/
class RefreshSuggestionGenerator {
public:
    // The model is copied; it holds only its config.
    explicit RefreshSuggestionGenerator(const DecayModel& model);

    // threshold must be present and in (0,1]; otherwise InvalidArgumentError.
    std::vector<RefreshSuggestion> rank(const std::vector<ScheduledItem>& items,
        std::time_t now, std::optional<double> threshold) const;

private:
    DecayModel decay;
};
