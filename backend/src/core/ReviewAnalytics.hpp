#pragma once
#include <ctime>
#include <map>
#include <string>
#include <vector>
#include "ReviewEvent.hpp"
#include "SchedulingState.hpp"

struct ItemPerformance {
    size_t review_count = 0;
    double average_quality = 0.0;
    double pass_rate = 0.0;
    double trend = 0.0;   // recent minus older normalized quality, [-1,1]
};

struct PerformanceReport {
    std::map<std::string, ItemPerformance> items;
    double overall_pass_rate = 0.0;
    std::vector<std::string> difficult_items;
    std::vector<std::string> improving_items;
};

struct EaseBand {
    std::string label;
    size_t count = 0;
};

namespace Analytics {

// 0..1, half from ease, half from streak length.
double masteryScore(const SchedulingState& state, const EngineConfig& cfg = EngineConfig{});

PerformanceReport analyzePerformance(const std::vector<ReviewEvent>& events,
    const EngineConfig& cfg = EngineConfig{});

// counts[d] = items falling due on day d from now; overdue items land on day 0.
std::vector<size_t> forecastDue(const std::vector<ScheduledItem>& items, std::time_t now, int daysAhead);

std::vector<EaseBand> easeDistribution(const std::vector<ScheduledItem>& items);

}
