#include "ReviewAnalytics.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {

constexpr double DIFFICULT_PASS_RATE = 0.6;
constexpr double IMPROVING_TREND = 0.1;
constexpr size_t TREND_WINDOW = 3;
constexpr double MASTERY_STREAK = 10.0;

} // namespace

namespace Analytics {

double masteryScore(const SchedulingState& state, const EngineConfig& cfg) {
    // most SM-2 ease factors sit between the floor and 2.5
    double easeScore = std::clamp((state.ease_factor - cfg.ease_floor) / 1.2, 0.0, 1.0);
    double streakScore = std::clamp(static_cast<double>(state.streak) / MASTERY_STREAK, 0.0, 1.0);
    return (easeScore + streakScore) / 2.0;
}

PerformanceReport analyzePerformance(const std::vector<ReviewEvent>& events, const EngineConfig& cfg) {
    PerformanceReport report;
    if (events.empty()) {
        spdlog::warn("No review history available for analysis");
        return report;
    }

    std::map<std::string, std::vector<const ReviewEvent*>> byItem;
    for (const auto& ev : events) {
        byItem[ev.item_id].push_back(&ev);
    }

    size_t totalPassed = 0;
    for (auto& p : byItem) {
        auto& list = p.second;
        std::stable_sort(list.begin(), list.end(),
            [](const ReviewEvent* a, const ReviewEvent* b) { return a->timestamp < b->timestamp; });

        ItemPerformance perf;
        perf.review_count = list.size();

        double sum = 0.0;
        size_t itemPassed = 0;
        for (const ReviewEvent* ev : list) {
            sum += ev->quality;
            if (ev->quality >= cfg.pass_threshold) itemPassed++;
        }
        perf.average_quality = sum / static_cast<double>(list.size());
        perf.pass_rate = static_cast<double>(itemPassed) / static_cast<double>(list.size());
        totalPassed += itemPassed;

        if (list.size() >= TREND_WINDOW) {
            size_t split = list.size() - TREND_WINDOW;
            double recent = 0.0;
            for (size_t i = split; i < list.size(); ++i) recent += list[i]->quality / 5.0;
            recent /= static_cast<double>(TREND_WINDOW);

            double older = 0.0;
            for (size_t i = 0; i < split; ++i) older += list[i]->quality / 5.0;
            older /= static_cast<double>(std::max<size_t>(1, split));

            perf.trend = recent - older;
        }

        if (perf.pass_rate < DIFFICULT_PASS_RATE) report.difficult_items.push_back(p.first);
        if (perf.trend > IMPROVING_TREND) report.improving_items.push_back(p.first);

        report.items.emplace(p.first, perf);
    }

    report.overall_pass_rate = static_cast<double>(totalPassed) / static_cast<double>(events.size());

    spdlog::info("Analyzed performance across {} items ({} difficult, {} improving)",
        report.items.size(), report.difficult_items.size(), report.improving_items.size());
    return report;
}

std::vector<size_t> forecastDue(const std::vector<ScheduledItem>& items, std::time_t now, int daysAhead) {
    if (daysAhead <= 0) {
        throw InvalidArgumentError("forecast horizon must be positive");
    }

    std::vector<size_t> counts(static_cast<size_t>(daysAhead), 0);
    for (const auto& entry : items) {
        double days = daysBetween(now, entry.state.nextDueAt());
        long day = days <= 0.0 ? 0 : static_cast<long>(std::floor(days));
        if (day < daysAhead) {
            counts[static_cast<size_t>(day)]++;
        }
    }
    return counts;
}

std::vector<EaseBand> easeDistribution(const std::vector<ScheduledItem>& items) {
    std::vector<EaseBand> bands = {
        {"Very Hard (<1.5)", 0},
        {"Hard (1.5-1.8)", 0},
        {"Medium (1.8-2.2)", 0},
        {"Easy (2.2-2.5)", 0},
        {"Very Easy (2.5+)", 0},
    };

    for (const auto& entry : items) {
        double ef = entry.state.ease_factor;
        if (ef >= 2.5) bands[4].count++;
        else if (ef >= 2.2) bands[3].count++;
        else if (ef >= 1.8) bands[2].count++;
        else if (ef >= 1.5) bands[1].count++;
        else bands[0].count++;
    }
    return bands;
}

}
