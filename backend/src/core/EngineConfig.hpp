#pragma once
#include <string>
#include <spdlog/spdlog.h>

/*
  Tunables shared by every engine component. Defaults reproduce classic SM-2
  plus the half-life adaptation rates; all of them can be overridden from a
  key:value config file.
*/
struct EngineConfig {
    static constexpr double MIN_EASE_FLOOR = 1.3;
    static constexpr double PASS_THRESHOLD = 3.0;
    static constexpr int UNLIMITED_REDRILLS = -1;

    // SM-2
    double ease_floor = 1.3;
    double initial_ease = 2.5;
    double pass_threshold = PASS_THRESHOLD;  // fixed by SM-2; only 3 validates
    int max_interval_days = 365 * 50;

    // Forgetting curve
    double initial_half_life_days = 2.0;
    double min_half_life_days = 1.0;
    double max_half_life_days = 365.0;
    double half_life_growth = 1.05;
    double half_life_decay = 0.85;
    double retention_floor = 0.01;

    // Lapses
    int leech_threshold = 8;

    // Latency buckets (seconds)
    double fast_response_seconds = 4.0;
    double slow_response_seconds = 10.0;

    // Sessions
    // Re-queues per failing item per session; UNLIMITED_REDRILLS (-1) never stops
    int max_session_redrills = UNLIMITED_REDRILLS;

    // Throws InvalidArgumentError on the first out-of-range value.
    void validate() const;

    std::string serialize() const;
    // Unknown keys and unparsable values are skipped; call validate() after.
    void deserialize(const std::string& data);
};

bool loadConfigFile(EngineConfig& cfg, const std::string& filename);
bool saveConfigFile(const EngineConfig& cfg, const std::string& filename);
