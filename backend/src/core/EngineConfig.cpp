#include "EngineConfig.hpp"
#include "Errors.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

void require(bool ok, const std::string& key) {
    if (!ok) {
        throw InvalidArgumentError("config value out of range: " + key);
    }
}

} // namespace

void EngineConfig::validate() const {
    // 1.3 is the lowest ease SM-2 allows; a config may raise it, never lower it
    require(std::isfinite(ease_floor) && ease_floor >= MIN_EASE_FLOOR, "ease_floor");
    require(std::isfinite(initial_ease) && initial_ease >= ease_floor, "initial_ease");
    require(pass_threshold == PASS_THRESHOLD, "pass_threshold");
    require(max_interval_days >= 1, "max_interval_days");

    require(min_half_life_days >= 1.0, "min_half_life_days");
    require(max_half_life_days >= min_half_life_days, "max_half_life_days");
    require(initial_half_life_days >= min_half_life_days
        && initial_half_life_days <= max_half_life_days, "initial_half_life_days");
    require(half_life_growth >= 1.0, "half_life_growth");
    require(half_life_decay > 0.0 && half_life_decay <= 1.0, "half_life_decay");
    require(retention_floor > 0.0 && retention_floor < 1.0, "retention_floor");

    require(leech_threshold >= 1, "leech_threshold");

    require(fast_response_seconds > 0.0, "fast_response_seconds");
    require(slow_response_seconds >= fast_response_seconds, "slow_response_seconds");

    require(max_session_redrills >= UNLIMITED_REDRILLS, "max_session_redrills");
}

std::string EngineConfig::serialize() const {
    std::ostringstream oss;
    oss << "ease_floor:" << ease_floor << "\n"
        << "initial_ease:" << initial_ease << "\n"
        << "pass_threshold:" << pass_threshold << "\n"
        << "max_interval_days:" << max_interval_days << "\n"
        << "initial_half_life_days:" << initial_half_life_days << "\n"
        << "min_half_life_days:" << min_half_life_days << "\n"
        << "max_half_life_days:" << max_half_life_days << "\n"
        << "half_life_growth:" << half_life_growth << "\n"
        << "half_life_decay:" << half_life_decay << "\n"
        << "retention_floor:" << retention_floor << "\n"
        << "leech_threshold:" << leech_threshold << "\n"
        << "fast_response_seconds:" << fast_response_seconds << "\n"
        << "slow_response_seconds:" << slow_response_seconds << "\n"
        << "max_session_redrills:" << max_session_redrills << "\n";
    return oss.str();
}

void EngineConfig::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, pos));
        std::string valStr = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        try {
            if (key == "ease_floor") ease_floor = std::stod(valStr);
            else if (key == "initial_ease") initial_ease = std::stod(valStr);
            else if (key == "pass_threshold") pass_threshold = std::stod(valStr);
            else if (key == "max_interval_days") max_interval_days = std::stoi(valStr);
            else if (key == "initial_half_life_days") initial_half_life_days = std::stod(valStr);
            else if (key == "min_half_life_days") min_half_life_days = std::stod(valStr);
            else if (key == "max_half_life_days") max_half_life_days = std::stod(valStr);
            else if (key == "half_life_growth") half_life_growth = std::stod(valStr);
            else if (key == "half_life_decay") half_life_decay = std::stod(valStr);
            else if (key == "retention_floor") retention_floor = std::stod(valStr);
            else if (key == "leech_threshold") leech_threshold = std::stoi(valStr);
            else if (key == "fast_response_seconds") fast_response_seconds = std::stod(valStr);
            else if (key == "slow_response_seconds") slow_response_seconds = std::stod(valStr);
            else if (key == "max_session_redrills") max_session_redrills = std::stoi(valStr);
            else spdlog::warn("Config: unknown key '{}' ignored", key);
        }
        catch (const std::exception&) {
            spdlog::warn("Config: unparsable value '{}' for '{}' ignored", valStr, key);
        }
    }
}

bool loadConfigFile(EngineConfig& cfg, const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Config file '{}' not found; using defaults", filename);
        return false;
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    cfg.deserialize(oss.str());
    spdlog::info("Loaded engine config from '{}'", filename);
    return true;
}

bool saveConfigFile(const EngineConfig& cfg, const std::string& filename) {
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing config", filename);
        return false;
    }
    out << cfg.serialize();
    return true;
}
