#include "ReviewOutcomeEvaluator.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

[[noreturn]] void reject(const std::string& why) {
    spdlog::warn("Rejected review outcome: {}", why);
    throw InvalidOutcomeError(why);
}

} // namespace

RawSignal RawSignal::rated(double rating) {
    RawSignal s;
    s.self_rating = rating;
    return s;
}

RawSignal RawSignal::graded(ReviewGrade g) {
    RawSignal s;
    s.grade = g;
    return s;
}

RawSignal RawSignal::answered(bool wasCorrect, std::optional<double> seconds) {
    RawSignal s;
    s.correct = wasCorrect;
    s.response_seconds = seconds;
    return s;
}

std::string RawSignal::describe() const {
    std::ostringstream oss;
    if (self_rating) {
        oss << "rating=" << *self_rating;
    }
    else if (grade) {
        oss << "grade=" << static_cast<int>(*grade);
    }
    else if (correct) {
        oss << "correct=" << (*correct ? "yes" : "no");
        if (response_seconds) oss << " latency=" << *response_seconds << "s";
    }
    else {
        oss << "empty";
    }
    return oss.str();
}

ReviewOutcomeEvaluator::ReviewOutcomeEvaluator(const EngineConfig& cfg)
    : config(cfg)
{
}

ResponseSpeed ReviewOutcomeEvaluator::bucketFor(double seconds) const {
    if (seconds <= config.fast_response_seconds) return ResponseSpeed::FAST;
    if (seconds <= config.slow_response_seconds) return ResponseSpeed::MEDIUM;
    return ResponseSpeed::SLOW;
}

double ReviewOutcomeEvaluator::normalize(const RawSignal& signal) const {
    if (signal.self_rating) {
        double r = *signal.self_rating;
        if (!std::isfinite(r) || r < 0.0 || r > 5.0) {
            reject("self-rating outside [0,5]: " + signal.describe());
        }
        return r;
    }

    if (signal.grade) {
        switch (*signal.grade) {
        case ReviewGrade::AGAIN: return 1.0;
        case ReviewGrade::HARD: return 3.0;
        case ReviewGrade::GOOD: return 4.0;
        case ReviewGrade::EASY: return 5.0;
        }
        reject("unknown grade: " + signal.describe());
    }

    if (!signal.correct) {
        reject("signal carries neither rating, grade nor correctness");
    }

    if (!*signal.correct) {
        return 1.0;
    }

    if (!signal.response_seconds) {
        reject("correct answer without response time");
    }
    double secs = *signal.response_seconds;
    if (!std::isfinite(secs) || secs < 0.0) {
        reject("invalid response time: " + signal.describe());
    }

    switch (bucketFor(secs)) {
    case ResponseSpeed::FAST: return 5.0;
    case ResponseSpeed::MEDIUM: return 4.0;
    case ResponseSpeed::SLOW: return 3.0;
    }
    return 3.0;
}
