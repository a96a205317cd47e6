#pragma once
#include <optional>
#include <string>
#include "EngineConfig.hpp"

// Answer buttons of a typical review UI.
enum class ReviewGrade {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

enum class ResponseSpeed {
    FAST,
    MEDIUM,
    SLOW
};

/*
  Raw review signal as supplied by the session layer. Exactly one of the three
  forms is needed; when several are present, self_rating wins over grade,
  and grade wins over the derived (correct + latency) form.
*/
struct RawSignal {
    std::optional<double> self_rating;      // 0..5
    std::optional<ReviewGrade> grade;
    std::optional<bool> correct;
    std::optional<double> response_seconds; // needed when correct == true

    static RawSignal rated(double rating);
    static RawSignal graded(ReviewGrade g);
    static RawSignal answered(bool wasCorrect, std::optional<double> seconds = std::nullopt);

    std::string describe() const;
};

class ReviewOutcomeEvaluator {
public:
    explicit ReviewOutcomeEvaluator(const EngineConfig& cfg = EngineConfig{});

    // Canonical quality in [0,5]. Throws InvalidOutcomeError.
    double normalize(const RawSignal& signal) const;

    ResponseSpeed bucketFor(double seconds) const;

private:
    EngineConfig config;
};
