#pragma once
#include <string>
#include <variant>
#include "Clock.hpp"

// Still walking through the fixed learning steps
struct LearningPhase {
    int step = 1;                 // 1..3
};

// Graduated; governed by SM-2
struct ReviewingPhase {
    int repetitions = 1;          // successful reviews since (re)graduation
    int interval_days = 1;        // current SM-2 interval
};

using SchedulePhase = std::variant<LearningPhase, ReviewingPhase>;

class CardSchedule {
public:
    static constexpr double DEFAULT_EASINESS = 2.5;
    static constexpr double MIN_EASINESS = 1.3;

    SchedulePhase phase = LearningPhase{};
    double easiness_factor = DEFAULT_EASINESS;   // kept across phase changes
    TimePoint next_due{};

    bool isLearning() const { return std::holds_alternative<LearningPhase>(phase); }
    bool isReviewing() const { return std::holds_alternative<ReviewingPhase>(phase); }
    bool isDue(TimePoint now) const { return now >= next_due; }

    // Throws InconsistentState if a phase invariant is broken
    void validate() const;

    std::string describe() const;
};

struct ReviewEvent {
    enum class Kind {
        RESET_TO_STEP_1,
        REPEAT_STEP,
        ADVANCE_STEP,
        GRADUATED,
        BACK_TO_LEARNING,
        REVIEWING
    };

    Kind kind = Kind::RESET_TO_STEP_1;
    int step = 0;                 // learning kinds only
    int interval_days = 0;        // GRADUATED / REVIEWING only
    Duration nominal_delay{};     // before acceleration

    std::string describe() const;
    std::string delayText() const;
};

struct ReviewResult {
    CardSchedule state;
    ReviewEvent event;
};
