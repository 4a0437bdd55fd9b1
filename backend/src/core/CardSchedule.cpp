#include "CardSchedule.hpp"
#include "Errors.hpp"
#include "LearningSteps.hpp"
#include <cmath>
#include <limits>
#include <fmt/format.h>

void CardSchedule::validate() const {
    if (!std::isfinite(easiness_factor)) {
        throw InconsistentState(fmt::format("easiness factor {} is not a number", easiness_factor));
    }
    if (easiness_factor < MIN_EASINESS) {
        throw InconsistentState(fmt::format(
            "easiness factor {} below floor {}", easiness_factor, MIN_EASINESS));
    }

    if (const auto* l = std::get_if<LearningPhase>(&phase)) {
        if (l->step < 1 || l->step > LearningSteps::STEP_COUNT) {
            throw InconsistentState(fmt::format(
                "learning step {} outside [1,{}]", l->step, LearningSteps::STEP_COUNT));
        }
        return;
    }

    const auto& r = std::get<ReviewingPhase>(phase);
    if (r.interval_days < 1) {
        throw InconsistentState(fmt::format("review interval {} below 1 day", r.interval_days));
    }
    if (r.repetitions < 0) {
        throw InconsistentState(fmt::format("negative repetition count {}", r.repetitions));
    }
    if (r.repetitions == std::numeric_limits<int>::max()) {
        throw InconsistentState(fmt::format("repetition count {} cannot be incremented", r.repetitions));
    }
}

std::string CardSchedule::describe() const {
    if (const auto* l = std::get_if<LearningPhase>(&phase)) {
        return fmt::format("learning step {}/{}", l->step, LearningSteps::STEP_COUNT);
    }
    const auto& r = std::get<ReviewingPhase>(phase);
    return fmt::format("reviewing reps={} interval={}d ef={:.2f}",
        r.repetitions, r.interval_days, easiness_factor);
}

std::string ReviewEvent::describe() const {
    switch (kind) {
    case Kind::RESET_TO_STEP_1: return "reset to step 1";
    case Kind::REPEAT_STEP: return fmt::format("repeat step {}", step);
    case Kind::ADVANCE_STEP: return fmt::format("advance to step {}", step);
    case Kind::GRADUATED: return "graduated";
    case Kind::BACK_TO_LEARNING: return "back to learning";
    case Kind::REVIEWING: return fmt::format("reviewing, interval now {} day(s)", interval_days);
    }
    return "unknown";
}

std::string ReviewEvent::delayText() const {
    using namespace std::chrono;

    if (kind == Kind::GRADUATED || kind == Kind::REVIEWING) {
        if (interval_days == 1) return "1 day";
        return fmt::format("{} days", interval_days);
    }

    auto minutes = duration_cast<std::chrono::minutes>(nominal_delay).count();
    if (minutes >= 1440 && minutes % 1440 == 0) {
        auto days = minutes / 1440;
        return days == 1 ? std::string("1 day") : fmt::format("{} days", days);
    }
    return fmt::format("{}min", minutes);
}
