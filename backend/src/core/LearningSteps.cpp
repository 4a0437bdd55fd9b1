#include "LearningSteps.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

// 1 min, 10 min, 1 day
const std::array<std::chrono::minutes, LearningSteps::STEP_COUNT> LearningSteps::STEPS = {
    std::chrono::minutes(1),
    std::chrono::minutes(10),
    std::chrono::minutes(24 * 60)
};

std::chrono::minutes LearningSteps::duration(int step) {
    if (step < 1 || step > STEP_COUNT) {
        throw InconsistentState("no learning step " + std::to_string(step));
    }
    return STEPS[static_cast<size_t>(step - 1)];
}

ReviewResult LearningSteps::apply(const LearningPhase& learning, double easiness_factor,
    LearningAction action, const Clock& clock)
{
    ReviewResult result;
    result.state.easiness_factor = easiness_factor;

    int step = learning.step;
    ReviewEvent& ev = result.event;

    switch (action) {
    case LearningAction::REGRESS:
        step = 1;
        ev.kind = ReviewEvent::Kind::RESET_TO_STEP_1;
        break;
    case LearningAction::REPEAT:
        ev.kind = ReviewEvent::Kind::REPEAT_STEP;
        break;
    case LearningAction::ADVANCE:
        if (step >= STEP_COUNT) {
            // graduation: one successful repetition, first SM-2 interval of a day
            ReviewingPhase reviewing;
            reviewing.repetitions = 1;
            reviewing.interval_days = 1;

            ev.kind = ReviewEvent::Kind::GRADUATED;
            ev.interval_days = 1;
            ev.nominal_delay = std::chrono::hours(24);

            result.state.phase = reviewing;
            result.state.next_due = clock.deadline(ev.nominal_delay);
            spdlog::debug("Learning step {} -> graduated", learning.step);
            return result;
        }
        ++step;
        ev.kind = ReviewEvent::Kind::ADVANCE_STEP;
        break;
    }

    ev.step = step;
    ev.nominal_delay = duration(step);

    result.state.phase = LearningPhase{ step };
    result.state.next_due = clock.deadline(ev.nominal_delay);

    spdlog::debug("Learning step {} -> {} ({})", learning.step, step, ev.describe());
    return result;
}
