#include "Scheduler.hpp"
#include "LearningSteps.hpp"
#include "SM2.hpp"

Scheduler::Scheduler(const Clock& clock)
    : clk(clock)
{
    spdlog::info("Scheduler (learning steps + SM-2) initialized, acceleration x{}",
        clk.accelerationFactor());
}

CardSchedule Scheduler::newCard() const {
    CardSchedule card;
    card.phase = LearningPhase{ 1 };
    card.easiness_factor = CardSchedule::DEFAULT_EASINESS;
    card.next_due = clk.deadline(LearningSteps::duration(1));
    return card;
}

ReviewResult Scheduler::review(const CardSchedule& card, Rating rating) const {
    card.validate();

    spdlog::debug("Review [{}] rating={}", card.describe(), RatingMapper::name(rating));

    if (const auto* learning = std::get_if<LearningPhase>(&card.phase)) {
        return reviewLearning(card, *learning, rating);
    }
    return reviewGraduated(card, std::get<ReviewingPhase>(card.phase), rating);
}

ReviewResult Scheduler::reviewLearning(const CardSchedule& card, const LearningPhase& learning, Rating rating) const {
    return LearningSteps::apply(learning, card.easiness_factor,
        RatingMapper::learningAction(rating), clk);
}

ReviewResult Scheduler::reviewGraduated(const CardSchedule& card, const ReviewingPhase& reviewing, Rating rating) const {
    SM2::Result sm2 = SM2::calculate(reviewing.repetitions, reviewing.interval_days,
        card.easiness_factor, RatingMapper::quality(rating));

    ReviewResult result;
    result.state.easiness_factor = sm2.easiness_factor;

    if (sm2.lapsed) {
        // new learning episode; n and I are dropped
        result.event.kind = ReviewEvent::Kind::BACK_TO_LEARNING;
        result.event.step = 1;
        result.event.nominal_delay = LearningSteps::duration(1);

        result.state.phase = LearningPhase{ 1 };
        result.state.next_due = clk.deadline(result.event.nominal_delay);

        spdlog::warn("Card lapsed after {} repetition(s), back to learning", reviewing.repetitions);
        return result;
    }

    ReviewingPhase next;
    next.repetitions = sm2.repetitions;
    next.interval_days = sm2.interval_days;

    result.event.kind = ReviewEvent::Kind::REVIEWING;
    result.event.interval_days = next.interval_days;
    result.event.nominal_delay = std::chrono::hours(24) * next.interval_days;

    result.state.phase = next;
    result.state.next_due = clk.deadline(result.event.nominal_delay);
    return result;
}
