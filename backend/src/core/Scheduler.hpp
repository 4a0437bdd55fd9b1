#pragma once
#include <spdlog/spdlog.h>
#include "CardSchedule.hpp"
#include "Clock.hpp"
#include "Rating.hpp"

/*
  Hybrid review scheduler:
   - cards in LearningPhase are moved through LearningSteps, ratings read
     structurally (Forgot = regress, Hard = repeat, Easy = advance)
   - cards in ReviewingPhase get SM-2 with quality 0/3/5; a Forgot lapses the
     card back to learning step 1, keeping its easiness factor

  Holds nothing but the injected clock, so review() is a pure function of
  (state, rating, clock.now()). Due-time eligibility is the caller's concern.
*/
class Scheduler {
public:
    explicit Scheduler(const Clock& clock);

    // Throws InconsistentState for a corrupt input record, InvalidRating for
    // a rating outside the enum. The input is never modified.
    ReviewResult review(const CardSchedule& card, Rating rating) const;

    // Fresh card: learning step 1, EF 2.5, due after one step-1 duration
    CardSchedule newCard() const;

    const Clock& clock() const { return clk; }

private:
    const Clock& clk;

    ReviewResult reviewLearning(const CardSchedule& card, const LearningPhase& learning, Rating rating) const;
    ReviewResult reviewGraduated(const CardSchedule& card, const ReviewingPhase& reviewing, Rating rating) const;
};
