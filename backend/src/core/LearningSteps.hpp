#pragma once
#include <array>
#include <chrono>
#include "CardSchedule.hpp"
#include "Rating.hpp"

/*
  Anki-style learning steps a new (or lapsed) card walks through before it is
  handed to SM-2:

     step 1 --Easy--> step 2 --Easy--> step 3 --Easy--> graduated
       ^                |                |
       +----Forgot------+-------<--------+      Hard repeats the current step

  Durations are nominal; the Clock applies any acceleration.
*/
class LearningSteps {
public:
    static constexpr int STEP_COUNT = 3;

    static std::chrono::minutes duration(int step);

    // Only valid while the card is in LearningPhase
    static ReviewResult apply(const LearningPhase& learning, double easiness_factor,
        LearningAction action, const Clock& clock);

private:
    static const std::array<std::chrono::minutes, STEP_COUNT> STEPS;
};
