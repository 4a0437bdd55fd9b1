#include <catch2/catch.hpp>
#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/SM2.hpp"
#include "core/Scheduler.hpp"

using namespace std::chrono;

namespace {

CardSchedule applyAll(const Scheduler& s, CardSchedule card, const std::vector<Rating>& ratings) {
    for (Rating r : ratings) card = s.review(card, r).state;
    return card;
}

const ReviewingPhase& reviewing(const CardSchedule& c) {
    return std::get<ReviewingPhase>(c.phase);
}

int learningStep(const CardSchedule& c) {
    return std::get<LearningPhase>(c.phase).step;
}

CardSchedule graduatedCard(const Scheduler& s) {
    return applyAll(s, s.newCard(), { Rating::EASY, Rating::EASY, Rating::EASY });
}

}  // namespace

TEST_CASE("new cards start at learning step 1", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = s.newCard();
    REQUIRE(c.isLearning());
    CHECK(learningStep(c) == 1);
    CHECK(c.easiness_factor == 2.5);
    CHECK(c.next_due == clock.now() + minutes(1));
}

TEST_CASE("scenario a: easy three times graduates", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = graduatedCard(s);
    REQUIRE(c.isReviewing());
    CHECK(reviewing(c).repetitions == 1);
    CHECK(reviewing(c).interval_days == 1);
    CHECK(c.easiness_factor == 2.5);
    CHECK(c.next_due == clock.now() + hours(24));
}

TEST_CASE("scenario b: graduated card rated easy", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    ReviewResult r = s.review(graduatedCard(s), Rating::EASY);
    REQUIRE(r.state.isReviewing());
    CHECK(reviewing(r.state).repetitions == 2);
    CHECK(reviewing(r.state).interval_days == 6);
    CHECK(r.state.easiness_factor == 2.6);
    CHECK(r.state.next_due == clock.now() + hours(24 * 6));
    CHECK(r.event.describe() == "reviewing, interval now 6 day(s)");
}

TEST_CASE("scenario b continued: second easy grows the interval by the prior EF", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = applyAll(s, graduatedCard(s), { Rating::EASY, Rating::EASY });
    CHECK(reviewing(c).repetitions == 3);
    CHECK(reviewing(c).interval_days == 16);
    CHECK(c.easiness_factor == 2.7);
}

TEST_CASE("scenario c: graduated card rated hard", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = s.review(graduatedCard(s), Rating::HARD).state;
    CHECK(reviewing(c).repetitions == 2);
    CHECK(reviewing(c).interval_days == 6);
    CHECK(c.easiness_factor == 2.36);
}

TEST_CASE("scenario d: forgot while reviewing goes back to learning", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule b = s.review(graduatedCard(s), Rating::EASY).state;
    ReviewResult r = s.review(b, Rating::FORGOT);
    REQUIRE(r.state.isLearning());
    CHECK(learningStep(r.state) == 1);
    CHECK(r.state.easiness_factor == 2.6);
    CHECK(r.state.next_due == clock.now() + minutes(1));
    CHECK(r.event.kind == ReviewEvent::Kind::BACK_TO_LEARNING);
    CHECK(r.event.describe() == "back to learning");
}

TEST_CASE("scenario e: hard at step 2 keeps the step", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = s.review(s.newCard(), Rating::EASY).state;
    REQUIRE(learningStep(c) == 2);

    clock.advance(minutes(30));
    ReviewResult r = s.review(c, Rating::HARD);
    CHECK(learningStep(r.state) == 2);
    CHECK(r.state.next_due == clock.now() + minutes(10));
}

TEST_CASE("a lapsed card must walk all three steps again", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = applyAll(s, graduatedCard(s), { Rating::EASY, Rating::EASY, Rating::FORGOT });
    REQUIRE(c.isLearning());

    c = applyAll(s, c, { Rating::EASY, Rating::EASY });
    REQUIRE(c.isLearning());
    CHECK(learningStep(c) == 3);

    c = s.review(c, Rating::EASY).state;
    REQUIRE(c.isReviewing());
    CHECK(reviewing(c).repetitions == 1);
    CHECK(reviewing(c).interval_days == 1);
    CHECK(c.easiness_factor == 2.7);
}

TEST_CASE("forgot while reviewing ignores history", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c;
    ReviewingPhase rev;
    rev.repetitions = 12;
    rev.interval_days = 400;
    c.phase = rev;
    c.easiness_factor = 1.3;

    CardSchedule out = s.review(c, Rating::FORGOT).state;
    REQUIRE(out.isLearning());
    CHECK(learningStep(out) == 1);
    CHECK(out.easiness_factor == 1.3);
}

TEST_CASE("invariants hold over every short rating sequence", "[scheduler]") {
    ManualClock clock(1000);
    Scheduler s(clock);
    const Rating all[] = { Rating::FORGOT, Rating::HARD, Rating::EASY };

    // every sequence of 6 ratings, 3^6 of them
    for (int code = 0; code < 729; ++code) {
        CardSchedule c = s.newCard();
        int n = code;
        for (int i = 0; i < 6; ++i) {
            const Rating r = all[n % 3];
            n /= 3;

            const bool wasStep3 = c.isLearning() && learningStep(c) == 3;
            const bool wasLearning = c.isLearning();

            ReviewResult res = s.review(c, r);
            const CardSchedule& next = res.state;

            REQUIRE(next.easiness_factor >= CardSchedule::MIN_EASINESS);
            REQUIRE(next.next_due > clock.now());
            if (next.isLearning()) {
                REQUIRE(learningStep(next) >= 1);
                REQUIRE(learningStep(next) <= 3);
                if (r == Rating::FORGOT) REQUIRE(learningStep(next) == 1);
            }
            else {
                REQUIRE(reviewing(next).interval_days >= 1);
            }

            const bool graduated = wasLearning && next.isReviewing();
            REQUIRE(graduated == (wasStep3 && r == Rating::EASY));
            if (graduated) {
                REQUIRE(reviewing(next).repetitions == 1);
                REQUIRE(reviewing(next).interval_days == 1);
            }

            c = next;
            clock.advance(milliseconds(1));
        }
    }
}

TEST_CASE("corrupt records are reported and left untouched", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    SECTION("learning step out of range") {
        CardSchedule c;
        c.phase = LearningPhase{ 4 };
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
        c.phase = LearningPhase{ 0 };
        CHECK_THROWS_AS(s.review(c, Rating::HARD), InconsistentState);
        CHECK(learningStep(c) == 0);
    }

    SECTION("review interval below one day") {
        CardSchedule c;
        ReviewingPhase rev;
        rev.interval_days = 0;
        c.phase = rev;
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
        CHECK(reviewing(c).interval_days == 0);
    }

    SECTION("easiness factor below floor") {
        CardSchedule c;
        c.phase = ReviewingPhase{};
        c.easiness_factor = 1.2;
        CHECK_THROWS_AS(s.review(c, Rating::HARD), InconsistentState);
        CHECK(c.easiness_factor == 1.2);

        CardSchedule learning;
        learning.easiness_factor = 0.5;
        CHECK_THROWS_AS(s.review(learning, Rating::EASY), InconsistentState);
    }

    SECTION("negative repetitions") {
        CardSchedule c;
        ReviewingPhase rev;
        rev.repetitions = -1;
        c.phase = rev;
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
    }

    SECTION("easiness factor is not a number") {
        CardSchedule c;
        c.phase = ReviewingPhase{ 3, 10 };
        c.easiness_factor = std::numeric_limits<double>::quiet_NaN();
        const TimePoint due = c.next_due;
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
        CHECK(std::isnan(c.easiness_factor));
        CHECK(c.next_due == due);

        c.easiness_factor = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(s.review(c, Rating::HARD), InconsistentState);
    }

    SECTION("easiness factor too large to schedule") {
        CardSchedule c;
        c.phase = ReviewingPhase{ 3, 10 };
        c.easiness_factor = 1e300;
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
        CHECK(c.easiness_factor == 1e300);
    }

    SECTION("repetition count at its limit") {
        CardSchedule c;
        c.phase = ReviewingPhase{ std::numeric_limits<int>::max(), 10 };
        CHECK_THROWS_AS(s.review(c, Rating::EASY), InconsistentState);
        CHECK(reviewing(c).repetitions == std::numeric_limits<int>::max());
    }
}

TEST_CASE("a very large easiness factor keeps growing and caps the interval", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c;
    c.phase = ReviewingPhase{ 5, 10 };
    c.easiness_factor = 3.0e6;

    ReviewResult r = s.review(c, Rating::EASY);
    CHECK(r.state.easiness_factor == 3000000.1);
    CHECK(reviewing(r.state).repetitions == 6);
    CHECK(reviewing(r.state).interval_days == SM2::MAX_INTERVAL_DAYS);
}

TEST_CASE("reviewing a card before it is due still reschedules", "[scheduler]") {
    ManualClock clock;
    Scheduler s(clock);

    CardSchedule c = s.newCard();
    REQUIRE_FALSE(c.isDue(clock.now()));
    CardSchedule next = s.review(c, Rating::EASY).state;
    CHECK(learningStep(next) == 2);
}
