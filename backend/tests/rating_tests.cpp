#include <catch2/catch.hpp>

#include "core/Errors.hpp"
#include "core/Rating.hpp"

TEST_CASE("numeric and named tokens parse to ratings", "[rating]") {
    CHECK(RatingMapper::parse("1") == Rating::FORGOT);
    CHECK(RatingMapper::parse("2") == Rating::HARD);
    CHECK(RatingMapper::parse("3") == Rating::EASY);
    CHECK(RatingMapper::parse(" Easy ") == Rating::EASY);
    CHECK(RatingMapper::parse("FORGOT") == Rating::FORGOT);
    CHECK(RatingMapper::parse("hard") == Rating::HARD);
}

TEST_CASE("unknown tokens are rejected as InvalidRating", "[rating]") {
    CHECK_THROWS_AS(RatingMapper::parse(""), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::parse("0"), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::parse("4"), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::parse("good"), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::fromInt(0), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::fromInt(4), InvalidRating);
    CHECK(RatingMapper::fromInt(2) == Rating::HARD);
}

TEST_CASE("learning phase reads ratings structurally", "[rating]") {
    CHECK(RatingMapper::learningAction(Rating::FORGOT) == LearningAction::REGRESS);
    CHECK(RatingMapper::learningAction(Rating::HARD) == LearningAction::REPEAT);
    CHECK(RatingMapper::learningAction(Rating::EASY) == LearningAction::ADVANCE);
}

TEST_CASE("review phase maps ratings to SM-2 quality 0/3/5", "[rating]") {
    CHECK(RatingMapper::quality(Rating::FORGOT) == 0);
    CHECK(RatingMapper::quality(Rating::HARD) == 3);
    CHECK(RatingMapper::quality(Rating::EASY) == 5);
}

TEST_CASE("out-of-enum rating values are rejected", "[rating]") {
    const Rating bogus = static_cast<Rating>(9);
    CHECK_THROWS_AS(RatingMapper::quality(bogus), InvalidRating);
    CHECK_THROWS_AS(RatingMapper::learningAction(bogus), InvalidRating);
}
