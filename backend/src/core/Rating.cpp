#include "Rating.hpp"
#include "Errors.hpp"
#include "../utils/text.hpp"

Rating RatingMapper::parse(const std::string& token) {
    const std::string t = Text::lowerTrim(token);

    if (t == "1" || t == "forgot") return Rating::FORGOT;
    if (t == "2" || t == "hard") return Rating::HARD;
    if (t == "3" || t == "easy") return Rating::EASY;

    throw InvalidRating("Unrecognized rating '" + token + "'");
}

Rating RatingMapper::fromInt(int value) {
    switch (value) {
    case 1: return Rating::FORGOT;
    case 2: return Rating::HARD;
    case 3: return Rating::EASY;
    default:
        throw InvalidRating("Rating out of range: " + std::to_string(value));
    }
}

LearningAction RatingMapper::learningAction(Rating r) {
    switch (r) {
    case Rating::FORGOT: return LearningAction::REGRESS;
    case Rating::HARD: return LearningAction::REPEAT;
    case Rating::EASY: return LearningAction::ADVANCE;
    }
    throw InvalidRating("Unknown rating value " + std::to_string(static_cast<int>(r)));
}

int RatingMapper::quality(Rating r) {
    switch (r) {
    case Rating::FORGOT: return 0;
    case Rating::HARD: return 3;
    case Rating::EASY: return 5;
    }
    throw InvalidRating("Unknown rating value " + std::to_string(static_cast<int>(r)));
}

const char* RatingMapper::name(Rating r) {
    switch (r) {
    case Rating::FORGOT: return "Forgot";
    case Rating::HARD: return "Hard";
    case Rating::EASY: return "Easy";
    }
    return "?";
}
