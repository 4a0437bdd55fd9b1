#pragma once
#include <string>

enum class Rating {
    FORGOT = 1,
    HARD = 2,
    EASY = 3
};

// What a rating means while the card is still in its learning steps
enum class LearningAction {
    REGRESS,
    REPEAT,
    ADVANCE
};

class RatingMapper {
public:
    // "1"/"2"/"3" or "forgot"/"hard"/"easy" (any case); throws InvalidRating
    static Rating parse(const std::string& token);
    static Rating fromInt(int value);

    static LearningAction learningAction(Rating r);

    // SM-2 quality: Forgot=0, Hard=3, Easy=5
    static int quality(Rating r);

    static const char* name(Rating r);
};
