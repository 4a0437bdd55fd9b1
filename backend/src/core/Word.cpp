#include "Word.hpp"
#include "LearningSteps.hpp"
#include <sodium.h>
#include <fmt/format.h>
#include "../utils/text.hpp"

Word::Word(const std::string& w, const std::string& p, const std::string& m, const std::string& c)
    : word(Text::trim(w)), pos(Text::trim(p)), meaning(Text::trim(m)), chinese(Text::trim(c))
{
    id = generateID();
    spdlog::info("Created Word: ID={}, Word={}", id, word);
}

std::string Word::phaseLabel() const {
    if (const auto* l = std::get_if<LearningPhase>(&schedule.phase)) {
        return fmt::format("[Learning {}/{}]", l->step, LearningSteps::STEP_COUNT);
    }
    return fmt::format("[Review #{}]", std::get<ReviewingPhase>(schedule.phase).repetitions + 1);
}

// Random 64-bit id, hex encoded
std::string Word::generateID() {
    unsigned char bytes[8];
    randombytes_buf(bytes, sizeof(bytes));

    char hex[2 * sizeof(bytes) + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));
    return std::string(hex);
}

