#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "CardSchedule.hpp"

class Word {
public:
    Word() = default;
    Word(const std::string& word, const std::string& pos, const std::string& meaning,
        const std::string& chinese = "");

    // Content, opaque to the scheduler
    std::string id;          // Auto-generated
    std::string word;
    std::string pos;         // part of speech, may be empty
    std::string meaning;
    std::string chinese;     // translation, may be empty

    // Scheduler state
    CardSchedule schedule;

    // "[Learning 2/3]" or "[Review #4]"
    std::string phaseLabel() const;

    // Utility
    static std::string generateID();
};
