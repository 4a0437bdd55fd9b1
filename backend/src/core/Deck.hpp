#pragma once
#include <string>
#include <vector>
#include "Rating.hpp"
#include "Scheduler.hpp"
#include "Word.hpp"

struct AddResult {
    bool success = false;
    std::string message;
    std::string word_id;
};

struct DeckStats {
    size_t total = 0;
    size_t pending = 0;
    size_t learning = 0;
    size_t graduated = 0;
    double avg_ef = 0.0;          // graduated words only, 0 when none
};

struct RatingOutcome {
    bool success = false;
    std::string feedback;         // "advance to step 2 - review in 10min"
    bool graduated = false;
    ReviewEvent event;
};

/*
  The learner's word list. Owns the Word records; the scheduler only ever
  sees copies of their CardSchedule and the result is committed whole.
*/
class Deck {
public:
    AddResult addWord(const std::string& word, const std::string& pos,
        const std::string& meaning, const std::string& chinese, const Scheduler& scheduler);

    // next_due <= now, oldest first
    std::vector<const Word*> dueWords(TimePoint now) const;

    // alphabetical
    std::vector<const Word*> allWords() const;

    DeckStats stats(TimePoint now) const;

    // Runs the scheduler and commits the new schedule on success. Lets
    // InconsistentState / InvalidRating through with the word untouched.
    RatingOutcome submitRating(const std::string& word_id, Rating rating, const Scheduler& scheduler);

    // Number of words removed
    size_t clear();

    const Word* find(const std::string& word_id) const;
    size_t size() const { return words.size(); }
    bool empty() const { return words.empty(); }

    std::vector<Word>& entries() { return words; }
    const std::vector<Word>& entries() const { return words; }

private:
    std::vector<Word> words;

    Word* findMutable(const std::string& word_id);
};
