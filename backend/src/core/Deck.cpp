#include "Deck.hpp"
#include "LearningSteps.hpp"
#include <algorithm>
#include <fmt/format.h>
#include "../utils/text.hpp"

static bool hasLineBreak(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

AddResult Deck::addWord(const std::string& word, const std::string& pos,
    const std::string& meaning, const std::string& chinese, const Scheduler& scheduler)
{
    AddResult res;
    const std::string w = Text::trim(word);
    const std::string m = Text::trim(meaning);

    if (w.empty()) {
        res.message = "Word cannot be empty.";
        return res;
    }
    if (m.empty()) {
        res.message = "Definition cannot be empty.";
        return res;
    }
    if (hasLineBreak(w) || hasLineBreak(pos) || hasLineBreak(m) || hasLineBreak(chinese)) {
        res.message = "Fields cannot contain line breaks.";
        return res;
    }

    auto dup = std::find_if(words.begin(), words.end(),
        [&w](const Word& x) { return x.word == w; });
    if (dup != words.end()) {
        res.message = fmt::format("Word '{}' already exists.", w);
        return res;
    }

    Word entry(w, pos, m, chinese);
    entry.schedule = scheduler.newCard();
    words.push_back(entry);

    auto first = LearningSteps::duration(1).count();
    res.success = true;
    res.word_id = entry.id;
    const std::string posPart = entry.pos.empty() ? "" : fmt::format(" ({})", entry.pos);
    res.message = fmt::format("Added: '{}'{} - first review in {} min", entry.word, posPart, first);
    spdlog::info("Deck: added '{}' ({} words total)", entry.word, words.size());
    return res;
}

std::vector<const Word*> Deck::dueWords(TimePoint now) const {
    std::vector<const Word*> due;
    due.reserve(words.size() / 4 + 8);

    for (const auto& w : words) {
        if (w.schedule.isDue(now)) {
            due.push_back(&w);
        }
    }

    std::sort(due.begin(), due.end(),
        [](const Word* a, const Word* b) {
            if (a->schedule.next_due != b->schedule.next_due)
                return a->schedule.next_due < b->schedule.next_due;
            return a->word < b->word;
        });

    return due;
}

std::vector<const Word*> Deck::allWords() const {
    std::vector<const Word*> all;
    all.reserve(words.size());
    for (const auto& w : words) all.push_back(&w);

    std::sort(all.begin(), all.end(),
        [](const Word* a, const Word* b) { return a->word < b->word; });
    return all;
}

DeckStats Deck::stats(TimePoint now) const {
    DeckStats s;
    double ef_sum = 0.0;

    for (const auto& w : words) {
        ++s.total;
        if (w.schedule.isDue(now)) ++s.pending;
        if (w.schedule.isLearning()) {
            ++s.learning;
        }
        else {
            ++s.graduated;
            ef_sum += w.schedule.easiness_factor;
        }
    }

    if (s.graduated > 0) s.avg_ef = ef_sum / static_cast<double>(s.graduated);
    return s;
}

RatingOutcome Deck::submitRating(const std::string& word_id, Rating rating, const Scheduler& scheduler) {
    RatingOutcome out;

    Word* w = findMutable(word_id);
    if (!w) {
        out.feedback = "Word not found.";
        return out;
    }

    ReviewResult result = scheduler.review(w->schedule, rating);

    // commit all schedule fields at once
    w->schedule = result.state;

    out.success = true;
    out.event = result.event;
    out.graduated = result.event.kind == ReviewEvent::Kind::GRADUATED;
    out.feedback = fmt::format("{} - review in {}", result.event.describe(), result.event.delayText());

    spdlog::info("Reviewed '{}' as {}: {}", w->word, RatingMapper::name(rating), out.feedback);
    return out;
}

size_t Deck::clear() {
    size_t count = words.size();
    words.clear();
    spdlog::warn("Deck cleared, {} word(s) deleted", count);
    return count;
}

const Word* Deck::find(const std::string& word_id) const {
    auto it = std::find_if(words.begin(), words.end(),
        [&word_id](const Word& w) { return w.id == word_id; });
    return it == words.end() ? nullptr : &*it;
}

Word* Deck::findMutable(const std::string& word_id) {
    auto it = std::find_if(words.begin(), words.end(),
        [&word_id](const Word& w) { return w.id == word_id; });
    return it == words.end() ? nullptr : &*it;
}
