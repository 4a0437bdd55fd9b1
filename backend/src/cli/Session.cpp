#include "Session.hpp"
#include <chrono>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "../core/Errors.hpp"
#include "../core/LearningSteps.hpp"
#include "../storage/Storage.hpp"
#include "../utils/text.hpp"

Session::Session(Deck& d, const Scheduler& s, const Config& c, std::istream& i, std::ostream& o)
    : deck(d), scheduler(s), config(c), in(i), out(o)
{
}

bool Session::prompt(const std::string& text, std::string& line) {
    out << text << std::flush;
    if (!std::getline(in, line)) return false;
    return true;
}

bool Session::save() {
    if (Storage::saveDeck(deck, config.data_file)) return true;
    out << "  (warning: could not save to " << config.data_file << ", see log)\n";
    return false;
}

void Session::showBanner() {
    out << "========================================\n"
        << "  Vocabulary Trainer (SM-2)\n"
        << "========================================\n";
    if (config.test_mode) {
        out << "  *** TEST MODE (" << config.accelerationFactor() << "x speed) ***\n"
            << "  1 min = 0.06s, 10 min = 0.6s, 1 day = 86.4s\n"
            << "========================================\n";
    }
    out << "Type 'help' for available commands.\n\n";
}

void Session::run() {
    std::string line;
    while (prompt("> ", line)) {
        std::string cmd = Text::lowerTrim(line);
        if (cmd.empty()) continue;
        if (!execute(cmd)) return;
    }
    spdlog::info("Input closed, ending session");
}

bool Session::execute(const std::string& command) {
    const std::string cmd = Text::lowerTrim(command);

    if (cmd == "exit" || cmd == "quit" || cmd == "q") {
        out << "Goodbye!\n";
        return false;
    }

    if (cmd == "add") cmdAdd();
    else if (cmd == "pending") cmdPending();
    else if (cmd == "review") cmdReview();
    else if (cmd == "list") cmdList();
    else if (cmd == "stats") cmdStats();
    else if (cmd == "clear") cmdClear();
    else if (cmd == "wait") cmdWait();
    else if (cmd == "help") showHelp();
    else out << "Unknown command: '" << cmd << "'. Type 'help' for available commands.\n";

    return true;
}

void Session::cmdAdd() {
    out << "\n--- Add New Word ---\n";

    std::string word, pos, meaning, chinese;
    if (!prompt("Word: ", word)) return;
    if (Text::trim(word).empty()) {
        out << "Word cannot be empty.\n";
        return;
    }
    if (!prompt("  POS (e.g., noun, verb, adj): ", pos)) return;
    if (!prompt("  Definition: ", meaning)) return;
    if (!prompt("  Translation (optional): ", chinese)) return;

    AddResult res = deck.addWord(word, pos, meaning, chinese, scheduler);
    out << res.message << "\n";
    if (res.success) save();
}

void Session::cmdPending() {
    auto due = deck.dueWords(scheduler.clock().now());
    if (due.empty()) {
        out << "\nNo words pending for review. Great job!\n";
        return;
    }

    out << "\n--- Pending Reviews: " << due.size() << " word(s) ---\n";
    for (const Word* w : due) {
        std::string status;
        if (const auto* l = std::get_if<LearningPhase>(&w->schedule.phase)) {
            status = fmt::format("learning (step {}/{})", l->step, LearningSteps::STEP_COUNT);
        }
        else {
            status = fmt::format("reviewing (reps: {})",
                std::get<ReviewingPhase>(w->schedule.phase).repetitions);
        }
        out << "  - " << w->word << " [" << status << "]\n";
    }
}

void Session::cmdReview() {
    auto due = deck.dueWords(scheduler.clock().now());
    if (due.empty()) {
        out << "\nNo words pending for review. Great job!\n";
        return;
    }

    // ids, not pointers: the deck may be rewritten while we go
    std::vector<std::string> ids;
    for (const Word* w : due) ids.push_back(w->id);

    out << "\n--- Review Session: " << ids.size() << " word(s) ---\n"
        << "Rating: (1) Forgot  (2) Hard  (3) Easy  (q) Quit\n\n";

    int reviewed = 0;
    std::string line;

    for (const auto& id : ids) {
        const Word* w = deck.find(id);
        if (!w) continue;
        const std::string word = w->word;

        out << w->phaseLabel() << " Word: " << word << "\n";
        if (!prompt("  [Press Enter to see meaning...]", line)) break;

        out << "  " << (w->pos.empty() ? "" : "(" + w->pos + ") ") << w->meaning << "\n";
        if (!w->chinese.empty()) out << "  " << w->chinese << "\n";
        out << "\n";

        Rating rating = Rating::HARD;
        bool quit = false;
        while (true) {
            if (!prompt("  Your rating (1/2/3/q): ", line)) { quit = true; break; }
            std::string answer = Text::lowerTrim(line);
            if (answer == "q") { quit = true; break; }
            try {
                rating = RatingMapper::parse(answer);
                break;
            }
            catch (const InvalidRating& e) {
                spdlog::debug("Rejected rating input: {}", e.what());
                out << "  Invalid input. Please enter 1, 2, 3, or q.\n";
            }
        }

        if (quit) {
            out << "\nSession ended. Reviewed " << reviewed << " word(s).\n";
            spdlog::info("Review session stopped by user after {} word(s)", reviewed);
            return;
        }

        RatingOutcome outcome;
        try {
            outcome = deck.submitRating(id, rating, scheduler);
        }
        catch (const InconsistentState& e) {
            spdlog::error("Corrupt schedule for '{}': {}", word, e.what());
            out << "  !! Schedule data for '" << word << "' is inconsistent (" << e.what()
                << "); skipped.\n\n";
            continue;
        }

        if (!outcome.success) {
            out << "  " << outcome.feedback << "\n\n";
            continue;
        }

        save();
        ++reviewed;
        out << "  -> " << outcome.feedback << "\n\n";
    }

    out << "Session complete! Reviewed " << reviewed << " word(s).\n";
}

void Session::cmdList() {
    auto all = deck.allWords();
    if (all.empty()) {
        out << "\nNo words in deck. Use 'add' to add some!\n";
        return;
    }

    const Clock& clock = scheduler.clock();
    out << "\n--- All Words (" << all.size() << ") ---\n";
    for (const Word* w : all) {
        out << "  " << w->word << (w->pos.empty() ? "" : " (" + w->pos + ")")
            << ": " << w->meaning << "\n";

        const CardSchedule& s = w->schedule;
        std::string until = formatTimeUntil(s.next_due, clock);
        if (const auto* l = std::get_if<LearningPhase>(&s.phase)) {
            out << fmt::format("    [Learning step {}/{}] next: {}\n",
                l->step, LearningSteps::STEP_COUNT, until);
        }
        else {
            const auto& r = std::get<ReviewingPhase>(s.phase);
            out << fmt::format("    [SM-2] reps: {}, interval: {}d, EF: {:.2f}, next: {}\n",
                r.repetitions, r.interval_days, s.easiness_factor, until);
        }
    }
}

void Session::cmdStats() {
    DeckStats st = deck.stats(scheduler.clock().now());

    out << "\n--- Statistics ---\n"
        << "  Total words: " << st.total << "\n"
        << "  In learning: " << st.learning << "\n"
        << "  Graduated (SM-2): " << st.graduated << "\n"
        << "  Pending now: " << st.pending << "\n";
    if (st.graduated > 0) {
        out << fmt::format("  Average EF (graduated): {:.2f}\n", st.avg_ef);
    }
}

void Session::cmdClear() {
    if (deck.empty()) {
        out << "Deck is already empty.\n";
        return;
    }

    std::string answer;
    if (!prompt(fmt::format("Delete all {} word(s)? Type 'yes' to confirm: ", deck.size()), answer)) return;
    if (Text::lowerTrim(answer) != "yes") {
        out << "Cancelled.\n";
        return;
    }

    size_t count = deck.clear();
    out << "Deleted " << count << " word" << (count == 1 ? "" : "s") << ".\n";
    save();
}

void Session::cmdWait() {
    if (!config.test_mode) {
        out << "Wait command only available in test mode.\n";
        return;
    }

    std::string line;
    if (!prompt("Wait seconds (or Enter for 1s): ", line)) return;

    double seconds = 1.0;
    std::string t = Text::trim(line);
    if (!t.empty()) {
        try {
            size_t used = 0;
            seconds = std::stod(t, &used);
            if (used != t.size() || seconds < 0) throw std::invalid_argument(t);
        }
        catch (const std::exception&) {
            out << "Invalid number.\n";
            return;
        }
    }

    out << "Waiting " << seconds << "s..." << std::flush;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    out << " done.\n";
}

void Session::showHelp() {
    out << "\n--- Vocabulary Trainer ---\n"
        << "Commands:\n"
        << "  add     - Add a new word\n"
        << "  pending - Show words due for review\n"
        << "  review  - Start a review session\n"
        << "  list    - List all words\n"
        << "  stats   - Show statistics\n"
        << "  clear   - Delete all words\n"
        << "  help    - Show this help message\n"
        << "  exit    - Quit the program\n";
    if (config.test_mode) {
        out << "  wait    - Wait N seconds (test mode)\n";
    }
}
