#pragma once
#include <iosfwd>
#include <string>
#include "../core/Deck.hpp"
#include "../core/Scheduler.hpp"
#include "../utils/Config.hpp"

// Interactive command loop. Every change to the deck is written to
// config.data_file before the next prompt.
class Session {
public:
    Session(Deck& deck, const Scheduler& scheduler, const Config& config,
        std::istream& in, std::ostream& out);

    // Reads commands until exit/quit/q or end of input
    void run();

    // Returns false when the session should end
    bool execute(const std::string& command);

    void showBanner();

private:
    Deck& deck;
    const Scheduler& scheduler;
    const Config& config;
    std::istream& in;
    std::ostream& out;

    void cmdAdd();
    void cmdPending();
    void cmdReview();
    void cmdList();
    void cmdStats();
    void cmdClear();
    void cmdWait();
    void showHelp();

    bool save();
    bool prompt(const std::string& text, std::string& line);
};
