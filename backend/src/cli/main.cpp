#include <iostream>
#include <string>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../core/Clock.hpp"
#include "../core/Deck.hpp"
#include "../core/Scheduler.hpp"
#include "../storage/Storage.hpp"
#include "Session.hpp"

int main(int argc, char** argv) {
    Config config;
    try {
        config = Config::fromArgs(argc, argv);
    }
    catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n" << Config::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << Config::usage(argv[0]);
        return 0;
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    try {
        Log::init(config.log_file, config.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file '" << config.log_file << "': " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Starting vocab trainer: data='{}' test_mode={}", config.data_file, config.test_mode);

    // One clock for the whole run; its acceleration never changes
    Clock clock(config.accelerationFactor());
    Scheduler scheduler(clock);

    Deck deck;
    if (!Storage::loadDeck(deck, config.data_file)) {
        std::cerr << "Could not load deck '" << config.data_file << "' (see " << config.log_file << ")\n";
        return 1;
    }

    Session session(deck, scheduler, config, std::cin, std::cout);
    session.showBanner();
    session.run();

    spdlog::info("Exiting with {} word(s) in deck", deck.size());
    return 0;
}
