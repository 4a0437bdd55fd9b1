#pragma once
#include <string>
#include "../core/Deck.hpp"

// Storage handles the deck file.
//
// Layout (text):
//   "VOCAB1"
//   "checksum <hex>"     BLAKE2b-256 (crypto_generichash) of everything below
//   records, one field per line:
//     id, word, pos, meaning, chinese,
//     phase (learning|reviewing), step, repetitions, interval, ef,
//     next_due (ms since epoch),
//     "---"
//
// saveDeck writes "<file>.tmp" and renames it over the target so a crash
// never leaves a half-written deck. loadDeck treats a missing file as an
// empty deck; any structural damage fails the load. Values are not range
// checked here: a bad step or EF is reported by the scheduler at review time.

class Storage {
public:
    static bool saveDeck(const Deck& deck, const std::string& filename);
    static bool loadDeck(Deck& deck, const std::string& filename);

    // exposed for tests
    static std::string serialize(const Deck& deck);
    static bool parse(const std::string& body, Deck& deck);
    static std::string checksum(const std::string& body);
};
