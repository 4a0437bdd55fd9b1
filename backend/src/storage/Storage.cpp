#include "Storage.hpp"
#include <iterator>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sodium.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "VOCAB1";
static const char CHECKSUM_TAG[] = "checksum ";
static const char RECORD_SEP[] = "---";

static const char PHASE_LEARNING[] = "learning";
static const char PHASE_REVIEWING[] = "reviewing";

std::string Storage::checksum(const std::string& body) {
    unsigned char digest[crypto_generichash_BYTES];
    crypto_generichash(digest, sizeof(digest),
        reinterpret_cast<const unsigned char*>(body.data()), body.size(),
        nullptr, 0);

    char hex[2 * crypto_generichash_BYTES + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    return std::string(hex);
}

std::string Storage::serialize(const Deck& deck) {
    std::ostringstream oss;

    for (const auto& w : deck.entries()) {
        const CardSchedule& s = w.schedule;

        oss << w.id << "\n"
            << w.word << "\n"
            << w.pos << "\n"
            << w.meaning << "\n"
            << w.chinese << "\n";

        if (const auto* l = std::get_if<LearningPhase>(&s.phase)) {
            oss << PHASE_LEARNING << "\n"
                << l->step << "\n"
                << 0 << "\n"
                << 1 << "\n";
        }
        else {
            const auto& r = std::get<ReviewingPhase>(s.phase);
            oss << PHASE_REVIEWING << "\n"
                << 0 << "\n"
                << r.repetitions << "\n"
                << r.interval_days << "\n";
        }

        oss << fmt::format("{}", s.easiness_factor) << "\n"
            << toEpochMillis(s.next_due) << "\n"
            << RECORD_SEP << "\n";
    }

    return oss.str();
}

template <typename T>
static bool parseNumber(const std::string& line, T& out) {
    std::istringstream iss(line);
    iss >> out;
    return !iss.fail() && (iss >> std::ws).eof();
}

bool Storage::parse(const std::string& body, Deck& deck) {
    std::istringstream iss(body);
    std::vector<Word> loaded;
    size_t record = 0;

    std::string id;
    while (std::getline(iss, id)) {
        ++record;
        Word w;
        w.id = id;

        std::string phase, step, reps, interval, ef, due, sep;
        if (!std::getline(iss, w.word) || !std::getline(iss, w.pos) ||
            !std::getline(iss, w.meaning) || !std::getline(iss, w.chinese) ||
            !std::getline(iss, phase) || !std::getline(iss, step) ||
            !std::getline(iss, reps) || !std::getline(iss, interval) ||
            !std::getline(iss, ef) || !std::getline(iss, due) ||
            !std::getline(iss, sep))
        {
            spdlog::error("Deck record {} is truncated", record);
            return false;
        }

        if (sep != RECORD_SEP) {
            spdlog::error("Deck record {} missing separator", record);
            return false;
        }

        int step_v = 0, reps_v = 0, interval_v = 0;
        double ef_v = 0.0;
        long long due_ms = 0;
        if (!parseNumber(step, step_v) || !parseNumber(reps, reps_v) ||
            !parseNumber(interval, interval_v) || !parseNumber(ef, ef_v) ||
            !parseNumber(due, due_ms))
        {
            spdlog::error("Deck record {} ('{}') has a malformed number", record, w.word);
            return false;
        }

        if (phase == PHASE_LEARNING) {
            w.schedule.phase = LearningPhase{ step_v };
        }
        else if (phase == PHASE_REVIEWING) {
            ReviewingPhase r;
            r.repetitions = reps_v;
            r.interval_days = interval_v;
            w.schedule.phase = r;
        }
        else {
            spdlog::error("Deck record {} ('{}') has unknown phase '{}'", record, w.word, phase);
            return false;
        }

        w.schedule.easiness_factor = ef_v;
        w.schedule.next_due = fromEpochMillis(due_ms);
        loaded.push_back(std::move(w));
    }

    deck.entries() = std::move(loaded);
    return true;
}

bool Storage::saveDeck(const Deck& deck, const std::string& filename) {
    spdlog::info("Saving {} words to '{}'", deck.size(), filename);

    std::string body = serialize(deck);
    std::string tmp = filename + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp);
            return false;
        }

        out << MAGIC_HDR << "\n"
            << CHECKSUM_TAG << checksum(body) << "\n"
            << body;
        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, filename, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", filename, ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool Storage::loadDeck(Deck& deck, const std::string& filename) {
    spdlog::info("Loading deck from '{}'", filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Deck file '{}' not found; treating as empty", filename);
        deck.entries().clear();
        return true;
    }

    std::string hdr;
    if (!std::getline(in, hdr) || hdr != MAGIC_HDR) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    std::string sum_line;
    const std::string tag = CHECKSUM_TAG;
    if (!std::getline(in, sum_line) || sum_line.compare(0, tag.size(), tag) != 0) {
        spdlog::error("Missing checksum line in '{}'", filename);
        return false;
    }

    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (sum_line.substr(tag.size()) != checksum(body)) {
        spdlog::error("Checksum mismatch in '{}'; file is corrupt", filename);
        return false;
    }

    if (!parse(body, deck)) {
        spdlog::error("Failed to parse deck '{}'", filename);
        return false;
    }

    spdlog::info("Loaded {} words", deck.size());
    return true;
}
