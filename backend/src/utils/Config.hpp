#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// Process-wide settings, read once from the command line and never mutated.
struct Config {
    static constexpr int TEST_ACCELERATION = 1000;

    bool test_mode = false;
    bool show_help = false;
    std::string data_file = "vocab.dat";
    std::string log_file = "vocab.log";
    spdlog::level::level_enum log_level = spdlog::level::info;

    int accelerationFactor() const { return test_mode ? TEST_ACCELERATION : 1; }

    // Throws UsageError on unknown flags or a flag missing its value
    static Config fromArgs(const std::vector<std::string>& args);
    static Config fromArgs(int argc, char** argv);

    static std::string usage(const std::string& program);
};
