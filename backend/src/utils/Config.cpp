#include "Config.hpp"

Config Config::fromArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return fromArgs(args);
}

Config Config::fromArgs(const std::vector<std::string>& args) {
    Config cfg;
    bool data_given = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= args.size()) throw UsageError(flag + " requires a value");
            return args[++i];
        };

        if (a == "--test") cfg.test_mode = true;
        else if (a == "--verbose") cfg.log_level = spdlog::level::debug;
        else if (a == "--help" || a == "-h") cfg.show_help = true;
        else if (a == "--data") { cfg.data_file = value(a); data_given = true; }
        else if (a == "--log") cfg.log_file = value(a);
        else throw UsageError("unknown option '" + a + "'");
    }

    // keep accelerated runs away from the real deck
    if (cfg.test_mode && !data_given) cfg.data_file = "vocab_test.dat";

    return cfg;
}

std::string Config::usage(const std::string& program) {
    return "Usage: " + program + " [--test] [--data FILE] [--log FILE] [--verbose]\n"
        "  --test       time runs 1000x faster (1 day = 86.4s), uses vocab_test.dat\n"
        "  --data FILE  deck file (default vocab.dat)\n"
        "  --log FILE   log file (default vocab.log)\n"
        "  --verbose    debug logging\n";
}
