#pragma once
#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

#include "core/Clock.hpp"

// Clock that only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(int accelerationFactor = 1,
        TimePoint start = fromEpochMillis(1700000000000LL))
        : Clock(accelerationFactor), current(start) {}

    TimePoint now() const override { return current; }

    void advance(Duration d) { current += d; }
    void set(TimePoint t) { current = t; }

private:
    TimePoint current;
};

// Unique path under the system temp dir, removed (with its .tmp) on scope exit.
class TempPath {
public:
    explicit TempPath(const std::string& stem) {
        static std::atomic<int> counter{ 0 };
        path = (std::filesystem::temp_directory_path() /
            (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".dat")).string();
        cleanup();
    }
    ~TempPath() { cleanup(); }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& str() const { return path; }

private:
    std::string path;

    void cleanup() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path + ".tmp", ec);
    }
};
