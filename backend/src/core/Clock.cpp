#include "Clock.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

Clock::Clock(int accelerationFactor)
    : acceleration(std::max(1, accelerationFactor))
{
    if (acceleration > 1) {
        spdlog::info("Clock running {}x faster than real time", acceleration);
    }
}

TimePoint Clock::now() const {
    return std::chrono::system_clock::now();
}

Duration Clock::scale(Duration nominal) const {
    return nominal / acceleration;
}

TimePoint Clock::deadline(Duration nominal) const {
    return now() + scale(nominal);
}

std::string formatTimeUntil(TimePoint due, const Clock& clock) {
    using namespace std::chrono;

    double total_seconds = duration_cast<duration<double>>(due - clock.now()).count();
    if (total_seconds < 0) return "now";

    if (clock.accelerated()) {
        // show the real wall time left, nominal units would be meaningless
        if (total_seconds < 60) return fmt::format("{:.1f}s", total_seconds);
        return fmt::format("{:.1f}min", total_seconds / 60.0);
    }

    long long total_minutes = static_cast<long long>(total_seconds / 60);
    if (total_minutes < 60) return fmt::format("{}min", total_minutes);
    if (total_minutes < 1440) return fmt::format("{}h", total_minutes / 60);
    return fmt::format("{}d", total_minutes / 1440);
}

long long toEpochMillis(TimePoint t) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

TimePoint fromEpochMillis(long long ms) {
    using namespace std::chrono;
    return TimePoint(duration_cast<Duration>(milliseconds(ms)));
}
