#pragma once
#include <chrono>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

/*
  Time source for the scheduler.

  Every nominal duration ("1 minute", "1 day") goes through deadline() or
  scale(), which divide it by the acceleration factor fixed at construction.
  Factor 1 is real time; the --test mode uses 1000 so a day passes in 86.4s.
*/
class Clock {
public:
    explicit Clock(int accelerationFactor = 1);
    virtual ~Clock() = default;

    virtual TimePoint now() const;

    // now() + d / accelerationFactor
    TimePoint deadline(Duration nominal) const;
    Duration scale(Duration nominal) const;

    int accelerationFactor() const { return acceleration; }
    bool accelerated() const { return acceleration > 1; }

private:
    int acceleration;
};

// Human readable time left until `due`: "now", "5min", "3h", "2d".
// Accelerated clocks report real seconds/minutes instead ("0.6s", "1.4min").
std::string formatTimeUntil(TimePoint due, const Clock& clock);

// Milliseconds since the Unix epoch, used by storage.
long long toEpochMillis(TimePoint t);
TimePoint fromEpochMillis(long long ms);
