#pragma once
#include <stdexcept>
#include <string>

class SchedulerError : public std::runtime_error {
public:
    explicit SchedulerError(const std::string& what) : std::runtime_error(what) {}
};

// Rating token outside Forgot/Hard/Easy. Recoverable: ask again.
class InvalidRating : public SchedulerError {
public:
    explicit InvalidRating(const std::string& what) : SchedulerError(what) {}
};

// Schedule record that breaks a phase invariant (corrupt persisted data).
// The record is left untouched; only the current review fails.
class InconsistentState : public SchedulerError {
public:
    explicit InconsistentState(const std::string& what) : SchedulerError(what) {}
};
