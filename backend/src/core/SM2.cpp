#include "SM2.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace SM2 {

// well inside long long, so the delta and the interval product cannot overflow
static constexpr double MAX_MILLI = 1e15;

long long toMilli(double easiness_factor) {
    const double scaled = easiness_factor * 1000.0;
    if (!(std::fabs(scaled) < MAX_MILLI)) {
        throw InconsistentState(fmt::format("easiness factor {} out of range", easiness_factor));
    }
    return std::llround(scaled);
}

static long long easinessDeltaMilli(int quality) {
    // 0.1 - (5-q) * (0.08 + (5-q) * 0.02), scaled by 1000
    const int miss = 5 - quality;
    return 100 - miss * (80 + miss * 20);
}

static void requireQuality(int quality) {
    if (quality != 0 && quality != 3 && quality != 5) {
        throw InvalidRating("SM-2 quality must be 0, 3 or 5, got " + std::to_string(quality));
    }
}

double nextEasiness(double easiness_factor, int quality) {
    requireQuality(quality);
    long long ef = std::max(MIN_EASINESS_MILLI, toMilli(easiness_factor) + easinessDeltaMilli(quality));
    return static_cast<double>(ef) / 1000.0;
}

Result calculate(int repetitions, int interval_days, double easiness_factor, int quality) {
    requireQuality(quality);

    Result r;
    if (quality == 0) {
        r.lapsed = true;
        r.repetitions = repetitions;
        r.interval_days = interval_days;
        r.easiness_factor = easiness_factor;
        return r;
    }

    if (repetitions == std::numeric_limits<int>::max()) {
        throw InconsistentState("repetition count cannot be incremented");
    }
    r.repetitions = repetitions + 1;

    if (r.repetitions == 1) {
        r.interval_days = 1;
    }
    else if (r.repetitions == 2) {
        r.interval_days = 6;
    }
    else {
        // ceil(I * EF) with EF in thousandths
        const long long efMilli = toMilli(easiness_factor);
        const long long days = std::max(1, interval_days);
        if (efMilli > static_cast<long long>(MAX_INTERVAL_DAYS) * 1000 / days) {
            r.interval_days = MAX_INTERVAL_DAYS;
        }
        else {
            long long next = (days * efMilli + 999) / 1000;
            r.interval_days = static_cast<int>(std::min<long long>(std::max<long long>(1, next), MAX_INTERVAL_DAYS));
        }
    }

    r.easiness_factor = nextEasiness(easiness_factor, quality);

    spdlog::debug("SM2 n={} I={} EF={:.2f} q={} -> n={} I={} EF={:.2f}",
        repetitions, interval_days, easiness_factor, quality,
        r.repetitions, r.interval_days, r.easiness_factor);
    return r;
}

}  // namespace SM2
