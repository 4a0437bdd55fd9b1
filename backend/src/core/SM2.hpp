#pragma once

/*
  SuperMemo-2 recurrence for graduated cards.

    n' = n + 1
    I' = 1 (n' = 1), 6 (n' = 2), ceil(I * EF) otherwise
    EF' = max(1.3, EF + (0.1 - (5 - q) * (0.08 + (5 - q) * 0.02)))

  The interval uses EF as it was before this review. EF arithmetic runs in
  thousandths so results are exact (2.5 -> 2.6 on q=5, 2.5 -> 2.36 on q=3).
  q = 0 is a lapse: no interval is computed and the caller sends the card
  back to the learning steps.
*/
namespace SM2 {

constexpr long long MIN_EASINESS_MILLI = 1300;
constexpr int MAX_INTERVAL_DAYS = 36500;

struct Result {
    bool lapsed = false;
    int repetitions = 0;
    int interval_days = 0;
    double easiness_factor = 2.5;
};

Result calculate(int repetitions, int interval_days, double easiness_factor, int quality);

// EF' for a given quality, without touching interval state
double nextEasiness(double easiness_factor, int quality);

// EF in thousandths; throws InconsistentState if it does not fit
long long toMilli(double easiness_factor);

}  // namespace SM2
