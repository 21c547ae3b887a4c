#pragma once

#include "core/Types.h"

#include <vector>

namespace addsynth {

/// A half-open interval [start, start + duration) in seconds.
class TimeSpan {
public:
    explicit TimeSpan(double duration, double start = 0.0)
        : duration_(duration), start_(start) {}

    double getDuration() const { return duration_; }
    double getStart() const { return start_; }
    double getEnd() const { return start_ + duration_; }

    /// floor(rate * duration); 0 for invalid durations or rates, and for
    /// counts that do not fit in an int.
    int getSampleCount(int rate) const;

    /// True when the duration is finite, non-negative and its sample count
    /// at `rate` fits in an int.
    bool isRepresentable(int rate) const;

    /// Evenly spaced sample instants, right endpoint excluded.
    /// Negative, infinite or over-long durations fail with invalidDuration,
    /// zero yields no samples.
    std::vector<double> samples(int rate, ErrorCode& error) const;

    /// Same, at SampleClock::getRate().
    std::vector<double> samples(ErrorCode& error) const;

private:
    double duration_;
    double start_;
};

} // namespace addsynth
