#include "core/TimeSpan.h"
#include "core/Logger.h"
#include "core/SampleClock.h"

#include <cmath>
#include <limits>

namespace addsynth {

int TimeSpan::getSampleCount(int rate) const
{
    if (!isRepresentable(rate))
        return 0;
    return static_cast<int>(std::floor(static_cast<double>(rate) * duration_));
}

bool TimeSpan::isRepresentable(int rate) const
{
    if (rate <= 0 || !(duration_ >= 0.0) || !std::isfinite(duration_))
        return false;
    double count = std::floor(static_cast<double>(rate) * duration_);
    return count <= static_cast<double>(std::numeric_limits<int>::max());
}

std::vector<double> TimeSpan::samples(int rate, ErrorCode& error) const
{
    if (rate <= 0)
    {
        error = ErrorCode::invalidSampleRate;
        AS_WARN("TimeSpan::samples: invalid rate %d", rate);
        return {};
    }

    // NaN fails here as well
    if (!(duration_ >= 0.0))
    {
        error = ErrorCode::invalidDuration;
        AS_WARN("TimeSpan::samples: invalid duration %f", duration_);
        return {};
    }

    // Buffer lengths are int
    if (!isRepresentable(rate))
    {
        error = ErrorCode::invalidDuration;
        AS_WARN("TimeSpan::samples: duration %f at rate %d exceeds the maximum buffer length",
                duration_, rate);
        return {};
    }

    error = ErrorCode::ok;
    int count = getSampleCount(rate);
    std::vector<double> t(static_cast<size_t>(count));
    if (count == 0)
        return t;

    double step = duration_ / static_cast<double>(count);
    for (int i = 0; i < count; ++i)
        t[static_cast<size_t>(i)] = static_cast<double>(i) * step + start_;

    AS_TRACE("TimeSpan::samples: start=%f dur=%f rate=%d count=%d",
             start_, duration_, rate, count);
    return t;
}

std::vector<double> TimeSpan::samples(ErrorCode& error) const
{
    return samples(SampleClock::getRate(), error);
}

} // namespace addsynth
