#include "core/SampleClock.h"
#include "core/Logger.h"

namespace addsynth {

std::atomic<int> SampleClock::rate_{SampleClock::kDefaultRate};
std::atomic<bool> SampleClock::read_{false};

int SampleClock::getRate()
{
    read_.store(true, std::memory_order_relaxed);
    return rate_.load(std::memory_order_relaxed);
}

bool SampleClock::setRate(int rate)
{
    if (rate <= 0)
    {
        AS_WARN("SampleClock::setRate: invalid rate %d", rate);
        return false;
    }

    int old = rate_.exchange(rate, std::memory_order_relaxed);
    if (old != rate && read_.load(std::memory_order_relaxed))
        AS_WARN("SampleClock::setRate: %d -> %d after first use, "
                "previously generated buffers keep the old timing", old, rate);
    else
        AS_INFO("SampleClock::setRate: %d", rate);
    return true;
}

void SampleClock::reset()
{
    rate_.store(kDefaultRate, std::memory_order_relaxed);
    read_.store(false, std::memory_order_relaxed);
    AS_DEBUG("SampleClock::reset: rate=%d", kDefaultRate);
}

} // namespace addsynth
