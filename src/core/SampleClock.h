#pragma once

#include <atomic>

namespace addsynth {

/// Process-wide sampling rate shared by every buffer of a synthesis session.
///
/// The rate is meant to be fixed before the first buffer is generated.
/// setRate() after the rate has been read is permitted but unsafe: buffers
/// generated earlier keep their old timing and can no longer be mixed with
/// new ones. This is logged, not rejected.
class SampleClock {
public:
    static constexpr int kDefaultRate = 44100;

    static int getRate();

    /// Returns false (and leaves the rate unchanged) if rate <= 0.
    static bool setRate(int rate);

    /// Restore the default rate and forget prior reads.
    static void reset();

private:
    static std::atomic<int> rate_;
    static std::atomic<bool> read_;
};

} // namespace addsynth
