#pragma once

#include "core/Chain.h"
#include "core/Oscillator.h"
#include "core/StepResolver.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <vector>

namespace addsynth {

/// One oscillator playing an ordered sequence of steps, monophonically.
class Track {
public:
    Track(std::shared_ptr<Oscillator> oscillator, std::vector<Step> steps);
    ~Track();

    // Non-copyable, non-movable
    Track(const Track&) = delete;
    Track& operator=(const Track&) = delete;

    // --- Oscillator ---
    const std::shared_ptr<Oscillator>& getOscillator() const;

    // --- Steps ---
    const std::vector<Step>& getSteps() const;
    void addStep(const Step& step);
    void clearSteps();

    // --- Filters ---
    Chain& getFilters();
    const Chain& getFilters() const;

    // --- Compilation ---

    /// Resolves every step in order and concatenates one oscillation per
    /// step, each starting where the previous one ended (phase 0 at the
    /// track origin, so time and phase run on continuously). Filters run on
    /// the concatenated buffer. No steps yield an empty buffer.
    juce::AudioBuffer<float> compile(const StepResolver& resolver, int rate, ErrorCode& error);

    /// Same, at SampleClock::getRate().
    juce::AudioBuffer<float> compile(const StepResolver& resolver, ErrorCode& error);

private:
    std::shared_ptr<Oscillator> oscillator_;
    std::vector<Step> steps_;
    Chain filters_;
};

} // namespace addsynth
