#pragma once

#include "core/TimeSpan.h"
#include "core/Types.h"
#include "core/WaveRegistry.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <string>

namespace addsynth {

/// A wave kind bound to its generator. The generator is resolved once, at
/// creation; later registry changes do not affect existing oscillators.
class Oscillator {
public:
    /// Returns nullptr with unknownWaveName if the wave is not registered.
    static std::shared_ptr<Oscillator> create(const WaveRegistry& registry,
                                              const std::string& waveName,
                                              ErrorCode& error);
    static std::shared_ptr<Oscillator> create(const WaveRegistry& registry,
                                              Wave wave,
                                              ErrorCode& error);

    ~Oscillator();

    Oscillator(const Oscillator&) = delete;
    Oscillator& operator=(const Oscillator&) = delete;

    const std::string& getWaveName() const;

    /// Mono buffer of span.getSampleCount(rate) samples. On error the
    /// returned buffer is empty and `error` is set.
    juce::AudioBuffer<float> oscillate(const TimeSpan& span, int rate,
                                       double freq, double phase,
                                       ErrorCode& error) const;

    /// Same, at SampleClock::getRate().
    juce::AudioBuffer<float> oscillate(const TimeSpan& span,
                                       double freq, double phase,
                                       ErrorCode& error) const;

    std::string toString() const;

private:
    Oscillator(const std::string& waveName, std::shared_ptr<const WaveGenerator> generator);

    std::string waveName_;
    std::shared_ptr<const WaveGenerator> generator_;
};

} // namespace addsynth
