#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <string>

namespace addsynth {

/// Consumer of a finished buffer: a file writer, an output device, a test probe.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual bool play(const juce::AudioBuffer<float>& buffer, int sampleRate,
                      std::string& error) = 0;
};

} // namespace addsynth
