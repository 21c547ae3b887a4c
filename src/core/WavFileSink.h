#pragma once

#include "core/AudioSink.h"

#include <string>

namespace addsynth {

/// Writes each played buffer to a WAV file, replacing any existing file.
class WavFileSink : public AudioSink {
public:
    explicit WavFileSink(const std::string& filePath, int bitsPerSample = 16);

    bool play(const juce::AudioBuffer<float>& buffer, int sampleRate,
              std::string& error) override;

    const std::string& getFilePath() const { return filePath_; }
    int getBitsPerSample() const { return bitsPerSample_; }

private:
    std::string filePath_;
    int bitsPerSample_;
};

} // namespace addsynth
