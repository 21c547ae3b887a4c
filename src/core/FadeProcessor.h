#pragma once

#include "core/Processor.h"

#include <algorithm>
#include <cmath>

namespace addsynth {

/// Linear fade-in at the start and fade-out at the end of the buffer.
/// Fade lengths are in seconds and are clamped to the buffer length.
class FadeProcessor : public Processor {
public:
    FadeProcessor(double fadeInSeconds, double fadeOutSeconds)
        : Processor("Fade"), fadeIn_(fadeInSeconds), fadeOut_(fadeOutSeconds) {}

    void prepare(double sampleRate) override { sampleRate_ = sampleRate; }

    void process(juce::AudioBuffer<float>& buffer) override
    {
        int n = buffer.getNumSamples();
        if (n == 0 || sampleRate_ <= 0.0)
            return;

        int in = std::min(n, (int)std::floor(std::max(0.0, fadeIn_) * sampleRate_));
        int out = std::min(n, (int)std::floor(std::max(0.0, fadeOut_) * sampleRate_));

        for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
        {
            if (in > 0)
                buffer.applyGainRamp(ch, 0, in, 0.0f, 1.0f);
            if (out > 0)
                buffer.applyGainRamp(ch, n - out, out, 1.0f, 0.0f);
        }
    }

private:
    double fadeIn_;
    double fadeOut_;
    double sampleRate_ = 0.0;
};

} // namespace addsynth
