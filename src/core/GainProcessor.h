#pragma once

#include "core/Processor.h"

namespace addsynth {

/// Multiplies every sample by a linear gain.
class GainProcessor : public Processor {
public:
    explicit GainProcessor(float gain = 1.0f) : Processor("Gain"), gain_(gain) {}

    void process(juce::AudioBuffer<float>& buffer) override
    {
        buffer.applyGain(gain_);
    }

    float getGain() const { return gain_; }
    void setGain(float gain) { gain_ = gain; }

private:
    float gain_;
};

/// Scales the buffer down so its peak magnitude does not exceed `ceiling`.
/// Quieter buffers pass through untouched.
class PeakNormaliser : public Processor {
public:
    explicit PeakNormaliser(float ceiling = 1.0f) : Processor("PeakNormaliser"), ceiling_(ceiling) {}

    void process(juce::AudioBuffer<float>& buffer) override
    {
        if (buffer.getNumSamples() == 0)
            return;

        float peak = buffer.getMagnitude(0, buffer.getNumSamples());
        if (peak > ceiling_)
        {
            AS_DEBUG("PeakNormaliser: peak=%f, scaling to %f", peak, ceiling_);
            buffer.applyGain(ceiling_ / peak);
        }
    }

    float getCeiling() const { return ceiling_; }

private:
    float ceiling_;
};

} // namespace addsynth
