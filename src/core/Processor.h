#pragma once

#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <string>

namespace addsynth {

/// A buffer -> buffer transform applied in place. Processors never change
/// the number of samples or channels of the buffer they are given.
class Processor {
public:
    explicit Processor(const std::string& name)
        : name_(name)
    {
        AS_DEBUG("Processor created: name=%s", name_.c_str());
    }

    virtual ~Processor() = default;

    // Non-copyable, non-movable
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    // --- Lifecycle ---
    virtual void prepare(double sampleRate) { (void)sampleRate; }
    virtual void reset() {}

    // --- Processing ---
    virtual void process(juce::AudioBuffer<float>& buffer) = 0;

    // --- Identity ---
    const std::string& getName() const { return name_; }

    // --- Bypass ---
    void setBypassed(bool b) { bypassed_ = b; }
    bool isBypassed() const { return bypassed_; }

private:
    std::string name_;
    bool bypassed_ = false;
};

} // namespace addsynth
