#include "core/Track.h"
#include "core/Logger.h"
#include "core/SampleClock.h"

#include <limits>

namespace addsynth {

Track::Track(std::shared_ptr<Oscillator> oscillator, std::vector<Step> steps)
    : oscillator_(std::move(oscillator)), steps_(std::move(steps))
{
    AS_DEBUG("Track created: wave=%s, steps=%d",
             oscillator_ ? oscillator_->getWaveName().c_str() : "(none)", (int)steps_.size());
}

Track::~Track()
{
    AS_DEBUG("Track destroyed");
}

const std::shared_ptr<Oscillator>& Track::getOscillator() const { return oscillator_; }

const std::vector<Step>& Track::getSteps() const { return steps_; }

void Track::addStep(const Step& step)
{
    steps_.push_back(step);
}

void Track::clearSteps()
{
    steps_.clear();
}

Chain& Track::getFilters() { return filters_; }
const Chain& Track::getFilters() const { return filters_; }

juce::AudioBuffer<float> Track::compile(const StepResolver& resolver, int rate, ErrorCode& error)
{
    error = ErrorCode::ok;
    if (steps_.empty())
        return juce::AudioBuffer<float>(1, 0);

    if (!oscillator_)
    {
        error = ErrorCode::unknownWaveName;
        AS_WARN("Track::compile: track has no oscillator");
        return juce::AudioBuffer<float>(1, 0);
    }

    // Resolve and size every step before oscillating anything
    struct Resolved { double frequency; double duration; };
    std::vector<Resolved> resolved;
    resolved.reserve(steps_.size());
    juce::int64 total = 0;

    for (size_t i = 0; i < steps_.size(); ++i)
    {
        const auto& step = steps_[i];
        double freq = 0.0, duration = 0.0;
        std::string why;
        if (!resolver.resolve(step, freq, duration, why))
        {
            error = ErrorCode::unresolvedStep;
            AS_WARN("Track::compile: step %d ('%s', '%s'): %s",
                    (int)i, step.pitch.c_str(), step.duration.c_str(), why.c_str());
            return juce::AudioBuffer<float>(1, 0);
        }

        TimeSpan span(duration);
        if (rate > 0 && !span.isRepresentable(rate))
        {
            error = ErrorCode::invalidDuration;
            AS_WARN("Track::compile: step %d has invalid duration %f", (int)i, duration);
            return juce::AudioBuffer<float>(1, 0);
        }

        total += span.getSampleCount(rate);
        if (total > std::numeric_limits<int>::max())
        {
            error = ErrorCode::invalidDuration;
            AS_WARN("Track::compile: steps up to %d exceed the maximum buffer length", (int)i);
            return juce::AudioBuffer<float>(1, 0);
        }
        resolved.push_back({freq, duration});
    }

    std::vector<juce::AudioBuffer<float>> parts;
    parts.reserve(resolved.size());
    double start = 0.0;

    for (size_t i = 0; i < resolved.size(); ++i)
    {
        auto part = oscillator_->oscillate(TimeSpan(resolved[i].duration, start), rate,
                                           resolved[i].frequency, 0.0, error);
        if (error != ErrorCode::ok)
        {
            AS_WARN("Track::compile: step %d failed: %s", (int)i, errorCodeName(error));
            return juce::AudioBuffer<float>(1, 0);
        }

        start += resolved[i].duration;
        parts.push_back(std::move(part));
    }

    juce::AudioBuffer<float> out(1, static_cast<int>(total));
    int pos = 0;
    for (const auto& part : parts)
    {
        if (part.getNumSamples() > 0)
            out.copyFrom(0, pos, part, 0, 0, part.getNumSamples());
        pos += part.getNumSamples();
    }

    filters_.process(out, static_cast<double>(rate));

    AS_DEBUG("Track::compile: wave=%s, steps=%d, samples=%d",
             oscillator_->getWaveName().c_str(), (int)steps_.size(), out.getNumSamples());
    return out;
}

juce::AudioBuffer<float> Track::compile(const StepResolver& resolver, ErrorCode& error)
{
    return compile(resolver, SampleClock::getRate(), error);
}

} // namespace addsynth
