#include "core/Oscillator.h"
#include "core/Logger.h"
#include "core/SampleClock.h"

namespace addsynth {

Oscillator::Oscillator(const std::string& waveName,
                       std::shared_ptr<const WaveGenerator> generator)
    : waveName_(waveName), generator_(std::move(generator))
{
}

Oscillator::~Oscillator() = default;

std::shared_ptr<Oscillator> Oscillator::create(const WaveRegistry& registry,
                                               const std::string& waveName,
                                               ErrorCode& error)
{
    auto generator = registry.resolve(waveName, error);
    if (!generator)
    {
        AS_WARN("Oscillator::create: wave '%s' does not exist", waveName.c_str());
        return nullptr;
    }

    AS_DEBUG("Oscillator::create: wave=%s", waveName.c_str());
    return std::shared_ptr<Oscillator>(new Oscillator(waveName, std::move(generator)));
}

std::shared_ptr<Oscillator> Oscillator::create(const WaveRegistry& registry,
                                               Wave wave,
                                               ErrorCode& error)
{
    return create(registry, std::string(addsynth::waveName(wave)), error);
}

const std::string& Oscillator::getWaveName() const { return waveName_; }

juce::AudioBuffer<float> Oscillator::oscillate(const TimeSpan& span, int rate,
                                               double freq, double phase,
                                               ErrorCode& error) const
{
    auto t = span.samples(rate, error);
    if (error != ErrorCode::ok)
        return juce::AudioBuffer<float>(1, 0);

    auto wave = (*generator_)(t, freq, phase);
    if (wave.size() != t.size())
    {
        error = ErrorCode::invalidGenerator;
        AS_WARN("Oscillator::oscillate: wave '%s' returned %d samples, expected %d",
                waveName_.c_str(), (int)wave.size(), (int)t.size());
        return juce::AudioBuffer<float>(1, 0);
    }

    int n = static_cast<int>(wave.size());
    juce::AudioBuffer<float> out(1, n);
    float* dest = out.getWritePointer(0);
    for (int i = 0; i < n; ++i)
        dest[i] = static_cast<float>(wave[static_cast<size_t>(i)]);

    AS_TRACE("Oscillator::oscillate: wave=%s freq=%f phase=%f n=%d",
             waveName_.c_str(), freq, phase, n);
    return out;
}

juce::AudioBuffer<float> Oscillator::oscillate(const TimeSpan& span,
                                               double freq, double phase,
                                               ErrorCode& error) const
{
    return oscillate(span, SampleClock::getRate(), freq, phase, error);
}

std::string Oscillator::toString() const
{
    return "Oscillator(wave='" + waveName_ + "')";
}

} // namespace addsynth
