#include "core/Mixer.h"
#include "core/Logger.h"
#include "core/SampleClock.h"

namespace addsynth {

Mixer::Mixer()
    : Mixer(std::make_shared<NumericStepResolver>())
{
}

Mixer::Mixer(std::shared_ptr<const StepResolver> resolver)
    : resolver_(std::move(resolver))
{
    if (!resolver_)
    {
        AS_WARN("Mixer: null resolver, falling back to numeric steps");
        resolver_ = std::make_shared<NumericStepResolver>();
    }
    AS_DEBUG("Mixer created");
}

Mixer::~Mixer()
{
    AS_DEBUG("Mixer destroyed, tracks=%d", getTrackCount());
}

const Mixer::TrackEntry* Mixer::findEntry(const std::string& name) const
{
    for (const auto& e : tracks_)
    {
        if (e.name == name)
            return &e;
    }
    return nullptr;
}

Mixer::TrackEntry* Mixer::findEntry(const std::string& name)
{
    for (auto& e : tracks_)
    {
        if (e.name == name)
            return &e;
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════
// Tracks
// ═══════════════════════════════════════════════════════════════════

bool Mixer::addTrack(std::shared_ptr<Oscillator> oscillator, std::vector<Step> steps,
                     const std::string& name)
{
    if (findEntry(name))
    {
        AS_WARN("Mixer::addTrack: track '%s' already exists, not added", name.c_str());
        return false;
    }

    auto track = std::make_unique<Track>(std::move(oscillator), std::move(steps));
    AS_INFO("Mixer::addTrack: name=%s, steps=%d", name.c_str(), (int)track->getSteps().size());
    tracks_.push_back({name, std::move(track), 1.0f});
    return true;
}

Track* Mixer::getTrack(const std::string& name) const
{
    auto* e = findEntry(name);
    return e ? e->track.get() : nullptr;
}

std::vector<std::string> Mixer::getTrackNames() const
{
    std::vector<std::string> names;
    names.reserve(tracks_.size());
    for (const auto& e : tracks_)
        names.push_back(e.name);
    return names;
}

int Mixer::getTrackCount() const
{
    return (int)tracks_.size();
}

// ═══════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════

bool Mixer::setLevel(const std::string& name, float gain)
{
    auto* e = findEntry(name);
    if (!e)
    {
        AS_DEBUG("Mixer::setLevel: track '%s' not found", name.c_str());
        return false;
    }
    e->level = gain;
    AS_DEBUG("Mixer::setLevel: name=%s, level=%f", name.c_str(), gain);
    return true;
}

float Mixer::getLevel(const std::string& name) const
{
    auto* e = findEntry(name);
    return e ? e->level : 0.0f;
}

Chain& Mixer::getMasterChain() { return masterChain_; }

const StepResolver& Mixer::getResolver() const { return *resolver_; }

// ═══════════════════════════════════════════════════════════════════
// Compilation
// ═══════════════════════════════════════════════════════════════════

bool Mixer::compile(int rate, ErrorCode& error)
{
    if (rate <= 0)
    {
        error = ErrorCode::invalidSampleRate;
        AS_WARN("Mixer::compile: invalid rate %d", rate);
        return false;
    }

    std::vector<juce::AudioBuffer<float>> compiled;
    compiled.reserve(tracks_.size());
    int length = 0;

    for (auto& e : tracks_)
    {
        auto buffer = e.track->compile(*resolver_, rate, error);
        if (error != ErrorCode::ok)
        {
            AS_WARN("Mixer::compile: track '%s' failed: %s", e.name.c_str(), errorCodeName(error));
            return false;
        }
        length = juce::jmax(length, buffer.getNumSamples());
        compiled.push_back(std::move(buffer));
    }

    juce::AudioBuffer<float> mix(1, length);
    mix.clear();
    for (size_t i = 0; i < compiled.size(); ++i)
    {
        const auto& buffer = compiled[i];
        if (buffer.getNumSamples() > 0)
            mix.addFrom(0, 0, buffer, 0, 0, buffer.getNumSamples(), tracks_[i].level);
    }

    masterChain_.process(mix, static_cast<double>(rate));

    output_ = std::move(mix);
    outputSampleRate_ = rate;
    error = ErrorCode::ok;
    AS_INFO("Mixer::compile: tracks=%d, samples=%d, sr=%d", getTrackCount(), length, rate);
    return true;
}

bool Mixer::compile(ErrorCode& error)
{
    return compile(SampleClock::getRate(), error);
}

const juce::AudioBuffer<float>& Mixer::getOutput() const { return output_; }

int Mixer::getOutputSampleRate() const { return outputSampleRate_; }

// ═══════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════

bool Mixer::play(AudioSink& sink, std::string& error) const
{
    if (outputSampleRate_ <= 0)
    {
        error = "Nothing compiled yet";
        AS_WARN("Mixer::play: %s", error.c_str());
        return false;
    }
    return sink.play(output_, outputSampleRate_, error);
}

bool Mixer::compilePlay(AudioSink& sink, std::string& error)
{
    ErrorCode code = ErrorCode::ok;
    if (!compile(code))
    {
        error = std::string("Compile failed: ") + errorCodeName(code);
        return false;
    }
    return play(sink, error);
}

std::string Mixer::toString() const
{
    return "Mixer(tracks=" + std::to_string(tracks_.size()) + ")";
}

} // namespace addsynth
