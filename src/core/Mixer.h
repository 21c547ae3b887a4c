#pragma once

#include "core/AudioSink.h"
#include "core/Chain.h"
#include "core/Oscillator.h"
#include "core/StepResolver.h"
#include "core/Track.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <string>
#include <vector>

namespace addsynth {

/// Named tracks with per-track levels, summed into one output buffer.
class Mixer {
public:
    /// Steps are resolved with a NumericStepResolver.
    Mixer();
    explicit Mixer(std::shared_ptr<const StepResolver> resolver);
    ~Mixer();

    // Non-copyable, non-movable
    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    // --- Tracks ---

    /// Adds a track at level 1.0. An existing name is left untouched (track
    /// and level) and false is returned.
    bool addTrack(std::shared_ptr<Oscillator> oscillator, std::vector<Step> steps,
                  const std::string& name);
    Track* getTrack(const std::string& name) const;
    std::vector<std::string> getTrackNames() const;
    int getTrackCount() const;

    // --- Levels ---
    bool setLevel(const std::string& name, float gain);

    /// 0 for unknown names.
    float getLevel(const std::string& name) const;

    // --- Master chain (runs on the summed output) ---
    Chain& getMasterChain();

    // --- Resolver ---
    const StepResolver& getResolver() const;

    // --- Compilation ---

    /// Compiles every track at SampleClock::getRate(), scales it by its
    /// level and sums in insertion order into a buffer as long as the
    /// longest track. Shorter tracks contribute silence after their end.
    /// On failure the previous output is kept and `error` is set.
    bool compile(ErrorCode& error);
    bool compile(int rate, ErrorCode& error);

    const juce::AudioBuffer<float>& getOutput() const;
    int getOutputSampleRate() const;

    // --- Output ---

    /// Hands the output of the last compile to `sink`.
    bool play(AudioSink& sink, std::string& error) const;

    /// compile() then play(); nothing is played if compile fails.
    bool compilePlay(AudioSink& sink, std::string& error);

    std::string toString() const;

private:
    struct TrackEntry {
        std::string name;
        std::unique_ptr<Track> track;
        float level;
    };

    TrackEntry* findEntry(const std::string& name);
    const TrackEntry* findEntry(const std::string& name) const;

    std::shared_ptr<const StepResolver> resolver_;
    std::vector<TrackEntry> tracks_;
    Chain masterChain_;
    juce::AudioBuffer<float> output_{1, 0};
    int outputSampleRate_ = 0;
};

} // namespace addsynth
