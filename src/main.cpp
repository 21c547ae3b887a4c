#include "core/AudioDevice.h"
#include "core/FadeProcessor.h"
#include "core/GainProcessor.h"
#include "core/Logger.h"
#include "core/Mixer.h"
#include "core/SampleClock.h"
#include "core/WaveRegistry.h"
#include "core/WavFileSink.h"

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

using namespace addsynth;

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        fprintf(stderr, "usage: %s <out.wav> [--play] [--verbose]\n", argv[0]);
        return 2;
    }

    std::string outPath = argv[1];
    bool play = false;
    for (int i = 2; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--play") == 0)
            play = true;
        else if (std::strcmp(argv[i], "--verbose") == 0)
            Logger::setLevel(LogLevel::info);
    }

    juce::ScopedJuceInitialiser_GUI init;

    AS_INFO("addsynth demo - JUCE %d.%d.%d, %d Hz",
            JUCE_MAJOR_VERSION, JUCE_MINOR_VERSION, JUCE_BUILDNUMBER, SampleClock::getRate());

    WaveRegistry registry;
    ErrorCode error = ErrorCode::ok;
    auto lead = Oscillator::create(registry, Wave::triangle, error);
    auto bass = Oscillator::create(registry, Wave::sawtooth, error);
    if (!lead || !bass)
    {
        fprintf(stderr, "oscillator creation failed: %s\n", errorCodeName(error));
        return 1;
    }

    Mixer mixer(std::make_shared<NoteStepResolver>(110.0));
    mixer.addTrack(lead, {{"E4", "e"}, {"G4", "e"}, {"B4", "e"}, {"E5", "e"},
                          {"D5", "q"}, {"B4", "q"}, {"A4", "h"}}, "lead");
    mixer.addTrack(bass, {{"E2", "h"}, {"G2", "q"}, {"A2", "q"}, {"R", "q"}}, "bass");
    mixer.setLevel("bass", 0.4f);
    mixer.getTrack("lead")->getFilters().append(std::make_unique<FadeProcessor>(0.01, 0.2));
    mixer.getMasterChain().append(std::make_unique<PeakNormaliser>(0.9f));

    std::string err;
    WavFileSink file(outPath);
    if (!mixer.compilePlay(file, err))
    {
        fprintf(stderr, "render failed: %s\n", err.c_str());
        return 1;
    }
    printf("%s: %d samples at %d Hz -> %s\n", mixer.toString().c_str(),
           mixer.getOutput().getNumSamples(), mixer.getOutputSampleRate(), outPath.c_str());

    if (play)
    {
        AudioDevice device;
        if (!mixer.play(device, err))
        {
            fprintf(stderr, "playback failed: %s\n", err.c_str());
            return 1;
        }
        double seconds = mixer.getOutput().getNumSamples() / (double)mixer.getOutputSampleRate();
        device.waitUntilFinished(static_cast<int>(seconds * 1000.0) + 1000);
    }

    return 0;
}
