#include "core/WavFileSink.h"
#include "core/Logger.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <memory>

namespace addsynth {

WavFileSink::WavFileSink(const std::string& filePath, int bitsPerSample)
    : filePath_(filePath), bitsPerSample_(bitsPerSample)
{
}

bool WavFileSink::play(const juce::AudioBuffer<float>& buffer, int sampleRate,
                       std::string& error)
{
    if (sampleRate <= 0)
    {
        error = "Invalid sample rate: " + std::to_string(sampleRate);
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }

    juce::WavAudioFormat wav;
    if (!wav.getPossibleBitDepths().contains(bitsPerSample_))
    {
        error = "Unsupported bit depth: " + std::to_string(bitsPerSample_);
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }

    juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(filePath_);
    if (file.existsAsFile() && !file.deleteFile())
    {
        error = "Cannot replace file: " + filePath_;
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }

    std::unique_ptr<juce::FileOutputStream> stream(file.createOutputStream());
    if (!stream || stream->failedToOpen())
    {
        error = "Cannot open file for writing: " + filePath_;
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }

    int numChannels = juce::jmax(1, buffer.getNumChannels());
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wav.createWriterFor(stream.get(), static_cast<double>(sampleRate),
                            static_cast<unsigned int>(numChannels), bitsPerSample_, {}, 0));
    if (!writer)
    {
        error = "Failed to create WAV writer for: " + filePath_;
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }
    stream.release(); // now owned by the writer

    int numSamples = buffer.getNumSamples();
    if (numSamples > 0 && !writer->writeFromAudioSampleBuffer(buffer, 0, numSamples))
    {
        error = "Failed to write audio data to: " + filePath_;
        AS_WARN("WavFileSink::play: %s", error.c_str());
        return false;
    }

    AS_INFO("WavFileSink::play: path=%s, ch=%d, len=%d, sr=%d, bits=%d",
            filePath_.c_str(), numChannels, numSamples, sampleRate, bitsPerSample_);
    return true;
}

} // namespace addsynth
