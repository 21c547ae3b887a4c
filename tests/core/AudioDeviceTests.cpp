#include <catch2/catch_test_macros.hpp>

#include "core/AudioDevice.h"

#include <cmath>
#include <string>
#include <vector>

using namespace addsynth;

static juce::AudioBuffer<float> silence(int numSamples)
{
    juce::AudioBuffer<float> buffer(1, numSamples);
    buffer.clear();
    return buffer;
}

static juce::AudioBuffer<float> constant(int numSamples, float value)
{
    juce::AudioBuffer<float> buffer(1, numSamples);
    for (int i = 0; i < numSamples; ++i)
        buffer.setSample(0, i, value);
    return buffer;
}

// --- Local test helper: FixedRateDevice ---
// An output device that only reports a fixed sample rate.

class FixedRateDevice : public juce::AudioIODevice {
public:
    explicit FixedRateDevice(double sampleRate)
        : juce::AudioIODevice("Fixed", "Test"), sampleRate_(sampleRate) {}

    juce::StringArray getOutputChannelNames() override { return {"Left", "Right"}; }
    juce::StringArray getInputChannelNames() override { return {}; }
    juce::Array<double> getAvailableSampleRates() override { return {sampleRate_}; }
    juce::Array<int> getAvailableBufferSizes() override { return {512}; }
    int getDefaultBufferSize() override { return 512; }

    juce::String open(const juce::BigInteger&, const juce::BigInteger&, double, int) override
    {
        return {};
    }
    void close() override {}
    bool isOpen() override { return true; }
    void start(juce::AudioIODeviceCallback*) override {}
    void stop() override {}
    bool isPlaying() override { return false; }
    juce::String getLastError() override { return {}; }

    int getCurrentBufferSizeSamples() override { return 512; }
    double getCurrentSampleRate() override { return sampleRate_; }
    int getCurrentBitDepth() override { return 32; }
    juce::BigInteger getActiveOutputChannels() const override { return juce::BigInteger(3); }
    juce::BigInteger getActiveInputChannels() const override { return {}; }
    int getOutputLatencyInSamples() override { return 0; }
    int getInputLatencyInSamples() override { return 0; }

private:
    double sampleRate_;
};

// Pulls one block of numSamples from the device callback into two channels
static std::vector<float> pull(AudioDevice& device, int numSamples)
{
    std::vector<float> left(static_cast<size_t>(numSamples), -1.0f);
    std::vector<float> right(static_cast<size_t>(numSamples), -1.0f);
    float* outputs[] = {left.data(), right.data()};
    juce::AudioIODeviceCallbackContext context{};
    device.audioDeviceIOCallbackWithContext(nullptr, 0, outputs, 2, numSamples, context);
    return left;
}

// ═══════════════════════════════════════════════════════════════════
// Initial state
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("AudioDevice is idle before play")
{
    AudioDevice device;
    CHECK_FALSE(device.isPlaying());
    CHECK(device.getSampleRate() == 0.0);

    device.stop(); // must not crash
    CHECK(device.waitUntilFinished(0));
}

TEST_CASE("AudioDevice rejects an invalid sample rate")
{
    AudioDevice device;
    std::string error;
    CHECK_FALSE(device.play(silence(16), 0, error));
    CHECK(error == "Invalid sample rate: 0");
    CHECK_FALSE(device.isPlaying());
}

// ═══════════════════════════════════════════════════════════════════
// Playback, headless (no device) or real device
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("AudioDevice plays a short buffer to the end")
{
    AudioDevice device;
    std::string error;
    bool ok = device.play(silence(441), 44100, error);

    if (ok)
    {
        CHECK(device.getSampleRate() > 0.0);
        CHECK(device.waitUntilFinished(2000));
        CHECK_FALSE(device.isPlaying());
        CHECK(device.getSampleRate() == 0.0);
    }
    else
    {
        CHECK_FALSE(error.empty());
        CHECK_FALSE(device.isPlaying());
        CHECK(device.getSampleRate() == 0.0);
        WARN("No audio device available, skipping real device assertions");
    }
}

TEST_CASE("AudioDevice stop interrupts playback")
{
    AudioDevice device;
    std::string error;
    if (!device.play(silence(44100 * 5), 44100, error))
    {
        WARN("No audio device available, skipping real device assertions");
        return;
    }

    device.stop();
    CHECK_FALSE(device.isPlaying());
    CHECK(device.getSampleRate() == 0.0);
}

// ═══════════════════════════════════════════════════════════════════
// Device sample rate
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("AudioDevice plays the buffer as is at a matching device rate")
{
    AudioDevice device;
    device.load(constant(441, 0.5f), 44100);
    CHECK(device.getPlaybackLength() == 441);

    FixedRateDevice stub(44100.0);
    device.audioDeviceAboutToStart(&stub);
    CHECK(device.isPlaying());
    CHECK(device.getPlaybackLength() == 441);

    auto out = pull(device, 441);
    CHECK(out[0] == 0.5f);
    CHECK(out[440] == 0.5f);
    CHECK(device.isPlaying());

    pull(device, 1);
    CHECK_FALSE(device.isPlaying());
}

TEST_CASE("AudioDevice resamples to a device running at another rate")
{
    AudioDevice device;
    device.load(constant(441, 0.5f), 44100);

    FixedRateDevice stub(48000.0);
    device.audioDeviceAboutToStart(&stub);

    // 10 ms at either rate
    REQUIRE(device.getPlaybackLength() == 480);
    CHECK(device.isPlaying());

    auto out = pull(device, 512);
    CHECK(std::abs(out[240] - 0.5f) < 1e-3f);
    CHECK(out[480] == 0.0f);
    CHECK(out[511] == 0.0f);
    CHECK_FALSE(device.isPlaying());
}

TEST_CASE("AudioDevice resamples again when the device restarts at a new rate")
{
    AudioDevice device;
    device.load(constant(4410, 0.25f), 44100);

    FixedRateDevice fast(96000.0);
    device.audioDeviceAboutToStart(&fast);
    CHECK(device.getPlaybackLength() == 9600);

    FixedRateDevice native(44100.0);
    device.audioDeviceAboutToStart(&native);
    CHECK(device.getPlaybackLength() == 4410);

    FixedRateDevice slow(22050.0);
    device.audioDeviceAboutToStart(&slow);
    CHECK(device.getPlaybackLength() == 2205);
}

TEST_CASE("AudioDevice with an empty buffer does not start playing")
{
    AudioDevice device;
    device.load(silence(0), 44100);

    FixedRateDevice stub(48000.0);
    device.audioDeviceAboutToStart(&stub);
    CHECK(device.getPlaybackLength() == 0);
    CHECK_FALSE(device.isPlaying());
}
