#include "core/AudioDevice.h"
#include "core/Logger.h"

#include <chrono>
#include <cmath>
#include <limits>
#include <thread>

namespace addsynth {

AudioDevice::AudioDevice()
{
    AS_INFO("AudioDevice: created");
}

AudioDevice::~AudioDevice()
{
    stop();
    AS_INFO("AudioDevice: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Control thread
// ═══════════════════════════════════════════════════════════════════

bool AudioDevice::play(const juce::AudioBuffer<float>& buffer, int sampleRate,
                       std::string& error)
{
    AS_INFO("AudioDevice::play: len=%d sr=%d", buffer.getNumSamples(), sampleRate);

    if (sampleRate <= 0)
    {
        error = "Invalid sample rate: " + std::to_string(sampleRate);
        AS_WARN("AudioDevice::play: %s", error.c_str());
        return false;
    }

    if (open_)
    {
        AS_INFO("AudioDevice::play: already open, stopping first");
        stop();
    }

    // The callback is detached here, so the buffer can be replaced safely
    load(buffer, sampleRate);

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    setup.sampleRate = static_cast<double>(sampleRate);

    auto err = deviceManager_.initialise(0, 2, nullptr, true, {}, &setup);
    if (err.isNotEmpty())
    {
        error = err.toStdString();
        AS_WARN("AudioDevice::play: initialise failed: %s", error.c_str());
        return false;
    }
    if (deviceManager_.getCurrentAudioDevice() == nullptr)
    {
        error = "No audio output device available";
        AS_WARN("AudioDevice::play: %s", error.c_str());
        deviceManager_.closeAudioDevice();
        return false;
    }

    open_ = true;
    deviceManager_.addAudioCallback(this);
    return true;
}

void AudioDevice::stop()
{
    if (!open_)
        return;

    AS_INFO("AudioDevice::stop");
    deviceManager_.removeAudioCallback(this);
    deviceManager_.closeAudioDevice();
    open_ = false;
    playing_.store(false);
    sampleRate_ = 0.0;
}

bool AudioDevice::isPlaying() const
{
    return playing_.load();
}

bool AudioDevice::waitUntilFinished(int timeoutMs)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (playing_.load())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    stop();
    return true;
}

double AudioDevice::getSampleRate() const
{
    return open_ ? sampleRate_ : 0.0;
}

void AudioDevice::load(const juce::AudioBuffer<float>& buffer, int sampleRate)
{
    source_.makeCopyOf(buffer);
    sourceRate_ = sampleRate;
    buffer_.makeCopyOf(buffer);
    position_.store(0);
}

int AudioDevice::getPlaybackLength() const
{
    return buffer_.getNumSamples();
}

void AudioDevice::resampleTo(double deviceRate)
{
    double ratio = static_cast<double>(sourceRate_) / deviceRate;
    int numIn = source_.getNumSamples();
    double length = std::floor(static_cast<double>(numIn) * deviceRate
                               / static_cast<double>(sourceRate_));

    // The interpolator reads a few samples past the last one it consumes
    const int padding = 8;
    if (length > static_cast<double>(std::numeric_limits<int>::max())
        || numIn > std::numeric_limits<int>::max() - padding)
    {
        AS_WARN("AudioDevice: %d samples at %d Hz are too long to resample to %.0f Hz",
                numIn, sourceRate_, deviceRate);
        buffer_.setSize(1, 0);
        return;
    }

    juce::AudioBuffer<float> padded(1, numIn + padding);
    padded.clear();
    if (numIn > 0)
        padded.copyFrom(0, 0, source_, 0, 0, numIn);

    int numOut = static_cast<int>(length);
    buffer_.setSize(1, numOut);
    juce::LagrangeInterpolator interpolator;
    if (numOut > 0)
        interpolator.process(ratio, padded.getReadPointer(0), buffer_.getWritePointer(0), numOut);

    AS_INFO("AudioDevice: resampled %d samples at %d Hz to %d at %.0f Hz",
            numIn, sourceRate_, numOut, deviceRate);
}

// ═══════════════════════════════════════════════════════════════════
// JUCE AudioIODeviceCallback
// ═══════════════════════════════════════════════════════════════════

void AudioDevice::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/, int /*numInputChannels*/,
    float* const* outputChannelData, int numOutputChannels,
    int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    int pos = position_.load(std::memory_order_relaxed);
    int remaining = juce::jmax(0, buffer_.getNumSamples() - pos);
    int toCopy = juce::jmin(numSamples, remaining);

    for (int ch = 0; ch < numOutputChannels; ++ch)
    {
        float* out = outputChannelData[ch];
        if (out == nullptr)
            continue;

        // Mono source fans out to every output channel
        if (toCopy > 0)
            juce::FloatVectorOperations::copy(out, buffer_.getReadPointer(0, pos), toCopy);
        if (toCopy < numSamples)
            juce::FloatVectorOperations::clear(out + toCopy, numSamples - toCopy);
    }

    position_.store(pos + toCopy, std::memory_order_relaxed);
    if (toCopy < numSamples)
        playing_.store(false);
}

void AudioDevice::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    sampleRate_ = device->getCurrentSampleRate();
    AS_INFO("AudioDevice::audioDeviceAboutToStart: sr=%.0f bs=%d",
            sampleRate_, device->getCurrentBufferSizeSamples());

    if (sourceRate_ > 0 && sampleRate_ > 0.0 && sampleRate_ != static_cast<double>(sourceRate_))
    {
        AS_WARN("AudioDevice: device SR %.0f differs from buffer SR %d", sampleRate_, sourceRate_);
        resampleTo(sampleRate_);
    }
    else
    {
        buffer_.makeCopyOf(source_);
    }
    position_.store(0);
    playing_.store(buffer_.getNumSamples() > 0);
}

void AudioDevice::audioDeviceStopped()
{
    AS_INFO("AudioDevice::audioDeviceStopped");
    playing_.store(false);
}

} // namespace addsynth
