#pragma once

#include "core/AudioSink.h"

#include <juce_audio_devices/juce_audio_devices.h>

#include <atomic>
#include <string>

namespace addsynth {

/// Plays a finished buffer on the default output device.
/// Owns juce::AudioDeviceManager; play() copies the buffer, opens the device
/// at the buffer's rate and returns while playback runs on the audio thread.
/// If the device runs at another rate the buffer is resampled to it.
class AudioDevice : public AudioSink, public juce::AudioIODeviceCallback {
public:
    AudioDevice();
    ~AudioDevice() override;

    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    // --- Control thread ---
    bool play(const juce::AudioBuffer<float>& buffer, int sampleRate,
              std::string& error) override;
    void stop();
    bool isPlaying() const;

    /// Copies the buffer to play next without opening the device.
    void load(const juce::AudioBuffer<float>& buffer, int sampleRate);

    /// Samples that will be sent to the device, after any resampling.
    int getPlaybackLength() const;

    /// Blocks until the buffer has been played out or `timeoutMs` elapses.
    /// Returns false on timeout.
    bool waitUntilFinished(int timeoutMs);

    double getSampleRate() const;

    // --- JUCE AudioIODeviceCallback (audio thread) ---
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData, int numInputChannels,
        float* const* outputChannelData, int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    void resampleTo(double deviceRate);

    juce::AudioDeviceManager deviceManager_;
    juce::AudioBuffer<float> source_;
    int sourceRate_ = 0;
    juce::AudioBuffer<float> buffer_;
    std::atomic<int> position_{0};
    std::atomic<bool> playing_{false};
    bool open_ = false;
    double sampleRate_ = 0.0;
};

} // namespace addsynth
