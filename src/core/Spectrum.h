#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <complex>
#include <vector>

namespace addsynth {

/// DFT of a sample buffer with the frequency label of every bin.
struct Spectrum {
    std::vector<double> frequencies;
    std::vector<std::complex<double>> bins;
};

/// Bin labels for an n-point DFT at `rate`: k * rate / n, with the upper
/// half of the bins wrapped to negative frequencies.
std::vector<double> fftFrequencies(int n, int rate);

/// Unnormalised DFT of any length, X[k] = sum x[j] e^(-2 pi i j k / n).
std::vector<std::complex<double>> dft(const std::vector<float>& samples);

/// Spectrum of channel 0 of `buffer`, labelled at SampleClock::getRate().
Spectrum fourierTransform(const juce::AudioBuffer<float>& buffer);
Spectrum fourierTransform(const juce::AudioBuffer<float>& buffer, int rate);

std::vector<double> magnitudes(const Spectrum& spectrum);

/// Frequency of the strongest bin with a non-negative label; 0 when empty.
double peakFrequency(const Spectrum& spectrum);

} // namespace addsynth
