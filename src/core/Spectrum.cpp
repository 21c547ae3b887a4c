#include "core/Spectrum.h"
#include "core/Logger.h"
#include "core/SampleClock.h"

#include <juce_dsp/juce_dsp.h>

#include <cmath>
#include <cstdint>

namespace addsynth {

namespace {

using FftComplex = juce::dsp::Complex<float>;

constexpr double kPi = 3.14159265358979323846;

int orderFor(int size)
{
    int order = 0;
    while ((1 << order) < size)
        ++order;
    return order;
}

bool isPowerOfTwo(int n)
{
    return n > 0 && (n & (n - 1)) == 0;
}

std::vector<std::complex<double>> powerOfTwoDft(const std::vector<float>& x)
{
    int n = (int)x.size();
    juce::dsp::FFT fft(orderFor(n));

    std::vector<FftComplex> in(static_cast<size_t>(n)), out(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i)
        in[static_cast<size_t>(i)] = FftComplex(x[static_cast<size_t>(i)], 0.0f);

    fft.perform(in.data(), out.data(), false);

    std::vector<std::complex<double>> result(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i)
        result[static_cast<size_t>(i)] = std::complex<double>(out[static_cast<size_t>(i)].real(),
                                                              out[static_cast<size_t>(i)].imag());
    return result;
}

// Bluestein: an n-point DFT as a circular convolution of length m >= 2n - 1,
// evaluated with power-of-two FFTs. JUCE's inverse transform is scaled by 1/m.
std::vector<std::complex<double>> bluesteinDft(const std::vector<float>& x)
{
    int n = (int)x.size();
    int order = orderFor(2 * n - 1);
    int m = 1 << order;
    juce::dsp::FFT fft(order);

    // chirp[k] = exp(-i pi k^2 / n); k^2 is reduced mod 2n to keep the angle exact
    std::vector<std::complex<double>> chirp(static_cast<size_t>(n));
    for (int k = 0; k < n; ++k)
    {
        auto k2 = (static_cast<int64_t>(k) * k) % (2 * static_cast<int64_t>(n));
        double angle = kPi * static_cast<double>(k2) / static_cast<double>(n);
        chirp[static_cast<size_t>(k)] = std::polar(1.0, -angle);
    }

    std::vector<FftComplex> a(static_cast<size_t>(m)), b(static_cast<size_t>(m));
    std::vector<FftComplex> fa(static_cast<size_t>(m)), fb(static_cast<size_t>(m));

    for (int k = 0; k < n; ++k)
    {
        auto w = chirp[static_cast<size_t>(k)] * static_cast<double>(x[static_cast<size_t>(k)]);
        a[static_cast<size_t>(k)] = FftComplex((float)w.real(), (float)w.imag());
    }

    auto c0 = std::conj(chirp[0]);
    b[0] = FftComplex((float)c0.real(), (float)c0.imag());
    for (int k = 1; k < n; ++k)
    {
        auto c = std::conj(chirp[static_cast<size_t>(k)]);
        FftComplex v((float)c.real(), (float)c.imag());
        b[static_cast<size_t>(k)] = v;
        b[static_cast<size_t>(m - k)] = v;
    }

    fft.perform(a.data(), fa.data(), false);
    fft.perform(b.data(), fb.data(), false);
    for (int i = 0; i < m; ++i)
        fa[static_cast<size_t>(i)] *= fb[static_cast<size_t>(i)];
    fft.perform(fa.data(), a.data(), true);

    std::vector<std::complex<double>> result(static_cast<size_t>(n));
    for (int k = 0; k < n; ++k)
    {
        std::complex<double> conv(a[static_cast<size_t>(k)].real(), a[static_cast<size_t>(k)].imag());
        result[static_cast<size_t>(k)] = chirp[static_cast<size_t>(k)] * conv;
    }
    return result;
}

std::vector<float> channelSamples(const juce::AudioBuffer<float>& buffer)
{
    if (buffer.getNumChannels() < 1 || buffer.getNumSamples() < 1)
        return {};
    const float* src = buffer.getReadPointer(0);
    return std::vector<float>(src, src + buffer.getNumSamples());
}

} // namespace

std::vector<double> fftFrequencies(int n, int rate)
{
    std::vector<double> freqs;
    if (n <= 0 || rate <= 0)
        return freqs;

    freqs.resize(static_cast<size_t>(n));
    double scale = static_cast<double>(rate) / static_cast<double>(n);
    int positive = (n - 1) / 2 + 1;
    for (int k = 0; k < positive; ++k)
        freqs[static_cast<size_t>(k)] = k * scale;
    for (int k = positive; k < n; ++k)
        freqs[static_cast<size_t>(k)] = (k - n) * scale;
    return freqs;
}

std::vector<std::complex<double>> dft(const std::vector<float>& samples)
{
    int n = (int)samples.size();
    if (n == 0)
        return {};
    if (n == 1)
        return {std::complex<double>(samples[0], 0.0)};

    AS_DEBUG("dft: n=%d (%s)", n, isPowerOfTwo(n) ? "radix-2" : "bluestein");
    return isPowerOfTwo(n) ? powerOfTwoDft(samples) : bluesteinDft(samples);
}

Spectrum fourierTransform(const juce::AudioBuffer<float>& buffer, int rate)
{
    Spectrum spectrum;
    spectrum.bins = dft(channelSamples(buffer));
    spectrum.frequencies = fftFrequencies((int)spectrum.bins.size(), rate);
    return spectrum;
}

Spectrum fourierTransform(const juce::AudioBuffer<float>& buffer)
{
    return fourierTransform(buffer, SampleClock::getRate());
}

std::vector<double> magnitudes(const Spectrum& spectrum)
{
    std::vector<double> mags;
    mags.reserve(spectrum.bins.size());
    for (const auto& bin : spectrum.bins)
        mags.push_back(std::abs(bin));
    return mags;
}

double peakFrequency(const Spectrum& spectrum)
{
    double best = -1.0;
    double freq = 0.0;
    for (size_t k = 0; k < spectrum.bins.size() && k < spectrum.frequencies.size(); ++k)
    {
        if (spectrum.frequencies[k] < 0.0)
            continue;
        double mag = std::abs(spectrum.bins[k]);
        if (mag > best)
        {
            best = mag;
            freq = spectrum.frequencies[k];
        }
    }
    return freq;
}

} // namespace addsynth
