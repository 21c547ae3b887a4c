#include "ffi/addsynth_ffi.h"
#include "core/Logger.h"
#include "core/Mixer.h"
#include "core/Oscillator.h"
#include "core/SampleClock.h"
#include "core/Spectrum.h"
#include "core/StepResolver.h"
#include "core/WaveRegistry.h"
#include "core/WavFileSink.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

// --- Handles ---

struct OscillatorHandle {
    std::shared_ptr<addsynth::Oscillator> oscillator;
};

static addsynth::WaveRegistry* registryOf(AsRegistry r)
{
    return static_cast<addsynth::WaveRegistry*>(r);
}

static OscillatorHandle* oscillatorOf(AsOscillator o)
{
    return static_cast<OscillatorHandle*>(o);
}

static addsynth::Mixer* mixerOf(AsMixer m)
{
    return static_cast<addsynth::Mixer*>(m);
}

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

static AsStringList to_string_list(const std::vector<std::string>& items)
{
    AsStringList list{nullptr, 0};
    if (items.empty())
        return list;

    list.items = static_cast<char**>(malloc(sizeof(char*) * items.size()));
    list.count = static_cast<int>(items.size());
    for (size_t i = 0; i < items.size(); i++)
        list.items[i] = to_c_string(items[i]);
    return list;
}

static AsSampleBuffer to_sample_buffer(const juce::AudioBuffer<float>& buffer, int sampleRate)
{
    AsSampleBuffer out{nullptr, 0, sampleRate};
    int n = buffer.getNumSamples();
    if (n <= 0 || buffer.getNumChannels() < 1)
        return out;

    out.samples = static_cast<float*>(malloc(sizeof(float) * static_cast<size_t>(n)));
    std::memcpy(out.samples, buffer.getReadPointer(0), sizeof(float) * static_cast<size_t>(n));
    out.length = n;
    return out;
}

// --- Logger API ---

void as_set_log_level(int level)
{
    addsynth::Logger::setLevel(static_cast<addsynth::LogLevel>(level));
}

void as_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    addsynth::Logger::setCallback(callback, user_data);
}

// --- String / List / Buffer free ---

void as_free_string(char* s)
{
    free(s);
}

void as_free_string_list(AsStringList list)
{
    for (int i = 0; i < list.count; i++)
        free(list.items[i]);
    free(list.items);
}

void as_free_sample_buffer(AsSampleBuffer buffer)
{
    free(buffer.samples);
}

void as_free_spectrum(AsSpectrum spectrum)
{
    free(spectrum.frequencies);
    free(spectrum.real);
    free(spectrum.imag);
}

// ═══════════════════════════════════════════════════════════════════
// Sampling rate
// ═══════════════════════════════════════════════════════════════════

int as_sample_rate(void)
{
    return addsynth::SampleClock::getRate();
}

bool as_set_sample_rate(int rate)
{
    return addsynth::SampleClock::setRate(rate);
}

// ═══════════════════════════════════════════════════════════════════
// Wave registry
// ═══════════════════════════════════════════════════════════════════

AsRegistry as_registry_create(void)
{
    return static_cast<AsRegistry>(new addsynth::WaveRegistry());
}

void as_registry_destroy(AsRegistry registry)
{
    if (!registry) return;
    delete registryOf(registry);
}

bool as_registry_add(AsRegistry registry, const char* name, AsWaveFn fn,
                     void* user_data, char** error)
{
    if (!registry || !name)
    {
        set_error(error, "Invalid registry or name");
        return false;
    }

    addsynth::WaveGenerator generator;
    if (fn)
    {
        generator = [fn, user_data](const std::vector<double>& t, double freq, double phase) {
            std::vector<double> out(t.size());
            fn(t.data(), out.data(), static_cast<int>(t.size()), freq, phase, user_data);
            return out;
        };
    }

    auto code = registryOf(registry)->add(name, std::move(generator));
    if (code != addsynth::ErrorCode::ok)
    {
        set_error(error, std::string(addsynth::errorCodeName(code)) + ": " + name);
        return false;
    }
    return true;
}

bool as_registry_remove(AsRegistry registry, const char* name, char** error)
{
    if (!registry || !name)
    {
        set_error(error, "Invalid registry or name");
        return false;
    }

    auto code = registryOf(registry)->remove(name);
    if (code != addsynth::ErrorCode::ok)
    {
        set_error(error, std::string(addsynth::errorCodeName(code)) + ": " + name);
        return false;
    }
    return true;
}

AsStringList as_registry_names(AsRegistry registry)
{
    if (!registry) return {nullptr, 0};
    return to_string_list(registryOf(registry)->getNames());
}

// ═══════════════════════════════════════════════════════════════════
// Oscillators
// ═══════════════════════════════════════════════════════════════════

AsOscillator as_oscillator_create(AsRegistry registry, const char* wave, char** error)
{
    if (!registry || !wave)
    {
        set_error(error, "Invalid registry or wave name");
        return nullptr;
    }

    addsynth::ErrorCode code = addsynth::ErrorCode::ok;
    auto osc = addsynth::Oscillator::create(*registryOf(registry), wave, code);
    if (!osc)
    {
        set_error(error, std::string(addsynth::errorCodeName(code)) + ": " + wave);
        return nullptr;
    }
    return static_cast<AsOscillator>(new OscillatorHandle{std::move(osc)});
}

void as_oscillator_destroy(AsOscillator oscillator)
{
    if (!oscillator) return;
    delete oscillatorOf(oscillator);
}

AsSampleBuffer as_oscillate(AsOscillator oscillator, double duration, double start,
                            double freq, double phase, char** error)
{
    int rate = addsynth::SampleClock::getRate();
    if (!oscillator)
    {
        set_error(error, "Invalid oscillator");
        return {nullptr, 0, rate};
    }

    addsynth::ErrorCode code = addsynth::ErrorCode::ok;
    auto buffer = oscillatorOf(oscillator)->oscillator->oscillate(
        addsynth::TimeSpan(duration, start), rate, freq, phase, code);
    if (code != addsynth::ErrorCode::ok)
    {
        set_error(error, addsynth::errorCodeName(code));
        return {nullptr, 0, rate};
    }
    return to_sample_buffer(buffer, rate);
}

// ═══════════════════════════════════════════════════════════════════
// Mixer
// ═══════════════════════════════════════════════════════════════════

AsMixer as_mixer_create(bool steps_as_notes, double bpm)
{
    std::shared_ptr<const addsynth::StepResolver> resolver;
    if (steps_as_notes)
        resolver = std::make_shared<addsynth::NoteStepResolver>(bpm);
    else
        resolver = std::make_shared<addsynth::NumericStepResolver>();
    return static_cast<AsMixer>(new addsynth::Mixer(std::move(resolver)));
}

void as_mixer_destroy(AsMixer mixer)
{
    if (!mixer) return;
    delete mixerOf(mixer);
}

bool as_mixer_add_track(AsMixer mixer, AsOscillator oscillator,
                        const char* const* pitches, const char* const* durations,
                        int count, const char* name)
{
    if (!mixer || !oscillator || !name || count < 0)
        return false;
    if (count > 0 && (!pitches || !durations))
        return false;

    std::vector<addsynth::Step> steps;
    steps.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; i++)
    {
        steps.push_back({pitches[i] ? pitches[i] : "",
                         durations[i] ? durations[i] : ""});
    }
    return mixerOf(mixer)->addTrack(oscillatorOf(oscillator)->oscillator,
                                    std::move(steps), name);
}

int as_mixer_track_count(AsMixer mixer)
{
    if (!mixer) return 0;
    return mixerOf(mixer)->getTrackCount();
}

AsStringList as_mixer_track_names(AsMixer mixer)
{
    if (!mixer) return {nullptr, 0};
    return to_string_list(mixerOf(mixer)->getTrackNames());
}

bool as_mixer_set_level(AsMixer mixer, const char* name, float level)
{
    if (!mixer || !name) return false;
    return mixerOf(mixer)->setLevel(name, level);
}

float as_mixer_get_level(AsMixer mixer, const char* name)
{
    if (!mixer || !name) return 0.0f;
    return mixerOf(mixer)->getLevel(name);
}

bool as_mixer_compile(AsMixer mixer, char** error)
{
    if (!mixer)
    {
        set_error(error, "Invalid mixer");
        return false;
    }

    addsynth::ErrorCode code = addsynth::ErrorCode::ok;
    if (!mixerOf(mixer)->compile(code))
    {
        set_error(error, addsynth::errorCodeName(code));
        return false;
    }
    return true;
}

AsSampleBuffer as_mixer_output(AsMixer mixer)
{
    if (!mixer) return {nullptr, 0, 0};
    auto* m = mixerOf(mixer);
    return to_sample_buffer(m->getOutput(), m->getOutputSampleRate());
}

bool as_mixer_compile_export(AsMixer mixer, const char* path, int bits_per_sample,
                             char** error)
{
    if (!mixer || !path)
    {
        set_error(error, "Invalid mixer or path");
        return false;
    }

    addsynth::WavFileSink sink(path, bits_per_sample);
    std::string err;
    if (!mixerOf(mixer)->compilePlay(sink, err))
    {
        set_error(error, err);
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Spectral analysis
// ═══════════════════════════════════════════════════════════════════

AsSpectrum as_fourier_transform(const float* samples, int length)
{
    AsSpectrum out{nullptr, nullptr, nullptr, 0};
    if (!samples || length <= 0)
        return out;

    juce::AudioBuffer<float> buffer(1, length);
    buffer.copyFrom(0, 0, samples, length);
    auto spectrum = addsynth::fourierTransform(buffer);

    auto n = spectrum.bins.size();
    out.frequencies = static_cast<double*>(malloc(sizeof(double) * n));
    out.real = static_cast<double*>(malloc(sizeof(double) * n));
    out.imag = static_cast<double*>(malloc(sizeof(double) * n));
    out.count = static_cast<int>(n);
    for (size_t k = 0; k < n; k++)
    {
        out.frequencies[k] = spectrum.frequencies[k];
        out.real[k] = spectrum.bins[k].real();
        out.imag[k] = spectrum.bins[k].imag();
    }
    return out;
}
