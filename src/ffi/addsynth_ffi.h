#ifndef ADDSYNTH_FFI_H
#define ADDSYNTH_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Opaque handles ────────────────────────────────────────────── */

typedef void* AsRegistry;
typedef void* AsOscillator;
typedef void* AsMixer;

/* ── String ownership ──────────────────────────────────────────── */

/// Free a string returned by any as_* function.
/// Passing NULL is safe (no-op).
void as_free_string(char* s);

typedef struct {
    char** items;
    int    count;
} AsStringList;

/// Free a string list returned by as_registry_names() or as_mixer_track_names().
void as_free_string_list(AsStringList list);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=warn, 2=info, 3=debug, 4=trace.
void as_set_log_level(int level);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
void as_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── Sampling rate ─────────────────────────────────────────────── */

/// Current process-wide sampling rate (default 44100).
int as_sample_rate(void);

/// Change the sampling rate. Returns false for rate <= 0.
/// Buffers generated before the change keep their old timing.
bool as_set_sample_rate(int rate);

/* ── Sample buffers ────────────────────────────────────────────── */

typedef struct {
    float* samples;
    int    length;
    int    sample_rate;
} AsSampleBuffer;

/// Free a buffer returned by as_oscillate() or as_mixer_output().
void as_free_sample_buffer(AsSampleBuffer buffer);

/* ── Wave registry ─────────────────────────────────────────────── */

/// Custom generator: fill out[0..n) from t[0..n), freq (Hz) and phase (rad).
typedef void (*AsWaveFn)(const double* t, double* out, int n,
                         double freq, double phase, void* user_data);

/// Create a registry seeded with Sine, Square, Triangle and Sawtooth.
/// Free with as_registry_destroy().
AsRegistry as_registry_create(void);

/// Destroy a registry. Oscillators created from it stay valid.
/// Passing NULL is safe (no-op).
void as_registry_destroy(AsRegistry registry);

/// Register a custom wave. Returns false and sets *error for a duplicate
/// or empty name or a NULL function. `user_data` must outlive every
/// oscillator using this wave.
bool as_registry_add(AsRegistry registry, const char* name, AsWaveFn fn,
                     void* user_data, char** error);

/// Remove a custom wave. Built-ins cannot be removed.
bool as_registry_remove(AsRegistry registry, const char* name, char** error);

/// Wave names in registration order. Free with as_free_string_list().
AsStringList as_registry_names(AsRegistry registry);

/* ── Oscillators ───────────────────────────────────────────────── */

/// Create an oscillator for a registered wave. Returns NULL (sets *error)
/// if the wave is unknown. Free with as_oscillator_destroy().
AsOscillator as_oscillator_create(AsRegistry registry, const char* wave, char** error);

/// Passing NULL is safe (no-op).
void as_oscillator_destroy(AsOscillator oscillator);

/// Oscillate over [start, start + duration) at the current sampling rate.
/// On failure returns an empty buffer (samples == NULL) and sets *error.
AsSampleBuffer as_oscillate(AsOscillator oscillator, double duration, double start,
                            double freq, double phase, char** error);

/* ── Mixer ─────────────────────────────────────────────────────── */

/// Create a mixer. steps_as_notes selects note notation ("C4", "q") at
/// `bpm`; otherwise step tokens are plain numbers (Hz, seconds).
AsMixer as_mixer_create(bool steps_as_notes, double bpm);

/// Passing NULL is safe (no-op).
void as_mixer_destroy(AsMixer mixer);

/// Add a track of `count` (pitch, duration) steps. The mixer shares the
/// oscillator. Returns false if `name` is already used (nothing changes).
bool as_mixer_add_track(AsMixer mixer, AsOscillator oscillator,
                        const char* const* pitches, const char* const* durations,
                        int count, const char* name);

int as_mixer_track_count(AsMixer mixer);

/// Track names in insertion order. Free with as_free_string_list().
AsStringList as_mixer_track_names(AsMixer mixer);

/// Returns false if no track has that name.
bool as_mixer_set_level(AsMixer mixer, const char* name, float level);

/// Returns 0.0f if no track has that name.
float as_mixer_get_level(AsMixer mixer, const char* name);

/// Compile and mix all tracks. Returns false and sets *error on failure.
bool as_mixer_compile(AsMixer mixer, char** error);

/// Copy of the last compiled output. Free with as_free_sample_buffer().
AsSampleBuffer as_mixer_output(AsMixer mixer);

/// Compile, then write the output as a WAV file (bits_per_sample 16, 24 or 32).
bool as_mixer_compile_export(AsMixer mixer, const char* path, int bits_per_sample,
                             char** error);

/* ── Spectral analysis ─────────────────────────────────────────── */

typedef struct {
    double* frequencies;
    double* real;
    double* imag;
    int     count;
} AsSpectrum;

/// DFT of `samples[0..length)` labelled at the current sampling rate.
/// Free with as_free_spectrum().
AsSpectrum as_fourier_transform(const float* samples, int length);

void as_free_spectrum(AsSpectrum spectrum);

#ifdef __cplusplus
}
#endif

#endif /* ADDSYNTH_FFI_H */
