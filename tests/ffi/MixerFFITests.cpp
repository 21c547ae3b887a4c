#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ffi/addsynth_ffi.h"

#include <juce_core/juce_core.h>

#include <cstring>
#include <string>

using Catch::Matchers::WithinAbs;

static void constantWave(const double* /*t*/, double* out, int n,
                         double /*freq*/, double /*phase*/, void* user_data)
{
    double value = *static_cast<double*>(user_data);
    for (int i = 0; i < n; i++)
        out[i] = value;
}

// Registry with a "Quarter" (0.25) and a "Half" (0.5) constant wave
struct MixerFixture {
    MixerFixture()
    {
        as_set_sample_rate(10);
        reg = as_registry_create();
        as_registry_add(reg, "Quarter", constantWave, &quarter, nullptr);
        as_registry_add(reg, "Half", constantWave, &half, nullptr);
        quarterOsc = as_oscillator_create(reg, "Quarter", nullptr);
        halfOsc = as_oscillator_create(reg, "Half", nullptr);
        mixer = as_mixer_create(false, 0.0);
    }

    ~MixerFixture()
    {
        as_mixer_destroy(mixer);
        as_oscillator_destroy(quarterOsc);
        as_oscillator_destroy(halfOsc);
        as_registry_destroy(reg);
        as_set_sample_rate(44100);
    }

    double quarter = 0.25;
    double half = 0.5;
    AsRegistry reg = nullptr;
    AsOscillator quarterOsc = nullptr;
    AsOscillator halfOsc = nullptr;
    AsMixer mixer = nullptr;
};

// ═══════════════════════════════════════════════════════════════════
// Tracks
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_mixer_create and destroy")
{
    AsMixer mixer = as_mixer_create(false, 0.0);
    REQUIRE(mixer != nullptr);
    CHECK(as_mixer_track_count(mixer) == 0);
    as_mixer_destroy(mixer);
    as_mixer_destroy(nullptr);
}

TEST_CASE("as_mixer_add_track adds named tracks in order")
{
    MixerFixture f;
    const char* pitches[] = {"1"};
    const char* durations[] = {"1"};

    REQUIRE(as_mixer_add_track(f.mixer, f.quarterOsc, pitches, durations, 1, "lead"));
    REQUIRE(as_mixer_add_track(f.mixer, f.halfOsc, pitches, durations, 1, "bass"));
    CHECK(as_mixer_track_count(f.mixer) == 2);

    AsStringList names = as_mixer_track_names(f.mixer);
    REQUIRE(names.count == 2);
    CHECK(std::strcmp(names.items[0], "lead") == 0);
    CHECK(std::strcmp(names.items[1], "bass") == 0);
    as_free_string_list(names);

    CHECK(as_mixer_get_level(f.mixer, "lead") == 1.0f);
}

TEST_CASE("as_mixer_add_track with a used name changes nothing")
{
    MixerFixture f;
    const char* pitches[] = {"1"};
    const char* durations[] = {"1"};

    REQUIRE(as_mixer_add_track(f.mixer, f.quarterOsc, pitches, durations, 1, "lead"));
    REQUIRE(as_mixer_set_level(f.mixer, "lead", 0.5f));
    CHECK_FALSE(as_mixer_add_track(f.mixer, f.halfOsc, pitches, durations, 1, "lead"));
    CHECK(as_mixer_track_count(f.mixer) == 1);
    CHECK(as_mixer_get_level(f.mixer, "lead") == 0.5f);

    char* error = nullptr;
    REQUIRE(as_mixer_compile(f.mixer, &error));
    AsSampleBuffer out = as_mixer_output(f.mixer);
    REQUIRE(out.length == 10);
    CHECK_THAT(out.samples[0], WithinAbs(0.125, 1e-6));
    as_free_sample_buffer(out);
}

TEST_CASE("as_mixer_add_track rejects bad arguments")
{
    MixerFixture f;
    const char* pitches[] = {"1"};
    const char* durations[] = {"1"};

    CHECK_FALSE(as_mixer_add_track(nullptr, f.quarterOsc, pitches, durations, 1, "a"));
    CHECK_FALSE(as_mixer_add_track(f.mixer, nullptr, pitches, durations, 1, "a"));
    CHECK_FALSE(as_mixer_add_track(f.mixer, f.quarterOsc, nullptr, durations, 1, "a"));
    CHECK_FALSE(as_mixer_add_track(f.mixer, f.quarterOsc, pitches, durations, -1, "a"));
    CHECK_FALSE(as_mixer_add_track(f.mixer, f.quarterOsc, pitches, durations, 1, nullptr));
    CHECK(as_mixer_track_count(f.mixer) == 0);

    // zero steps is a valid, silent track
    CHECK(as_mixer_add_track(f.mixer, f.quarterOsc, nullptr, nullptr, 0, "empty"));
}

TEST_CASE("as_mixer_set_level on an unknown track fails")
{
    MixerFixture f;
    CHECK_FALSE(as_mixer_set_level(f.mixer, "ghost", 0.5f));
    CHECK(as_mixer_get_level(f.mixer, "ghost") == 0.0f);
}

// ═══════════════════════════════════════════════════════════════════
// Compilation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_mixer_compile sums tracks padded to the longest")
{
    MixerFixture f;
    const char* longPitches[] = {"1", "1"};
    const char* longDurations[] = {"0.5", "0.5"};
    const char* shortPitches[] = {"1"};
    const char* shortDurations[] = {"0.4"};

    REQUIRE(as_mixer_add_track(f.mixer, f.quarterOsc, longPitches, longDurations, 2, "long"));
    REQUIRE(as_mixer_add_track(f.mixer, f.halfOsc, shortPitches, shortDurations, 1, "short"));

    char* error = nullptr;
    REQUIRE(as_mixer_compile(f.mixer, &error));
    CHECK(error == nullptr);

    AsSampleBuffer out = as_mixer_output(f.mixer);
    REQUIRE(out.length == 10);
    CHECK(out.sample_rate == 10);
    CHECK_THAT(out.samples[3], WithinAbs(0.75, 1e-6));
    CHECK_THAT(out.samples[4], WithinAbs(0.25, 1e-6));
    CHECK_THAT(out.samples[9], WithinAbs(0.25, 1e-6));
    as_free_sample_buffer(out);
}

TEST_CASE("as_mixer_compile reports unreadable steps")
{
    MixerFixture f;
    const char* pitches[] = {"A4"};
    const char* durations[] = {"q"};
    REQUIRE(as_mixer_add_track(f.mixer, f.quarterOsc, pitches, durations, 1, "notes"));

    char* error = nullptr;
    CHECK_FALSE(as_mixer_compile(f.mixer, &error));
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "UnresolvedStep");
    as_free_string(error);
}

TEST_CASE("as_mixer_create with note steps")
{
    MixerFixture f;
    AsMixer notes = as_mixer_create(true, 60.0);
    const char* pitches[] = {"A4", "R"};
    const char* durations[] = {"q", "e"};
    REQUIRE(as_mixer_add_track(notes, f.quarterOsc, pitches, durations, 2, "notes"));

    char* error = nullptr;
    REQUIRE(as_mixer_compile(notes, &error));
    AsSampleBuffer out = as_mixer_output(notes);
    CHECK(out.length == 15);
    as_free_sample_buffer(out);

    as_mixer_destroy(notes);
}

TEST_CASE("as_mixer_output before compile is empty")
{
    MixerFixture f;
    AsSampleBuffer out = as_mixer_output(f.mixer);
    CHECK(out.samples == nullptr);
    CHECK(out.length == 0);
    as_free_sample_buffer(out);
}

// ═══════════════════════════════════════════════════════════════════
// Export
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_mixer_compile_export writes a WAV file")
{
    MixerFixture f;
    const char* pitches[] = {"1"};
    const char* durations[] = {"1"};
    REQUIRE(as_mixer_add_track(f.mixer, f.halfOsc, pitches, durations, 1, "a"));

    auto file = juce::File::createTempFile(".wav");
    auto path = file.getFullPathName().toStdString();

    char* error = nullptr;
    REQUIRE(as_mixer_compile_export(f.mixer, path.c_str(), 16, &error));
    CHECK(error == nullptr);
    CHECK(file.existsAsFile());
    CHECK(file.getSize() > 44);

    file.deleteFile();
}

TEST_CASE("as_mixer_compile_export reports a bad bit depth")
{
    MixerFixture f;
    auto file = juce::File::createTempFile(".wav");
    auto path = file.getFullPathName().toStdString();

    char* error = nullptr;
    CHECK_FALSE(as_mixer_compile_export(f.mixer, path.c_str(), 7, &error));
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "Unsupported bit depth: 7");
    as_free_string(error);
}
