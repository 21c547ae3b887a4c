#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ffi/addsynth_ffi.h"

#include <cmath>
#include <limits>
#include <string>

using Catch::Matchers::WithinAbs;

static void timeWave(const double* t, double* out, int n,
                     double /*freq*/, double /*phase*/, void* /*user_data*/)
{
    for (int i = 0; i < n; i++)
        out[i] = t[i];
}

// ═══════════════════════════════════════════════════════════════════
// Sampling rate
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_sample_rate defaults to 44100 and can be changed")
{
    CHECK(as_sample_rate() == 44100);
    REQUIRE(as_set_sample_rate(8000));
    CHECK(as_sample_rate() == 8000);
    CHECK_FALSE(as_set_sample_rate(0));
    CHECK(as_sample_rate() == 8000);
    REQUIRE(as_set_sample_rate(44100));
}

// ═══════════════════════════════════════════════════════════════════
// Creation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_oscillator_create succeeds for built-in waves")
{
    AsRegistry reg = as_registry_create();
    for (const char* wave : {"Sine", "Square", "Triangle", "Sawtooth"})
    {
        char* error = nullptr;
        AsOscillator osc = as_oscillator_create(reg, wave, &error);
        CHECK(osc != nullptr);
        CHECK(error == nullptr);
        as_oscillator_destroy(osc);
    }
    as_registry_destroy(reg);
}

TEST_CASE("as_oscillator_create fails for an unknown wave")
{
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Organ", &error);
    CHECK(osc == nullptr);
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "UnknownWaveName: Organ");
    as_free_string(error);
    as_registry_destroy(reg);
}

TEST_CASE("as_oscillator_destroy with NULL is a no-op")
{
    as_oscillator_destroy(nullptr);
}

// ═══════════════════════════════════════════════════════════════════
// Oscillation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("as_oscillate returns floor(rate * duration) samples")
{
    REQUIRE(as_set_sample_rate(4));
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Sine", &error);
    REQUIRE(osc != nullptr);

    AsSampleBuffer buf = as_oscillate(osc, 1.0, 0.0, 1.0, 0.0, &error);
    CHECK(error == nullptr);
    REQUIRE(buf.length == 4);
    CHECK(buf.sample_rate == 4);
    CHECK_THAT(buf.samples[1], WithinAbs(1.0, 1e-6));
    as_free_sample_buffer(buf);

    as_oscillator_destroy(osc);
    as_registry_destroy(reg);
    REQUIRE(as_set_sample_rate(44100));
}

TEST_CASE("as_oscillate zero duration is an empty buffer, not an error")
{
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Square", &error);

    AsSampleBuffer buf = as_oscillate(osc, 0.0, 1.0, 440.0, 0.0, &error);
    CHECK(error == nullptr);
    CHECK(buf.length == 0);
    CHECK(buf.samples == nullptr);
    as_free_sample_buffer(buf);

    as_oscillator_destroy(osc);
    as_registry_destroy(reg);
}

TEST_CASE("as_oscillate negative duration fails")
{
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Sine", &error);

    AsSampleBuffer buf = as_oscillate(osc, -1.0, 0.0, 440.0, 0.0, &error);
    CHECK(buf.length == 0);
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "InvalidDuration");
    as_free_string(error);

    as_oscillator_destroy(osc);
    as_registry_destroy(reg);
}

TEST_CASE("as_oscillate over-long or infinite duration fails")
{
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Sine", &error);
    REQUIRE(osc != nullptr);

    for (double duration : {1.0e6, std::numeric_limits<double>::infinity()})
    {
        error = nullptr;
        AsSampleBuffer buf = as_oscillate(osc, duration, 0.0, 440.0, 0.0, &error);
        CHECK(buf.length == 0);
        CHECK(buf.samples == nullptr);
        REQUIRE(error != nullptr);
        CHECK(std::string(error) == "InvalidDuration");
        as_free_string(error);
    }

    as_oscillator_destroy(osc);
    as_registry_destroy(reg);
}

TEST_CASE("as_oscillate with NULL oscillator fails")
{
    char* error = nullptr;
    AsSampleBuffer buf = as_oscillate(nullptr, 1.0, 0.0, 440.0, 0.0, &error);
    CHECK(buf.samples == nullptr);
    REQUIRE(error != nullptr);
    as_free_string(error);
}

TEST_CASE("as_oscillate runs a custom wave with the start offset")
{
    REQUIRE(as_set_sample_rate(10));
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    REQUIRE(as_registry_add(reg, "Time", timeWave, nullptr, &error));
    AsOscillator osc = as_oscillator_create(reg, "Time", &error);
    REQUIRE(osc != nullptr);

    // the oscillator keeps working after the registry is gone
    as_registry_destroy(reg);

    AsSampleBuffer buf = as_oscillate(osc, 0.5, 2.0, 1.0, 0.0, &error);
    REQUIRE(buf.length == 5);
    CHECK_THAT(buf.samples[0], WithinAbs(2.0, 1e-6));
    CHECK_THAT(buf.samples[4], WithinAbs(2.4, 1e-6));
    as_free_sample_buffer(buf);

    as_oscillator_destroy(osc);
    REQUIRE(as_set_sample_rate(44100));
}
