#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ffi/addsynth_ffi.h"

#include <cmath>

using Catch::Matchers::WithinAbs;

TEST_CASE("as_fourier_transform of nothing is empty")
{
    AsSpectrum s = as_fourier_transform(nullptr, 10);
    CHECK(s.count == 0);
    CHECK(s.frequencies == nullptr);
    as_free_spectrum(s);

    float x = 1.0f;
    s = as_fourier_transform(&x, 0);
    CHECK(s.count == 0);
    as_free_spectrum(s);
}

TEST_CASE("as_fourier_transform labels bins at the sampling rate")
{
    REQUIRE(as_set_sample_rate(6));
    float samples[6] = {1, 1, 1, 1, 1, 1};

    AsSpectrum s = as_fourier_transform(samples, 6);
    REQUIRE(s.count == 6);
    const double expected[] = {0, 1, 2, -3, -2, -1};
    for (int k = 0; k < 6; k++)
        CHECK_THAT(s.frequencies[k], WithinAbs(expected[k], 1e-12));

    CHECK_THAT(s.real[0], WithinAbs(6.0, 1e-4));
    CHECK_THAT(s.imag[0], WithinAbs(0.0, 1e-4));
    for (int k = 1; k < 6; k++)
        CHECK_THAT(std::hypot(s.real[k], s.imag[k]), WithinAbs(0.0, 1e-4));
    as_free_spectrum(s);

    REQUIRE(as_set_sample_rate(44100));
}

TEST_CASE("as_fourier_transform finds the frequency of an oscillated sine")
{
    AsRegistry reg = as_registry_create();
    char* error = nullptr;
    AsOscillator osc = as_oscillator_create(reg, "Sine", &error);
    REQUIRE(osc != nullptr);

    AsSampleBuffer buf = as_oscillate(osc, 1.0, 0.0, 440.0, 0.0, &error);
    REQUIRE(buf.length == 44100);

    AsSpectrum s = as_fourier_transform(buf.samples, buf.length);
    REQUIRE(s.count == 44100);

    int peak = 0;
    double best = -1.0;
    for (int k = 0; k < s.count; k++)
    {
        if (s.frequencies[k] < 0.0)
            continue;
        double mag = std::hypot(s.real[k], s.imag[k]);
        if (mag > best)
        {
            best = mag;
            peak = k;
        }
    }
    CHECK(peak == 440);
    CHECK_THAT(s.frequencies[peak], WithinAbs(440.0, 1e-9));

    as_free_spectrum(s);
    as_free_sample_buffer(buf);
    as_oscillator_destroy(osc);
    as_registry_destroy(reg);
}
