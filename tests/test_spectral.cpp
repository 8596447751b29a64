/// @file test_spectral.cpp
/// @brief Unit tests for the periodogram estimator.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "xraylc/Binning.hpp"
#include "xraylc/Errors.hpp"
#include "xraylc/SpectralEstimator.hpp"

#include <cmath>
#include <random>
#include <vector>

using namespace xraylc;

static constexpr Real kTwoPi = 6.283185307179586;

namespace {

/// 10 + 5 sin(2 pi t / period) on 1 s bins, no photon counts
RateSeries sinusoid(Eigen::Index n, Real period)
{
    RateSeries rs;
    rs.start.resize(n);
    rs.duration = Vector::Ones(n);
    rs.rate.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        rs.start[i] = static_cast<Real>(i);
        rs.rate[i]  = 10.0 + 5.0 * std::sin(kTwoPi * static_cast<Real>(i) / period);
    }
    return rs;
}

/// Same signal as integer photon counts per second
Observation sinusoid_observation(int n, Real period)
{
    std::vector<Sample> s;
    for (int i = 0; i < n; ++i)
        s.push_back({static_cast<Real>(i),
                     static_cast<Count>(std::lround(10.0 + 5.0 * std::sin(kTwoPi * i / period)))});
    return Observation(s, {});
}

/// 1000 bins of 10 s with Poisson(1) photon counts: white noise only
BinnedSeries white_noise(unsigned seed)
{
    std::mt19937 rng(seed);
    std::poisson_distribution<Count> draw(1.0);
    std::vector<Sample> s;
    for (int i = 0; i < 1000; ++i) s.push_back({10.0 * i, draw(rng)});
    return bin(Observation(s, {}), 10.0);
}

PSDConfig quiet()
{
    PSDConfig cfg;
    cfg.verbose = false;
    return cfg;
}

} // namespace

// =================================================================
// Dominant period
// =================================================================

TEST_CASE("Sinusoid of period 100 s is recovered")
{
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, quiet());

    REQUIRE(r.frequency.size() == 500);
    CHECK(r.resolution() == doctest::Approx(1e-3));
    CHECK(r.nyquist() == doctest::Approx(0.5));
    CHECK(r.frequency[r.frequency.size() - 1] == doctest::Approx(0.5));
    CHECK(r.n_bins == 1000);
    CHECK(r.n_segments == 1);
    CHECK_FALSE(r.truncated_partial_bin);

    REQUIRE(r.dominant.has_value());
    CHECK(r.dominant->index == 9);
    CHECK(r.dominant->frequency == doctest::Approx(0.01));
    CHECK(r.dominant->period == doctest::Approx(100.0));
    CHECK(r.dominant->significance > 3.0);
    CHECK(r.dominant->false_alarm_probability < 1e-10);
}

TEST_CASE("Density normalization integrates to the variance")
{
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, quiet());
    // A^2 / 2 for a sinusoid of amplitude 5
    CHECK(r.power.sum() * r.resolution() == doctest::Approx(12.5).epsilon(1e-6));
}

TEST_CASE("Rms normalization divides by the squared mean rate")
{
    PSDConfig cfg = quiet();
    const PSDResult dens = psd(sinusoid(1000, 100.0), 1.0, cfg);
    cfg.normalization = PSDNormalization::Rms;
    const PSDResult rms = psd(sinusoid(1000, 100.0), 1.0, cfg);

    CHECK(rms.power[9] == doctest::Approx(dens.power[9] / 100.0));
}

TEST_CASE("Periodogram is deterministic")
{
    const RateSeries rs = sinusoid(777, 37.0);
    const PSDResult a = psd(rs, 1.0, quiet());
    const PSDResult b = psd(rs, 1.0, quiet());

    REQUIRE(a.power.size() == b.power.size());
    CHECK((a.power - b.power).cwiseAbs().maxCoeff() <= 1e-9);
    CHECK((a.frequency - b.frequency).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("Binned photon counts with Leahy normalization")
{
    PSDConfig cfg = quiet();
    cfg.normalization = PSDNormalization::Leahy;
    const PSDResult r = psd(bin(sinusoid_observation(1000, 100.0), 1.0), cfg);

    REQUIRE(r.dominant.has_value());
    CHECK(r.dominant->period == doctest::Approx(100.0));
    CHECK(r.dominant->false_alarm_probability >= 0.0);
    CHECK(r.dominant->false_alarm_probability < 1e-10);
}

TEST_CASE("White noise has no dominant periodicity")
{
    const PSDResult r = psd(white_noise(7), quiet());
    REQUIRE(r.frequency.size() == 500);
    CHECK_FALSE(r.dominant);

    SUBCASE("across seeds and normalizations")
    {
        for (auto norm : {PSDNormalization::Density, PSDNormalization::Leahy, PSDNormalization::Rms}) {
            CAPTURE(to_string(norm));
            PSDConfig cfg = quiet();
            cfg.normalization = norm;
            int reported = 0;
            for (unsigned seed = 1; seed <= 50; ++seed)
                if (psd(white_noise(seed), cfg).dominant) ++reported;
            CHECK(reported <= 2);
        }
    }

    SUBCASE("a 100 s modulation on the same noise is found")
    {
        std::mt19937 rng(7);
        std::vector<Sample> s;
        for (int i = 0; i < 1000; ++i) {
            std::poisson_distribution<Count> draw(10.0 + 5.0 * std::sin(kTwoPi * i / 10.0));
            s.push_back({10.0 * i, draw(rng)});
        }
        const PSDResult m = psd(bin(Observation(s, {}), 10.0), quiet());
        REQUIRE(m.dominant.has_value());
        CHECK(m.dominant->period == doctest::Approx(100.0));
        CHECK(m.dominant->false_alarm_probability < 1e-3);
    }
}

TEST_CASE("False-alarm level decides whether a peak is reported")
{
    const BinnedSeries b = white_noise(3);
    PSDConfig cfg = quiet();
    cfg.significance_sigma = 0.0;
    cfg.false_alarm_level  = 1.0 + 1e-9;     // anything above the mean passes
    const PSDResult loose = psd(b, cfg);
    REQUIRE(loose.dominant.has_value());
    CHECK(loose.dominant->false_alarm_probability <= 1.0);

    cfg.false_alarm_level = loose.dominant->false_alarm_probability;
    CHECK_FALSE(psd(b, cfg).dominant);
}

// =================================================================
// Series preparation
// =================================================================

TEST_CASE("Partial final bin is dropped and flagged")
{
    const BinnedSeries b = bin(sinusoid_observation(100, 16.0), 8.0);   // 12 full + 4 s
    REQUIRE(b.has_partial_final_bin());

    const PSDResult r = psd(b, quiet());
    CHECK(r.truncated_partial_bin);
    CHECK(r.n_bins == 12);
    CHECK(r.frequency.size() == 6);
    CHECK(r.resolution() == doctest::Approx(1.0 / 96.0));
}

TEST_CASE("Too few bins")
{
    CHECK_THROWS_AS(psd(sinusoid(5, 4.0), 1.0, quiet()), InsufficientData);

    PSDConfig cfg = quiet();
    cfg.min_bins = 2;
    CHECK_NOTHROW(psd(sinusoid(5, 4.0), 1.0, cfg));

    CHECK_THROWS_AS(psd(BinnedSeries{}, quiet()), InsufficientData);
}

TEST_CASE("Bad bin width or non-uniform series")
{
    RateSeries rs = sinusoid(64, 8.0);
    CHECK_THROWS_AS(psd(rs, 0.0, quiet()), InvalidBinWidth);

    rs.duration[10] = 2.0;
    CHECK_THROWS_AS(psd(rs, 1.0, quiet()), InvalidBinWidth);
}

TEST_CASE("Leahy normalization needs photons")
{
    RateSeries rs;
    rs.start    = Vector::LinSpaced(32, 0.0, 31.0);
    rs.duration = Vector::Ones(32);
    rs.rate     = Vector::Zero(32);
    rs.counts   = Vector::Zero(32);

    PSDConfig cfg = quiet();
    cfg.normalization = PSDNormalization::Leahy;
    CHECK_THROWS_AS(psd(rs, 1.0, cfg), DegenerateObservation);

    cfg.normalization = PSDNormalization::Rms;
    CHECK_THROWS_AS(psd(rs, 1.0, cfg), DegenerateObservation);
}

// =================================================================
// Segments and smoothing
// =================================================================

TEST_CASE("Segment averaging")
{
    PSDConfig cfg = quiet();
    cfg.segment_bins = 200;
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, cfg);

    CHECK(r.n_segments == 5);
    CHECK(r.n_bins == 1000);
    REQUIRE(r.frequency.size() == 100);
    CHECK(r.resolution() == doctest::Approx(1.0 / 200.0));
    REQUIRE(r.dominant.has_value());
    CHECK(r.dominant->index == 1);
    CHECK(r.dominant->period == doctest::Approx(100.0));
}

TEST_CASE("Trailing bins that do not fill a segment are ignored")
{
    PSDConfig cfg = quiet();
    cfg.segment_bins = 300;
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, cfg);
    CHECK(r.n_segments == 3);
    CHECK(r.n_bins == 900);
}

TEST_CASE("Long series are split automatically")
{
    PSDConfig cfg = quiet();
    cfg.max_bins = 500;
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, cfg);
    CHECK(r.n_segments == 2);
    CHECK(r.frequency.size() == 250);
}

TEST_CASE("Smoothed spectrum")
{
    PSDConfig cfg = quiet();
    const PSDResult plain = psd(sinusoid(1000, 100.0), 1.0, cfg);
    CHECK(plain.smoothed_power.size() == 0);

    cfg.smoothing_window = 5;
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, cfg);
    REQUIRE(r.smoothed_power.size() == 496);
    CHECK(r.smoothed_frequency.size() == 496);
    CHECK(r.smoothed_frequency[0] == doctest::Approx(3e-3));
    CHECK(r.smoothed_power[5] == doctest::Approx(r.power.segment(5, 5).mean()));
}

TEST_CASE("Smoothing window wider than the spectrum keeps the raw powers")
{
    PSDConfig cfg = quiet();
    cfg.smoothing_window = 501;
    const PSDResult r = psd(sinusoid(1000, 100.0), 1.0, cfg);
    CHECK(r.power.size() == 500);
    CHECK(r.smoothed_power.size() == 0);
    CHECK(r.smoothed_frequency.size() == 0);
    CHECK(r.dominant.has_value());

    cfg.smoothing_window = 500;
    CHECK(psd(sinusoid(1000, 100.0), 1.0, cfg).smoothed_power.size() == 1);
}

TEST_CASE("Option names")
{
    for (auto n : {PSDNormalization::Density, PSDNormalization::Leahy, PSDNormalization::Rms})
        CHECK(psd_normalization_from_string(to_string(n)) == n);
    for (auto d : {Detrend::None, Detrend::Constant, Detrend::Linear})
        CHECK(detrend_from_string(to_string(d)) == d);
    CHECK_THROWS_AS(psd_normalization_from_string("fractional"), ConfigError);
    CHECK_THROWS_AS(detrend_from_string("quadratic"), ConfigError);
}
