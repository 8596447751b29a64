/// @file test_statistics.cpp
/// @brief Unit tests for observation summaries, running averages,
///        baseline estimators and Poisson tails.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "xraylc/Binning.hpp"
#include "xraylc/Errors.hpp"
#include "xraylc/Statistics.hpp"

#include <cmath>
#include <vector>

using namespace xraylc;

namespace {

Vector vec(std::initializer_list<Real> v)
{
    Vector out(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (Real x : v) out[i++] = x;
    return out;
}

} // namespace

// =================================================================
// Observation scalars
// =================================================================

TEST_CASE("Rates over a 2 ks observation")
{
    // 21 samples, 100 s apart, 10 counts each: 210 counts over 2000 s
    std::vector<Sample> s;
    for (int i = 0; i <= 20; ++i) s.push_back({100.0 * i, 10});
    const Observation obs(s, {});

    CHECK(total_counts(obs) == 210);
    CHECK(duration_seconds(obs) == doctest::Approx(2000.0));
    CHECK(duration_kiloseconds(obs) == doctest::Approx(2.0));
    CHECK(mean_rate(obs) == doctest::Approx(0.105));
    CHECK(mean_rate_ks(obs) == doctest::Approx(105.0));

    const ObservationStats st = compute_stats(obs);
    CHECK(st.n_samples == 21);
    CHECK(st.total_counts == 210);
    CHECK(st.rate_ks == doctest::Approx(105.0));
}

TEST_CASE("Single sample has no defined rate")
{
    const Observation obs({{10.0, 4}}, {});
    CHECK(total_counts(obs) == 4);
    CHECK(duration_seconds(obs) == 0.0);
    CHECK_THROWS_AS(mean_rate(obs), DegenerateObservation);
    CHECK_THROWS_AS(mean_rate_ks(obs), DegenerateObservation);
    CHECK_THROWS_AS(compute_stats(obs), DegenerateObservation);
}

TEST_CASE("Cumulative counts")
{
    const Observation obs({{0.0, 2}, {1.0, 0}, {2.0, 5}, {3.0, 1}}, {});
    const std::vector<Count> expected = {2, 2, 7, 8};
    CHECK(cumulative_counts(obs) == expected);
}

// =================================================================
// Running average
// =================================================================

TEST_CASE("Running average uses valid mode")
{
    const Vector r = running_average(vec({1, 2, 3, 4, 5}), 3);
    REQUIRE(r.size() == 3);
    CHECK(r[0] == doctest::Approx(2.0));
    CHECK(r[1] == doctest::Approx(3.0));
    CHECK(r[2] == doctest::Approx(4.0));

    const Vector same = running_average(vec({1, 2, 3}), 1);
    CHECK(same.size() == 3);
    CHECK(same[2] == doctest::Approx(3.0));

    const Vector whole = running_average(vec({1, 2, 3, 6}), 4);
    REQUIRE(whole.size() == 1);
    CHECK(whole[0] == doctest::Approx(3.0));
}

TEST_CASE("Running average stays accurate over long series")
{
    Vector v(10000);
    for (Eigen::Index i = 0; i < v.size(); ++i) v[i] = 1e6 + std::sin(0.01 * i);
    const Vector r = running_average(v, 7);
    for (Eigen::Index i = 0; i < r.size(); i += 997)
        CHECK(r[i] == doctest::Approx(v.segment(i, 7).mean()).epsilon(1e-12));
}

TEST_CASE("Running average window bounds")
{
    CHECK_THROWS_AS(running_average(vec({1, 2, 3}), 0), InvalidWindow);
    CHECK_THROWS_AS(running_average(vec({1, 2, 3}), 4), InvalidWindow);
    CHECK_THROWS_AS(running_average(vec({1, 2, 3}), -2), InvalidWindow);
}

TEST_CASE("Running average of a binned series")
{
    std::vector<Sample> s;
    for (int i = 0; i < 40; ++i) s.push_back({static_cast<Real>(i), i < 20 ? 1 : 3});
    const BinnedSeries b = bin(Observation(s, {}), 10.0);   // rates 1 1 3 3

    const Vector r = running_average(b, 2);
    REQUIRE(r.size() == 3);
    CHECK(r[0] == doctest::Approx(1.0));
    CHECK(r[1] == doctest::Approx(2.0));
    CHECK(r[2] == doctest::Approx(3.0));

    const Vector c = running_average(b, 2, /*use_rate=*/false);
    CHECK(c[1] == doctest::Approx(20.0));
}

// =================================================================
// Baselines
// =================================================================

TEST_CASE("Median and MAD")
{
    CHECK(median(vec({3, 1, 2})) == doctest::Approx(2.0));
    CHECK(median(vec({4, 1, 3, 2})) == doctest::Approx(2.5));
    CHECK(median_absolute_deviation(vec({1, 1, 2, 2, 4, 6, 9}), 2.0) == doctest::Approx(1.0));
    CHECK(std::isnan(median(Vector())));
}

TEST_CASE("Baseline estimators")
{
    const Vector v = vec({10, 11, 9, 10, 10, 11, 9, 10, 100});

    SUBCASE("median / MAD ignores the outlier")
    {
        const Baseline b = estimate_baseline(v, BaselineMethod::MedianMAD);
        CHECK(b.level == doctest::Approx(10.0));
        CHECK(b.dispersion == doctest::Approx(1.482602218505602));   // MAD = 1
    }
    SUBCASE("mean / std is pulled by the outlier")
    {
        const Baseline b = estimate_baseline(v, BaselineMethod::MeanStd);
        CHECK(b.level == doctest::Approx(20.0));
        CHECK(b.dispersion > 25.0);
    }
    SUBCASE("sigma clipping removes the outlier")
    {
        const Baseline b = estimate_baseline(v, BaselineMethod::SigmaClip, 2.0, 5);
        CHECK(b.level == doctest::Approx(10.0));
        CHECK(b.dispersion == doctest::Approx(std::sqrt(0.5)));
    }
    CHECK_THROWS_AS(estimate_baseline(Vector(), BaselineMethod::MeanStd), InsufficientData);
}

TEST_CASE("Baseline method names")
{
    for (auto m : {BaselineMethod::MedianMAD, BaselineMethod::MeanStd, BaselineMethod::SigmaClip})
        CHECK(baseline_method_from_string(to_string(m)) == m);
    CHECK_THROWS_AS(baseline_method_from_string("median"), ConfigError);
}

// =================================================================
// Poisson helpers
// =================================================================

TEST_CASE("Poisson probabilities")
{
    CHECK(poisson_pmf(2.0, 0) == doctest::Approx(std::exp(-2.0)));
    CHECK(poisson_pmf(2.0, 3) == doctest::Approx(std::exp(-2.0) * 8.0 / 6.0));
    CHECK(poisson_pmf(0.0, 0) == 1.0);
    CHECK(poisson_pmf(0.0, 2) == 0.0);

    CHECK(poisson_upper_tail(3.0, 0) == 1.0);
    CHECK(poisson_upper_tail(3.0, 1) == doctest::Approx(1.0 - std::exp(-3.0)));
    CHECK(poisson_lower_tail(3.0, 0) == doctest::Approx(std::exp(-3.0)));
    CHECK(poisson_upper_tail(3.0, 4) + poisson_lower_tail(3.0, 3) == doctest::Approx(1.0));

    CHECK(poisson_upper_tail(1.0, 20) < 1e-15);
    CHECK(std::isnan(poisson_pmf(-1.0, 1)));
}
