#ifndef XRAYLC_STATISTICS_HPP
#define XRAYLC_STATISTICS_HPP
// -----------------------------------------------------------------------------
//  Scalar summaries of an observation and the small robust-statistics toolbox
//  shared by the spectral estimator and the event detector.  Everything here
//  is a pure function of its arguments.
// -----------------------------------------------------------------------------
#include "Types.hpp"
#include "Observation.hpp"
#include "Binning.hpp"
#include <string>
#include <vector>

namespace xraylc {

// -----------------------------------------------------------------------------
//  Observation bundle
// -----------------------------------------------------------------------------
struct ObservationStats
{
    Count       total_counts {0};
    std::size_t n_samples    {0};
    Real        duration_s   {0.0};    // last − first timestamp
    Real        duration_ks  {0.0};
    Real        rate_s       {0.0};    // counts / s
    Real        rate_ks      {0.0};    // counts / ks
};

struct StatisticsConfig
{
    int running_window {5};            // bins
};

Count total_counts(const Observation& obs);

Real duration_seconds(const Observation& obs);
Real duration_kiloseconds(const Observation& obs);

// Both throw DegenerateObservation for a zero-duration observation.
Real mean_rate(const Observation& obs);            // counts / s
Real mean_rate_ks(const Observation& obs);         // counts / ks

ObservationStats compute_stats(const Observation& obs);

// Running total after each sample, same length as obs.samples().
std::vector<Count> cumulative_counts(const Observation& obs);

// Valid-mode moving mean: result[i] = mean(values[i … i+window-1]).
// Throws InvalidWindow unless 1 <= window <= values.size().
Vector running_average(const Vector& values, int window);
Vector running_average(const BinnedSeries& series, int window, bool use_rate = true);

// -----------------------------------------------------------------------------
//  Robust location / spread
// -----------------------------------------------------------------------------
enum class BaselineMethod
{
    MedianMAD,     // median, 1.4826 · MAD
    MeanStd,       // mean, population standard deviation
    SigmaClip      // iteratively k-sigma clipped mean / std
};

std::string     to_string(BaselineMethod m);
BaselineMethod  baseline_method_from_string(const std::string& s);   // ConfigError

struct Baseline
{
    Real level      {0.0};
    Real dispersion {0.0};
};

Real median(Vector v);
Real median_absolute_deviation(const Vector& v, Real centre);
Real mean(const Vector& v);
Real standard_deviation(const Vector& v, Real mu);   // population (ddof = 0)

// Throws InsufficientData for an empty vector.
Baseline estimate_baseline(const Vector&  values,
                           BaselineMethod method,
                           Real           clip_sigma      = 3.0,
                           int            clip_iterations = 5);

// -----------------------------------------------------------------------------
//  Poisson helpers (Boost.Math)
// -----------------------------------------------------------------------------
Real poisson_pmf(Real mu, Count k);
Real poisson_upper_tail(Real mu, Count k);   // P(X >= k)
Real poisson_lower_tail(Real mu, Count k);   // P(X <= k)

} // namespace xraylc
#endif // XRAYLC_STATISTICS_HPP
