#include "xraylc/Statistics.hpp"
#include "xraylc/Errors.hpp"

#include <boost/math/distributions/poisson.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace xraylc {
namespace {

// 1 / Φ⁻¹(3/4): turns a MAD into a Gaussian-equivalent sigma
constexpr Real kMadToSigma = 1.482602218505602;

constexpr Real kNaN = std::numeric_limits<Real>::quiet_NaN();

} // unnamed namespace


// ============================================================================
//  Observation scalars
// ============================================================================
Count total_counts(const Observation& obs)
{
    return obs.total_counts();
}

Real duration_seconds(const Observation& obs)
{
    return obs.time_span();
}

Real duration_kiloseconds(const Observation& obs)
{
    return obs.time_span() / 1000.0;
}

Real mean_rate(const Observation& obs)
{
    const Real dur = duration_seconds(obs);
    if (!(dur > 0.0))
        throw DegenerateObservation(
            "mean_rate(): observation duration is zero (single sample), rate undefined");
    return static_cast<Real>(obs.total_counts()) / dur;
}

Real mean_rate_ks(const Observation& obs)
{
    return mean_rate(obs) * 1000.0;
}

ObservationStats compute_stats(const Observation& obs)
{
    ObservationStats st;
    st.total_counts = total_counts(obs);
    st.n_samples    = obs.size();
    st.duration_s   = duration_seconds(obs);
    st.duration_ks  = duration_kiloseconds(obs);
    st.rate_s       = mean_rate(obs);
    st.rate_ks      = mean_rate_ks(obs);
    return st;
}

std::vector<Count> cumulative_counts(const Observation& obs)
{
    std::vector<Count> out;
    out.reserve(obs.size());
    Count running = 0;
    for (const auto& s : obs.samples()) {
        running += s.counts;
        out.push_back(running);
    }
    return out;
}

// ----------------------------------------------------------------------------
Vector running_average(const Vector& values, int window)
{
    const Eigen::Index n = values.size();
    if (window < 1 || window > n)
        throw InvalidWindow("running_average(): window " + std::to_string(window)
                            + " outside [1, " + std::to_string(n) + "]");

    const Eigen::Index m = n - window + 1;
    Vector out(m);

    // sliding sum, re-anchored every window to keep rounding from drifting
    Real sum = values.head(window).sum();
    out[0] = sum / window;
    for (Eigen::Index i = 1; i < m; ++i) {
        if (i % window == 0)
            sum = values.segment(i, window).sum();
        else
            sum += values[i + window - 1] - values[i - 1];
        out[i] = sum / window;
    }
    return out;
}

Vector running_average(const BinnedSeries& series, int window, bool use_rate)
{
    return running_average(use_rate ? series.rates() : series.net_counts(), window);
}


// ============================================================================
//  Robust location / spread
// ============================================================================
std::string to_string(BaselineMethod m)
{
    switch (m) {
        case BaselineMethod::MedianMAD: return "median_mad";
        case BaselineMethod::MeanStd:   return "mean_std";
        case BaselineMethod::SigmaClip: return "sigma_clip";
    }
    return "median_mad";
}

BaselineMethod baseline_method_from_string(const std::string& s)
{
    if (s == "median_mad") return BaselineMethod::MedianMAD;
    if (s == "mean_std")   return BaselineMethod::MeanStd;
    if (s == "sigma_clip") return BaselineMethod::SigmaClip;
    throw ConfigError("unknown baseline method '" + s
                      + "' (expected median_mad | mean_std | sigma_clip)");
}

Real median(Vector v)                       // by value: nth_element reorders
{
    const Eigen::Index n = v.size();
    if (n == 0) return kNaN;

    const Eigen::Index k = n / 2;
    std::nth_element(v.data(), v.data() + k, v.data() + n);

    Real m = v[k];
    if ((n & 1) == 0) {
        const Real max_lo = *std::max_element(v.data(), v.data() + k);
        m = 0.5 * (m + max_lo);
    }
    return m;
}

Real median_absolute_deviation(const Vector& v, Real centre)
{
    return median((v.array() - centre).abs().matrix());
}

Real mean(const Vector& v)
{
    return v.size() ? v.mean() : kNaN;
}

Real standard_deviation(const Vector& v, Real mu)
{
    if (v.size() == 0) return kNaN;
    return std::sqrt((v.array() - mu).square().sum() / static_cast<Real>(v.size()));
}

Baseline estimate_baseline(const Vector&  values,
                           BaselineMethod method,
                           Real           clip_sigma,
                           int            clip_iterations)
{
    if (values.size() == 0)
        throw InsufficientData("estimate_baseline(): empty series");

    Baseline b;
    switch (method) {
        case BaselineMethod::MedianMAD: {
            b.level      = median(values);
            b.dispersion = kMadToSigma * median_absolute_deviation(values, b.level);
            break;
        }
        case BaselineMethod::MeanStd: {
            b.level      = mean(values);
            b.dispersion = standard_deviation(values, b.level);
            break;
        }
        case BaselineMethod::SigmaClip: {
            Vector kept = values;
            b.level      = mean(kept);
            b.dispersion = standard_deviation(kept, b.level);

            for (int it = 0; it < clip_iterations && b.dispersion > 0.0; ++it) {
                std::vector<Real> next;
                next.reserve(static_cast<std::size_t>(kept.size()));
                for (Eigen::Index i = 0; i < kept.size(); ++i)
                    if (std::abs(kept[i] - b.level) <= clip_sigma * b.dispersion)
                        next.push_back(kept[i]);

                if (next.empty() ||
                    static_cast<Eigen::Index>(next.size()) == kept.size())
                    break;

                kept         = Eigen::Map<Vector>(next.data(), static_cast<Eigen::Index>(next.size()));
                b.level      = mean(kept);
                b.dispersion = standard_deviation(kept, b.level);
            }
            break;
        }
    }
    return b;
}


// ============================================================================
//  Poisson helpers
// ============================================================================
Real poisson_pmf(Real mu, Count k)
{
    if (!(mu >= 0.0) || !std::isfinite(mu)) return kNaN;
    if (k < 0) return 0.0;
    if (mu == 0.0) return k == 0 ? 1.0 : 0.0;
    const boost::math::poisson_distribution<Real> d(mu);
    return boost::math::pdf(d, static_cast<Real>(k));
}

Real poisson_upper_tail(Real mu, Count k)
{
    if (!(mu >= 0.0) || !std::isfinite(mu)) return kNaN;
    if (k <= 0) return 1.0;
    if (mu == 0.0) return 0.0;
    const boost::math::poisson_distribution<Real> d(mu);
    return boost::math::cdf(boost::math::complement(d, static_cast<Real>(k - 1)));
}

Real poisson_lower_tail(Real mu, Count k)
{
    if (!(mu >= 0.0) || !std::isfinite(mu)) return kNaN;
    if (k < 0) return 0.0;
    if (mu == 0.0) return 1.0;
    const boost::math::poisson_distribution<Real> d(mu);
    return boost::math::cdf(d, static_cast<Real>(k));
}

} // namespace xraylc
