#include "xraylc/Binning.hpp"
#include "xraylc/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace xraylc {

/* -------------------------------------------------------------- *
 *  relative slack used when comparing times against bin edges    *
 * -------------------------------------------------------------- */
static constexpr Real kEdgeTol = 1e-9;

/* ==============================================================
 *  public interface
 * =============================================================*/
BinnedSeries bin(const Observation& obs, Real width, std::size_t max_bins)
{
    if (!(width > 0.0) || !std::isfinite(width))
        throw InvalidBinWidth("bin(): bin width must be a positive finite number, got "
                              + std::to_string(width));

    /* ---- bins start at the first sample and cover the exposure ---- */
    const Real t0   = obs.first_time();
    const Real tend = std::max(obs.exposure_end(), obs.last_time());
    const Real span = tend - t0;
    if (!(span > 0.0))
        throw DegenerateObservation("bin(): observation has zero duration, nothing to bin");

    /*  ceil(span / width) with a little slack so that a span of exactly
     *  k widths does not produce a sliver bin from rounding noise.
     *  Monotonic in width: a wider bin never yields more bins.        */
    const Real q = span / width;
    if (!(q * (1.0 - kEdgeTol) <= static_cast<Real>(max_bins)))
        throw InvalidBinWidth("bin(): width " + std::to_string(width) + " s over "
                              + std::to_string(span) + " s needs more than "
                              + std::to_string(max_bins) + " bins (binning.maxBins)");

    const auto nbin = static_cast<std::size_t>(
            std::max<Real>(1.0, std::ceil(q * (1.0 - kEdgeTol))));

    BinnedSeries out;
    out.width_ = width;
    out.bins_.resize(nbin);

    for (std::size_t k = 0; k < nbin; ++k) {
        Bin& b     = out.bins_[k];
        b.start    = t0 + static_cast<Real>(k) * width;
        b.duration = width;
    }

    Bin& last     = out.bins_.back();
    last.duration = tend - last.start;
    if (last.duration < width * (1.0 - kEdgeTol))
        last.partial = true;
    else
        last.duration = width;

    /* ---- assign samples ------------------------------------------ */
    for (const auto& s : obs.samples()) {
        const Real pos = std::floor((s.time - t0) / width);
        std::size_t k  = pos <= 0.0 ? 0 : static_cast<std::size_t>(pos);
        if (k >= nbin) k = nbin - 1;                 // sample at the exposure end
        out.bins_[k].counts += s.counts;
        ++out.bins_[k].n_samples;
    }

    for (auto& b : out.bins_)
        b.rate = b.duration > 0.0 ? static_cast<Real>(b.counts) / b.duration : 0.0;

    return out;
}

BinnedSeries bin(const Observation& obs, const BinningConfig& cfg)
{
    return bin(obs, cfg.bin_width, cfg.max_bins);
}

/* ==============================================================
 *  BinnedSeries views
 * =============================================================*/
Count BinnedSeries::total_counts() const
{
    Count n = 0;
    for (const auto& b : bins_) n += b.counts;
    return n;
}

Vector BinnedSeries::start_times() const
{
    Vector v(static_cast<Eigen::Index>(bins_.size()));
    for (std::size_t i = 0; i < bins_.size(); ++i) v[i] = bins_[i].start;
    return v;
}

Vector BinnedSeries::centres() const
{
    Vector v(static_cast<Eigen::Index>(bins_.size()));
    for (std::size_t i = 0; i < bins_.size(); ++i)
        v[i] = bins_[i].start + 0.5 * bins_[i].duration;
    return v;
}

Vector BinnedSeries::net_counts() const
{
    Vector v(static_cast<Eigen::Index>(bins_.size()));
    for (std::size_t i = 0; i < bins_.size(); ++i)
        v[i] = static_cast<Real>(bins_[i].counts);
    return v;
}

Vector BinnedSeries::rates() const
{
    Vector v(static_cast<Eigen::Index>(bins_.size()));
    for (std::size_t i = 0; i < bins_.size(); ++i) v[i] = bins_[i].rate;
    return v;
}

BinnedSeries BinnedSeries::complete_bins() const
{
    BinnedSeries out(*this);
    if (out.has_partial_final_bin()) out.bins_.pop_back();
    return out;
}

RateSeries BinnedSeries::rate_series(bool include_partial) const
{
    std::size_t n = bins_.size();
    if (!include_partial && has_partial_final_bin()) --n;

    RateSeries rs;
    rs.start   .resize(static_cast<Eigen::Index>(n));
    rs.duration.resize(static_cast<Eigen::Index>(n));
    rs.rate    .resize(static_cast<Eigen::Index>(n));
    rs.counts  .resize(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        rs.start   [i] = bins_[i].start;
        rs.duration[i] = bins_[i].duration;
        rs.rate    [i] = bins_[i].rate;
        rs.counts  [i] = static_cast<Real>(bins_[i].counts);
    }
    return rs;
}

} // namespace xraylc
