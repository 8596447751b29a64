#pragma once
#include "Types.hpp"
#include "Observation.hpp"
#include <vector>

namespace xraylc {

struct Bin {
    Real        start     = 0.0;   // s, inclusive
    Real        duration  = 0.0;   // actual length; < width only for the partial bin
    Count       counts    = 0;     // net counts
    Real        rate      = 0.0;   // counts / duration
    std::size_t n_samples = 0;     // samples that fell into the bin
    bool        partial   = false; // final bin shorter than the nominal width
};

/*  Plain time / rate columns.  This is what the spectral estimator and the
 *  event detector actually consume; `counts` may be left empty for series
 *  that were not derived from photon counts.                               */
struct RateSeries {
    Vector start;
    Vector duration;
    Vector rate;
    Vector counts;

    Eigen::Index size() const { return rate.size(); }
};

/*
 *  Count series on uniform half-open bins [start, start + width).
 *
 *  Only bin() creates a populated series.  A BinnedSeries is never updated:
 *  a different width means a new call to bin().
 */
class BinnedSeries {
public:
    BinnedSeries() = default;

    Real width() const { return width_; }
    const std::vector<Bin>& bins() const { return bins_; }
    std::size_t size() const { return bins_.size(); }
    bool empty() const { return bins_.empty(); }

    bool has_partial_final_bin() const { return !bins_.empty() && bins_.back().partial; }

    Count total_counts() const;

    Vector start_times() const;
    Vector centres() const;
    Vector net_counts() const;
    Vector rates() const;

    /* copy without the flagged partial bin (identity if there is none) */
    BinnedSeries complete_bins() const;

    RateSeries rate_series(bool include_partial = true) const;

private:
    friend BinnedSeries bin(const Observation&, Real, std::size_t);

    Real             width_ = 0.0;
    std::vector<Bin> bins_;
};

struct BinningConfig {
    Real        bin_width = 500.0;                  // s
    std::size_t max_bins  = std::size_t{1} << 24;   // upper bound on the series length
};

// Throws InvalidBinWidth for width <= 0 (or NaN / inf) or a width that
// would need more than max_bins bins, and DegenerateObservation when the
// exposure has zero length.
BinnedSeries bin(const Observation& obs, Real bin_width,
                 std::size_t max_bins = BinningConfig{}.max_bins);
BinnedSeries bin(const Observation& obs, const BinningConfig& cfg);

} // namespace xraylc
