#pragma once
#include "Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xraylc {

// One time-tagged count measurement
struct Sample {
    Real  time   = 0.0;   // s since observation start
    Count counts = 0;     // photons, >= 0
};

struct ObservationMeta {
    long long             obsid = 0;
    Real                  ra    = 0.0;      // J2000, degrees [0, 360)
    Real                  dec   = 0.0;      // J2000, degrees [-90, 90]
    std::string           galaxy;
    std::string           energy_band;      // "lower:upper" keV, informational
    std::optional<Real>   exposure_start;   // defaults to first sample
    std::optional<Real>   exposure_end;     // defaults to last sample + cadence
};

/*
 *  Immutable, time-ordered lightcurve.
 *
 *  The constructor sorts the input by time (stable), sums the counts of
 *  samples that share a timestamp and validates everything else.  It throws
 *  InvalidObservation for
 *      - an empty sample list,
 *      - negative counts,
 *      - non-finite timestamps (these cannot be ordered),
 *      - coordinates outside their J2000 ranges,
 *      - an exposure window that is inverted or does not contain the samples.
 */
class Observation {
public:
    Observation(std::vector<Sample> samples, ObservationMeta meta);

    const std::vector<Sample>& samples() const { return samples_; }
    const ObservationMeta&     meta()    const { return meta_; }

    std::size_t size() const { return samples_.size(); }
    Real first_time() const { return samples_.front().time; }
    Real last_time()  const { return samples_.back().time; }

    /* last − first timestamp; zero for a single-sample observation */
    Real time_span() const { return last_time() - first_time(); }

    /* median positive spacing between consecutive samples (0 if none) */
    Real cadence() const { return cadence_; }

    Real exposure_start() const { return exposure_start_; }
    Real exposure_end()   const { return exposure_end_; }

    Count total_counts() const { return total_counts_; }

    Vector times() const;
    Vector counts() const;

private:
    std::vector<Sample> samples_;
    ObservationMeta     meta_;
    Real                cadence_        = 0.0;
    Real                exposure_start_ = 0.0;
    Real                exposure_end_   = 0.0;
    Count               total_counts_   = 0;
};

} // namespace xraylc
