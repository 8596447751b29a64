#pragma once
#include "Types.hpp"
#include "Binning.hpp"
#include "Statistics.hpp"
#include <string>
#include <vector>

namespace xraylc {

enum class EventKind { Flare, Eclipse };

std::string to_string(EventKind k);

struct Event {
    EventKind   kind        = EventKind::Flare;
    std::size_t first_bin   = 0;       // inclusive
    std::size_t last_bin    = 0;       // inclusive
    Real        start_time  = 0.0;     // start of first bin
    Real        end_time    = 0.0;     // end of last bin
    std::size_t extreme_bin = 0;       // peak (flare) or trough (eclipse)
    Real        extreme_rate = 0.0;
    Real        baseline     = 0.0;
    Real        dispersion   = 0.0;
    Real        amplitude    = 0.0;    // extreme_rate − baseline (negative for eclipses)
    Real        significance = 0.0;    // |amplitude| / dispersion
    Real        false_alarm_probability = 0.0;  // Poisson, NaN without counts

    Real duration() const { return end_time - start_time; }
    std::size_t n_bins() const { return last_bin - first_bin + 1; }
};

struct EventConfig {
    BaselineMethod baseline            = BaselineMethod::MedianMAD;
    Real           clip_sigma          = 3.0;
    int            clip_iterations     = 5;
    Real           k_flare             = 3.0;
    Real           k_eclipse           = 3.0;
    int            min_run_bins        = 1;
    int            gap_tolerance       = 2;     // merge runs separated by fewer bins
    bool           include_partial_bin = false;
    bool           detect_flares       = true;
    bool           detect_eclipses     = true;
    bool           count_statistics    = true;  // Poisson floor and tail test when counts are known
    bool           verbose             = false;
};

/*
 *  Single threshold scan over the rate series.
 *
 *  Flares are found first: maximal runs above baseline + k_flare·dispersion,
 *  merged across short gaps.  Eclipses are then searched among the bins no
 *  flare claimed, below baseline − k_eclipse·dispersion.  The returned list
 *  is ordered by start time.  A series shorter than min_run_bins, or a
 *  constant one, gives an empty list.
 *
 *  A zero MAD on a non-constant series falls back to the sigma-clipped
 *  baseline.  With count_statistics and a counts column the dispersion is
 *  floored at the Poisson value sqrt(max(level·dt, 1))/dt, and a bin only
 *  qualifies when its Poisson tail probability is below the one-sided
 *  Gaussian tail of k sigma divided by the number of bins.
 */
std::vector<Event> detect_events(const RateSeries& series, const EventConfig& cfg = {});
std::vector<Event> detect_events(const BinnedSeries& series, const EventConfig& cfg = {});

} // namespace xraylc
