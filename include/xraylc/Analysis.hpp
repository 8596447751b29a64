#pragma once
#include "Types.hpp"
#include "Observation.hpp"
#include "Binning.hpp"
#include "Statistics.hpp"
#include "SpectralEstimator.hpp"
#include "EventDetector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xraylc {

// Everything one analysis pass needs, passed by value
struct AnalysisConfig
{
    BinningConfig    binning;
    StatisticsConfig statistics;
    PSDConfig        psd;
    EventConfig      events;
    bool             run_psd    = true;
    bool             run_events = true;
    bool             verbose    = true;
};

/*  Result of analyze().  A stage that fails leaves its slot empty and
 *  records "<ErrorKind>: <message>" in the matching *_error string; a
 *  failure to load or bin the observation is recorded in `error`.        */
struct AnalysisReport
{
    std::string                     source;        // file name or caller label
    ObservationMeta                 meta;
    std::optional<ObservationStats> stats;
    std::string                     stats_error;
    BinnedSeries                    binned;
    std::vector<Count>              cumulative;
    Vector                          running_rate;  // running average of the rate
    std::string                     running_error;
    std::optional<PSDResult>        psd;
    std::string                     psd_error;
    std::vector<Event>              events;
    std::string                     error;

    bool ok() const { return error.empty(); }
    std::size_t n_flares() const;
    std::size_t n_eclipses() const;
};

AnalysisReport analyze(const Observation&    obs,
                       const AnalysisConfig& cfg,
                       std::string           label = {});

// Independent observations on `nthreads` workers (0: hardware concurrency).
// Reports come back in input order.
std::vector<AnalysisReport> analyze_batch(const std::vector<Observation>& observations,
                                          const AnalysisConfig&           cfg,
                                          unsigned                        nthreads = 0);

// Load + analyze each file; a file that cannot be loaded yields a report
// with `error` set instead of aborting the batch.
std::vector<AnalysisReport> analyze_files(const std::vector<std::string>& paths,
                                          const AnalysisConfig&           cfg,
                                          unsigned                        nthreads = 0,
                                          const std::string&              format = "auto");

} // namespace xraylc
