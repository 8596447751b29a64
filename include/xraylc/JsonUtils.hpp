#pragma once
#include "xraylc/Analysis.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xraylc {

nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/*  Analysis options.  Every key is optional; absent keys keep the
 *  defaults of AnalysisConfig:
 *
 *    { "binning":    { "binWidth": 500, "maxBins": 16777216 },
 *      "statistics": { "runningWindow": 5 },
 *      "psd":        { "normalization": "density", "detrend": "constant",
 *                      "significanceSigma": 3, "falseAlarmLevel": 0.001,
 *                      "minBins": 8, "segmentBins": 0,
 *                      "maxBins": 1048576, "smoothingWindow": 0 },
 *      "events":     { "baseline": "median_mad", "clipSigma": 3,
 *                      "clipIterations": 5, "kFlare": 3, "kEclipse": 3,
 *                      "minRunBins": 1, "gapTolerance": 2,
 *                      "includePartialBin": false,
 *                      "flares": true, "eclipses": true,
 *                      "countStatistics": true },
 *      "runPsd": true, "runEvents": true, "verbose": true }
 *
 *  Wrong value types and unknown option names throw ConfigError.      */
AnalysisConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const AnalysisConfig& cfg);

nlohmann::json stats_to_json(const ObservationStats& st);
nlohmann::json event_to_json(const Event& ev);
nlohmann::json psd_to_json(const PSDResult& r, bool include_spectrum = true);

// include_series = false drops the per-bin columns and the spectrum
nlohmann::json report_to_json(const AnalysisReport& rep, bool include_series = true);
nlohmann::json reports_to_json(const std::vector<AnalysisReport>& reps, bool include_series = true);

} // namespace xraylc
