#pragma once
#include "Types.hpp"
#include "Binning.hpp"
#include <optional>
#include <string>

namespace xraylc {

enum class PSDNormalization {
    Density,    // one-sided PSD, (counts/s)^2 / Hz
    Leahy,      // 2 |FFT(counts)|^2 / N_photons ; white noise -> mean 2
    Rms         // fractional rms^2 / Hz
};

enum class Detrend { None, Constant, Linear };

std::string      to_string(PSDNormalization n);
std::string      to_string(Detrend d);
PSDNormalization psd_normalization_from_string(const std::string& s);   // ConfigError
Detrend          detrend_from_string(const std::string& s);             // ConfigError

struct PSDConfig {
    PSDNormalization normalization      = PSDNormalization::Density;
    Detrend          detrend            = Detrend::Constant;
    Real             significance_sigma = 3.0;      // k in  mean_bg + k·std_bg
    Real             false_alarm_level  = 1e-3;     // peak must also have FAP below this
    int              min_bins           = 8;        // per segment
    int              segment_bins       = 0;        // 0: one segment over the whole series
    int              max_bins           = 1 << 20;  // longer series are split into segments
    int              smoothing_window   = 0;        // 0: no smoothed spectrum
    bool             verbose            = true;
};

struct Periodicity {
    std::size_t index                   = 0;     // into PSDResult::frequency
    Real        frequency               = 0.0;   // Hz
    Real        period                  = 0.0;   // s
    Real        power                   = 0.0;
    Real        significance            = 0.0;   // (power − mean_bg) / std_bg
    Real        false_alarm_probability = 0.0;   // over all frequencies searched
};

struct PSDResult {
    Vector                     frequency;          // k / (N·dt), k = 1 … N/2
    Vector                     power;
    Vector                     smoothed_frequency; // empty unless smoothing was requested
    Vector                     smoothed_power;
    Real                       bin_width             = 0.0;
    std::size_t                n_bins                = 0;   // bins that entered the transform
    int                        n_segments            = 0;
    PSDNormalization           normalization         = PSDNormalization::Density;
    bool                       truncated_partial_bin = false;
    std::optional<Periodicity> dominant;

    Real resolution() const { return frequency.size() ? frequency[0] : 0.0; }
    Real nyquist() const { return bin_width > 0.0 ? 0.5 / bin_width : 0.0; }
    Vector periods() const { return frequency.cwiseInverse(); }
};

/*  Periodogram of the count-rate series.
 *
 *  A flagged partial final bin is dropped before the transform (with a
 *  warning when cfg.verbose is set) and the result records the truncation.
 *
 *  The strongest peak is reported as dominant only when it exceeds
 *  mean_bg + k·std_bg of the other frequencies and its false-alarm
 *  probability, taken over every frequency searched, is below
 *  cfg.false_alarm_level.  A smoothing window wider than the spectrum is
 *  skipped and the raw powers are kept.
 *  Throws InsufficientData when fewer than cfg.min_bins bins are left per
 *  segment and DegenerateObservation for normalizations that divide by a
 *  zero photon count or mean rate.                                        */
PSDResult psd(const BinnedSeries& series, const PSDConfig& cfg = {});

/* same, for plain rate columns on a uniform grid of width `bin_width` */
PSDResult psd(const RateSeries& series, Real bin_width, const PSDConfig& cfg = {});

} // namespace xraylc
