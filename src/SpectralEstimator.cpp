#include "xraylc/SpectralEstimator.hpp"
#include "xraylc/Statistics.hpp"
#include "xraylc/Errors.hpp"

#include <unsupported/Eigen/FFT>
#include <boost/math/distributions/chi_squared.hpp>

#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <limits>
#include <vector>

namespace xraylc {

/* ------------------------------------------------------------------------- */
/*  option names                                                             */
/* ------------------------------------------------------------------------- */
std::string to_string(PSDNormalization n)
{
    switch (n) {
        case PSDNormalization::Density: return "density";
        case PSDNormalization::Leahy:   return "leahy";
        case PSDNormalization::Rms:     return "rms";
    }
    return "density";
}

std::string to_string(Detrend d)
{
    switch (d) {
        case Detrend::None:     return "none";
        case Detrend::Constant: return "constant";
        case Detrend::Linear:   return "linear";
    }
    return "constant";
}

PSDNormalization psd_normalization_from_string(const std::string& s)
{
    if (s == "density") return PSDNormalization::Density;
    if (s == "leahy")   return PSDNormalization::Leahy;
    if (s == "rms")     return PSDNormalization::Rms;
    throw ConfigError("unknown PSD normalization '" + s + "' (expected density | leahy | rms)");
}

Detrend detrend_from_string(const std::string& s)
{
    if (s == "none")     return Detrend::None;
    if (s == "constant") return Detrend::Constant;
    if (s == "linear")   return Detrend::Linear;
    throw ConfigError("unknown detrend mode '" + s + "' (expected none | constant | linear)");
}

/* ------------------------------------------------------------------------- */
/*  helpers                                                                  */
/* ------------------------------------------------------------------------- */
static void detrend_in_place(std::vector<Real>& x, Detrend mode)
{
    const std::size_t n = x.size();
    if (mode == Detrend::None || n == 0) return;

    if (mode == Detrend::Constant) {
        Real mu = 0.0;
        for (Real v : x) mu += v;
        mu /= static_cast<Real>(n);
        for (Real& v : x) v -= mu;
        return;
    }

    /* least-squares line through (i, x_i) */
    const Real xm = 0.5 * static_cast<Real>(n - 1);
    Real ym = 0.0;
    for (Real v : x) ym += v;
    ym /= static_cast<Real>(n);

    Real sxy = 0.0, sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Real dx = static_cast<Real>(i) - xm;
        sxy += dx * (x[i] - ym);
        sxx += dx * dx;
    }
    const Real slope = sxx > 0.0 ? sxy / sxx : 0.0;
    for (std::size_t i = 0; i < n; ++i)
        x[i] -= ym + slope * (static_cast<Real>(i) - xm);
}

/*  one-sided periodogram of a single segment, k = 1 … n/2               */
static Vector segment_periodogram(const RateSeries&  rs,
                                  Eigen::Index       first,
                                  Eigen::Index       n,
                                  Real               dt,
                                  const PSDConfig&   cfg,
                                  Eigen::FFT<Real>&  fft)
{
    std::vector<Real> x(static_cast<std::size_t>(n));
    Real rate_sum = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        x[static_cast<std::size_t>(i)] = rs.rate[first + i];
        rate_sum += rs.rate[first + i];
    }
    const Real mean_rate = rate_sum / static_cast<Real>(n);

    Real photons = 0.0;
    if (rs.counts.size() == rs.rate.size())
        photons = rs.counts.segment(first, n).sum();
    else
        photons = rate_sum * dt;

    detrend_in_place(x, cfg.detrend);

    std::vector<std::complex<Real>> X;
    fft.fwd(X, x);

    Real scale = 0.0;
    switch (cfg.normalization) {
        case PSDNormalization::Density:
            scale = 2.0 * dt / static_cast<Real>(n);
            break;
        case PSDNormalization::Leahy:
            if (!(photons > 0.0))
                throw DegenerateObservation("psd(): Leahy normalization needs a non-zero photon count");
            scale = 2.0 * dt * dt / photons;
            break;
        case PSDNormalization::Rms:
            if (mean_rate == 0.0)
                throw DegenerateObservation("psd(): rms normalization needs a non-zero mean rate");
            scale = 2.0 * dt / (static_cast<Real>(n) * mean_rate * mean_rate);
            break;
    }

    const Eigen::Index nf = n / 2;
    Vector p(nf);
    for (Eigen::Index k = 1; k <= nf; ++k) {
        Real pk = scale * std::norm(X[static_cast<std::size_t>(k)]);
        /* the Nyquist term has no mirror image in the one-sided sum */
        if ((n % 2 == 0) && k == nf && cfg.normalization != PSDNormalization::Leahy)
            pk *= 0.5;
        p[k - 1] = pk;
    }
    return p;
}

static std::optional<Periodicity> find_dominant(const PSDResult& r, const PSDConfig& cfg)
{
    const Eigen::Index nf = r.power.size();
    if (nf < 3) return std::nullopt;

    Eigen::Index ipk = 0;
    const Real pk = r.power.maxCoeff(&ipk);
    if (!(pk > 0.0)) return std::nullopt;

    /* background: every frequency except the candidate */
    Vector bg(nf - 1);
    for (Eigen::Index i = 0, j = 0; i < nf; ++i)
        if (i != ipk) bg[j++] = r.power[i];
    const Real mu = mean(bg);
    const Real sd = standard_deviation(bg, mu);

    if (!(pk > mu + cfg.significance_sigma * sd)) return std::nullopt;

    /* Noise powers averaged over M segments follow chi^2 with 2M dof scaled
       to their mean (2 for Leahy, the background mean otherwise).  The
       single-frequency tail is then taken over all nf frequencies searched. */
    const Real M = static_cast<Real>(r.n_segments);
    const Real ref = r.normalization == PSDNormalization::Leahy ? 2.0 : mu;
    const Real x = ref > 0.0 ? 2.0 * M * pk / ref : std::numeric_limits<Real>::infinity();
    Real p_single = 0.0;
    if (std::isfinite(x)) {
        const boost::math::chi_squared_distribution<Real> chi2(2.0 * M);
        p_single = boost::math::cdf(boost::math::complement(chi2, x));
    }
    const Real fap =
        -std::expm1(static_cast<Real>(nf) * std::log1p(-std::min(p_single, 1.0 - 1e-16)));

    if (!(fap < cfg.false_alarm_level)) {
        if (cfg.verbose)
            std::cout << "psd(): strongest peak at " << r.frequency[ipk]
                      << " Hz has false-alarm probability " << fap << ", none reported\n";
        return std::nullopt;
    }

    Periodicity d;
    d.index        = static_cast<std::size_t>(ipk);
    d.frequency    = r.frequency[ipk];
    d.period       = 1.0 / d.frequency;
    d.power        = pk;
    d.significance = sd > 0.0 ? (pk - mu) / sd : std::numeric_limits<Real>::infinity();
    d.false_alarm_probability = fap;
    return d;
}

/* ========================================================================= */
/*  public interface                                                         */
/* ========================================================================= */
PSDResult psd(const RateSeries& series, Real dt, const PSDConfig& cfg)
{
    if (!(dt > 0.0) || !std::isfinite(dt))
        throw InvalidBinWidth("psd(): bin width must be a positive finite number");

    const RateSeries& rs = series;
    bool truncated = false;

    Eigen::Index n = rs.size();
    if (n > 0 && rs.duration.size() == n && rs.duration[n - 1] < dt * (1.0 - 1e-9)) {
        --n;
        truncated = true;
        if (cfg.verbose)
            std::cerr << "Warning: psd(): dropping partial final bin ("
                      << rs.duration[n] << " s of " << dt << " s) before the transform\n";
    }

    for (Eigen::Index i = 0; i < n && rs.duration.size() == rs.size(); ++i)
        if (std::abs(rs.duration[i] - dt) > 1e-9 * dt)
            throw InvalidBinWidth("psd(): series is not uniformly binned at the given width");

    /* ---- segment layout ---------------------------------------------- */
    Eigen::Index seg = n;
    if (cfg.segment_bins > 0) {
        seg = std::min<Eigen::Index>(cfg.segment_bins, n);
    } else if (cfg.max_bins > 0 && n > cfg.max_bins) {
        seg = cfg.max_bins;
        if (cfg.verbose)
            std::cerr << "Warning: psd(): " << n << " bins exceed the limit of "
                      << cfg.max_bins << ", averaging segment periodograms\n";
    }

    if (seg < std::max(cfg.min_bins, 2))
        throw InsufficientData("psd(): need at least " + std::to_string(std::max(cfg.min_bins, 2))
                               + " complete bins per segment, have " + std::to_string(seg));

    const Eigen::Index nseg = n / seg;
    if (cfg.verbose && nseg * seg < n)
        std::cerr << "Warning: psd(): " << (n - nseg * seg)
                  << " trailing bins do not fill a segment and are ignored\n";

    /* ---- transform + average ----------------------------------------- */
    Eigen::FFT<Real> fft;
    Vector acc = Vector::Zero(seg / 2);
    for (Eigen::Index s = 0; s < nseg; ++s)
        acc += segment_periodogram(rs, s * seg, seg, dt, cfg, fft);

    PSDResult out;
    out.power = acc / static_cast<Real>(nseg);
    out.frequency.resize(seg / 2);
    for (Eigen::Index k = 0; k < seg / 2; ++k)
        out.frequency[k] = static_cast<Real>(k + 1) / (static_cast<Real>(seg) * dt);

    out.bin_width             = dt;
    out.n_bins                = static_cast<std::size_t>(nseg * seg);
    out.n_segments            = static_cast<int>(nseg);
    out.normalization         = cfg.normalization;
    out.truncated_partial_bin = truncated;

    if (cfg.smoothing_window > out.power.size()) {
        if (cfg.verbose)
            std::cerr << "Warning: psd(): smoothing window of " << cfg.smoothing_window
                      << " exceeds the " << out.power.size() << " frequencies, not smoothing\n";
    } else if (cfg.smoothing_window > 0) {
        out.smoothed_power     = running_average(out.power,     cfg.smoothing_window);
        out.smoothed_frequency = running_average(out.frequency, cfg.smoothing_window);
    }

    out.dominant = find_dominant(out, cfg);
    return out;
}

PSDResult psd(const BinnedSeries& series, const PSDConfig& cfg)
{
    if (series.empty())
        throw InsufficientData("psd(): empty binned series");
    return psd(series.rate_series(/*include_partial=*/true), series.width(), cfg);
}

} // namespace xraylc
