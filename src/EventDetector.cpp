#include "xraylc/EventDetector.hpp"
#include "xraylc/Errors.hpp"

#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace xraylc {

std::string to_string(EventKind k)
{
    return k == EventKind::Flare ? "flare" : "eclipse";
}

namespace {

struct Run { Eigen::Index first, last; };

/*  Maximal runs of `hit` bins.  Runs separated by fewer than `gap_tol`
 *  bins are joined unless a bin in between is `blocked`.              */
std::vector<Run> find_runs(const std::vector<bool>& hit,
                           const std::vector<bool>& blocked,
                           int                      gap_tol)
{
    std::vector<Run> runs;
    const auto n = static_cast<Eigen::Index>(hit.size());

    for (Eigen::Index i = 0; i < n; ) {
        if (!hit[i]) { ++i; continue; }
        Eigen::Index j = i;
        while (j + 1 < n && hit[j + 1]) ++j;
        runs.push_back({i, j});
        i = j + 1;
    }

    std::vector<Run> merged;
    for (const auto& r : runs) {
        if (!merged.empty()) {
            Run& prev = merged.back();
            const Eigen::Index gap = r.first - prev.last - 1;
            bool clear = gap < gap_tol;
            for (Eigen::Index g = prev.last + 1; clear && g < r.first; ++g)
                if (blocked[g]) clear = false;
            if (clear) { prev.last = r.last; continue; }
        }
        merged.push_back(r);
    }
    return merged;
}

Event make_event(EventKind         kind,
                 const Run&        run,
                 const RateSeries& rs,
                 const Baseline&   base)
{
    Event ev;
    ev.kind      = kind;
    ev.first_bin = static_cast<std::size_t>(run.first);
    ev.last_bin  = static_cast<std::size_t>(run.last);

    Eigen::Index ext = run.first;
    for (Eigen::Index i = run.first; i <= run.last; ++i) {
        const bool better = kind == EventKind::Flare ? rs.rate[i] > rs.rate[ext]
                                                     : rs.rate[i] < rs.rate[ext];
        if (better) ext = i;
    }

    ev.start_time   = rs.start[run.first];
    ev.end_time     = rs.start[run.last] + rs.duration[run.last];
    ev.extreme_bin  = static_cast<std::size_t>(ext);
    ev.extreme_rate = rs.rate[ext];
    ev.baseline     = base.level;
    ev.dispersion   = base.dispersion;
    ev.amplitude    = ev.extreme_rate - base.level;
    ev.significance = std::abs(ev.amplitude) / base.dispersion;

    ev.false_alarm_probability = std::numeric_limits<Real>::quiet_NaN();
    if (rs.counts.size() == rs.rate.size()) {
        const Real  mu = base.level * rs.duration[ext];
        const Count k  = static_cast<Count>(std::llround(rs.counts[ext]));
        ev.false_alarm_probability = kind == EventKind::Flare ? poisson_upper_tail(mu, k)
                                                              : poisson_lower_tail(mu, k);
    }
    return ev;
}

} // unnamed namespace

/* ------------------------------------------------------------------------- */
std::vector<Event> detect_events(const RateSeries& rs, const EventConfig& cfg)
{
    std::vector<Event> events;
    const Eigen::Index n = rs.size();

    if (rs.start.size() != n || rs.duration.size() != n)
        throw InvalidObservation("detect_events(): start / duration / rate columns differ in length");

    if (n == 0 || n < std::max(cfg.min_run_bins, 1))
        return events;

    if (rs.rate.maxCoeff() == rs.rate.minCoeff()) {
        if (cfg.verbose)
            std::cout << "detect_events(): constant rate " << rs.rate[0] << ", no events\n";
        return events;
    }

    Baseline base = estimate_baseline(rs.rate, cfg.baseline,
                                      cfg.clip_sigma, cfg.clip_iterations);

    // Sparse count data: more than half the bins share one value and the MAD vanishes.
    if (!(base.dispersion > 0.0) && cfg.baseline == BaselineMethod::MedianMAD) {
        base = estimate_baseline(rs.rate, BaselineMethod::SigmaClip,
                                 cfg.clip_sigma, cfg.clip_iterations);
        if (cfg.verbose)
            std::cout << "detect_events(): MAD is zero, using the sigma-clipped baseline\n";
    }

    const bool have_counts = cfg.count_statistics && rs.counts.size() == n;
    if (have_counts) {
        const Real dt = median(rs.duration);
        if (dt > 0.0) {
            const Real poisson_sd = std::sqrt(std::max(base.level * dt, Real(1))) / dt;
            base.dispersion = std::max(base.dispersion, poisson_sd);
        }
    }

    if (!(base.dispersion > 0.0) || !std::isfinite(base.dispersion)) {
        if (cfg.verbose)
            std::cout << "detect_events(): zero dispersion around baseline "
                      << base.level << ", no events\n";
        return events;
    }

    // Per-bin Poisson tail limit: the one-sided Gaussian tail of k sigma,
    // shared out over the n bins searched.
    const boost::math::normal_distribution<Real> unit;
    auto tail_limit = [&](Real k) {
        return boost::math::cdf(boost::math::complement(unit, k)) / static_cast<Real>(n);
    };
    const Real flare_limit   = tail_limit(cfg.k_flare);
    const Real eclipse_limit = tail_limit(cfg.k_eclipse);

    auto poisson_ok = [&](EventKind kind, Eigen::Index i) {
        if (!have_counts) return true;
        const Real  mu = base.level * rs.duration[i];
        const Count k  = static_cast<Count>(std::llround(rs.counts[i]));
        return kind == EventKind::Flare ? poisson_upper_tail(mu, k) < flare_limit
                                        : poisson_lower_tail(mu, k) < eclipse_limit;
    };

    std::vector<bool> claimed(static_cast<std::size_t>(n), false);

    auto scan = [&](EventKind kind, Real threshold) {
        std::vector<bool> hit(static_cast<std::size_t>(n), false);
        for (Eigen::Index i = 0; i < n; ++i) {
            if (claimed[i]) continue;
            hit[i] = (kind == EventKind::Flare ? rs.rate[i] > threshold
                                               : rs.rate[i] < threshold)
                     && poisson_ok(kind, i);
        }
        for (const auto& run : find_runs(hit, claimed, cfg.gap_tolerance)) {
            if (run.last - run.first + 1 < cfg.min_run_bins) continue;
            for (Eigen::Index i = run.first; i <= run.last; ++i) claimed[i] = true;
            events.push_back(make_event(kind, run, rs, base));
        }
    };

    if (cfg.detect_flares)
        scan(EventKind::Flare,   base.level + cfg.k_flare   * base.dispersion);
    if (cfg.detect_eclipses)
        scan(EventKind::Eclipse, base.level - cfg.k_eclipse * base.dispersion);

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return a.start_time < b.start_time; });

    if (cfg.verbose)
        std::cout << "detect_events(): baseline " << base.level << " +/- " << base.dispersion
                  << ", " << events.size() << " event(s)\n";
    return events;
}

std::vector<Event> detect_events(const BinnedSeries& series, const EventConfig& cfg)
{
    return detect_events(series.rate_series(cfg.include_partial_bin), cfg);
}

} // namespace xraylc
