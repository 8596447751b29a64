#include "xraylc/Analysis.hpp"
#include "xraylc/Errors.hpp"
#include "xraylc/LightcurveLoaders.hpp"
#include "xraylc/ThreadPool.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <iostream>
#include <thread>

namespace xraylc {

static std::string describe(const AnalysisError& e)
{
    return std::string(e.kind()) + ": " + e.message();
}

std::size_t AnalysisReport::n_flares() const
{
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
        [](const Event& e) { return e.kind == EventKind::Flare; }));
}

std::size_t AnalysisReport::n_eclipses() const
{
    return events.size() - n_flares();
}

/* ------------------------------------------------------------------------- */
/*  one observation, stage by stage                                          */
/* ------------------------------------------------------------------------- */
AnalysisReport analyze(const Observation& obs, const AnalysisConfig& cfg, std::string label)
{
    AnalysisReport rep;
    rep.source     = std::move(label);
    rep.meta       = obs.meta();
    rep.cumulative = cumulative_counts(obs);

    /* ---- 1. scalar statistics ----------------------------------------- */
    try {
        rep.stats = compute_stats(obs);
    } catch (const DegenerateObservation& e) {
        rep.stats_error = describe(e);
    }

    /* ---- 2. binning: everything below depends on it -------------------- */
    try {
        rep.binned = bin(obs, cfg.binning);
    } catch (const InvalidBinWidth& e) {
        rep.error = describe(e);
        return rep;
    } catch (const DegenerateObservation& e) {
        rep.error = describe(e);
        return rep;
    }

    /* ---- 3. running average of the rate -------------------------------- */
    try {
        rep.running_rate = running_average(rep.binned, cfg.statistics.running_window);
    } catch (const InvalidWindow& e) {
        rep.running_error = describe(e);
    }

    /* ---- 4. periodogram ------------------------------------------------ */
    if (cfg.run_psd) {
        PSDConfig pc = cfg.psd;
        pc.verbose   = pc.verbose && cfg.verbose;
        try {
            rep.psd = psd(rep.binned, pc);
        } catch (const AnalysisError& e) {
            rep.psd_error = describe(e);
        }
    }

    /* ---- 5. flares and eclipses ---------------------------------------- */
    if (cfg.run_events)
        rep.events = detect_events(rep.binned, cfg.events);

    if (cfg.verbose) {
        std::cout << "ObsID " << obs.meta().obsid
                  << ": " << rep.binned.size() << " bins of " << rep.binned.width() << " s, "
                  << rep.n_flares() << " flare(s), " << rep.n_eclipses() << " eclipse(s)";
        if (rep.psd && rep.psd->dominant)
            std::cout << ", period " << rep.psd->dominant->period << " s";
        std::cout << '\n';
    }
    return rep;
}

/* ------------------------------------------------------------------------- */
/*  many observations                                                        */
/* ------------------------------------------------------------------------- */
static unsigned resolve_threads(unsigned nthreads, std::size_t njobs)
{
    if (nthreads == 0) nthreads = std::max(1u, std::thread::hardware_concurrency());
    return static_cast<unsigned>(std::max<std::size_t>(1, std::min<std::size_t>(nthreads, njobs)));
}

std::vector<AnalysisReport> analyze_batch(const std::vector<Observation>& observations,
                                          const AnalysisConfig&           cfg,
                                          unsigned                        nthreads)
{
    std::vector<AnalysisReport> out;
    if (observations.empty()) return out;

    ThreadPool pool(resolve_threads(nthreads, observations.size()));

    std::vector<std::future<AnalysisReport>> jobs;
    jobs.reserve(observations.size());
    for (const auto& obs : observations)
        jobs.push_back(pool.enqueue([&obs, cfg] {
            const std::string name = "ObsID " + std::to_string(obs.meta().obsid);
            try {
                return analyze(obs, cfg, name);
            } catch (const std::exception& e) {
                AnalysisReport failed;
                failed.source = name;
                failed.error  = e.what();
                if (cfg.verbose)
                    std::cerr << "Failed to analyze " << name << ": " << e.what() << '\n';
                return failed;
            }
        }));

    out.reserve(jobs.size());
    for (auto& j : jobs) out.push_back(j.get());
    return out;
}

std::vector<AnalysisReport> analyze_files(const std::vector<std::string>& paths,
                                          const AnalysisConfig&           cfg,
                                          unsigned                        nthreads,
                                          const std::string&              format)
{
    std::vector<AnalysisReport> out;
    if (paths.empty()) return out;

    ThreadPool pool(resolve_threads(nthreads, paths.size()));

    std::vector<std::future<AnalysisReport>> jobs;
    jobs.reserve(paths.size());
    for (const auto& path : paths)
        jobs.push_back(pool.enqueue([&path, &format, cfg] {
            const std::string name = std::filesystem::path(path).filename().string();
            try {
                const Observation obs = load_lightcurve(path, format);
                return analyze(obs, cfg, name);
            } catch (const std::exception& e) {
                AnalysisReport failed;
                failed.source = name;
                failed.error  = e.what();
                if (cfg.verbose)
                    std::cerr << "Failed to analyze " << path << ": " << e.what() << '\n';
                return failed;
            }
        }));

    out.reserve(jobs.size());
    for (auto& j : jobs) out.push_back(j.get());
    return out;
}

} // namespace xraylc
