#include "xraylc/JsonUtils.hpp"
#include "xraylc/Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <vector>

namespace xraylc {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + path);
    nlohmann::json j;
    f >> j;
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ---------------------------------------------------------------------- */
/*  config                                                                */
/* ---------------------------------------------------------------------- */
template <class T>
static void read_opt(const nlohmann::json& j, const char* key, T& dst)
{
    if (j.contains(key)) dst = j.at(key).get<T>();
}

static void reject_unknown(const nlohmann::json& j, const char* section,
                           std::initializer_list<const char*> known)
{
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool ok = false;
        for (const char* k : known) ok = ok || it.key() == k;
        if (!ok)
            throw ConfigError(std::string("unknown option '") + it.key() + "' in " + section);
    }
}

AnalysisConfig config_from_json(const nlohmann::json& j)
{
    AnalysisConfig cfg;
    if (j.is_null()) return cfg;
    if (!j.is_object()) throw ConfigError("analysis configuration must be a JSON object");

    long long max_bins = static_cast<long long>(cfg.binning.max_bins);

    try {
        reject_unknown(j, "configuration",
                       {"binning", "statistics", "psd", "events", "runPsd", "runEvents", "verbose"});

        if (j.contains("binning")) {
            const auto& b = j.at("binning");
            reject_unknown(b, "binning", {"binWidth", "maxBins"});
            read_opt(b, "binWidth", cfg.binning.bin_width);
            read_opt(b, "maxBins",  max_bins);
        }

        if (j.contains("statistics")) {
            const auto& s = j.at("statistics");
            reject_unknown(s, "statistics", {"runningWindow"});
            read_opt(s, "runningWindow", cfg.statistics.running_window);
        }

        if (j.contains("psd")) {
            const auto& p = j.at("psd");
            reject_unknown(p, "psd", {"normalization", "detrend", "significanceSigma",
                                      "falseAlarmLevel", "minBins", "segmentBins", "maxBins",
                                      "smoothingWindow", "verbose"});
            if (p.contains("normalization"))
                cfg.psd.normalization = psd_normalization_from_string(p.at("normalization").get<std::string>());
            if (p.contains("detrend"))
                cfg.psd.detrend = detrend_from_string(p.at("detrend").get<std::string>());
            read_opt(p, "significanceSigma", cfg.psd.significance_sigma);
            read_opt(p, "falseAlarmLevel",   cfg.psd.false_alarm_level);
            read_opt(p, "minBins",           cfg.psd.min_bins);
            read_opt(p, "segmentBins",       cfg.psd.segment_bins);
            read_opt(p, "maxBins",           cfg.psd.max_bins);
            read_opt(p, "smoothingWindow",   cfg.psd.smoothing_window);
            read_opt(p, "verbose",           cfg.psd.verbose);
        }

        if (j.contains("events")) {
            const auto& e = j.at("events");
            reject_unknown(e, "events", {"baseline", "clipSigma", "clipIterations", "kFlare",
                                         "kEclipse", "minRunBins", "gapTolerance",
                                         "includePartialBin", "flares", "eclipses",
                                         "countStatistics", "verbose"});
            if (e.contains("baseline"))
                cfg.events.baseline = baseline_method_from_string(e.at("baseline").get<std::string>());
            read_opt(e, "clipSigma",         cfg.events.clip_sigma);
            read_opt(e, "clipIterations",    cfg.events.clip_iterations);
            read_opt(e, "kFlare",            cfg.events.k_flare);
            read_opt(e, "kEclipse",          cfg.events.k_eclipse);
            read_opt(e, "minRunBins",        cfg.events.min_run_bins);
            read_opt(e, "gapTolerance",      cfg.events.gap_tolerance);
            read_opt(e, "includePartialBin", cfg.events.include_partial_bin);
            read_opt(e, "flares",            cfg.events.detect_flares);
            read_opt(e, "eclipses",          cfg.events.detect_eclipses);
            read_opt(e, "countStatistics",   cfg.events.count_statistics);
            read_opt(e, "verbose",           cfg.events.verbose);
        }

        read_opt(j, "runPsd",    cfg.run_psd);
        read_opt(j, "runEvents", cfg.run_events);
        read_opt(j, "verbose",   cfg.verbose);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed analysis configuration: ") + e.what());
    }

    if (cfg.events.k_flare < 0.0 || cfg.events.k_eclipse < 0.0 || cfg.psd.significance_sigma < 0.0)
        throw ConfigError("threshold multipliers must be non-negative");
    if (max_bins < 1)
        throw ConfigError("binning.maxBins must be >= 1");
    cfg.binning.max_bins = static_cast<std::size_t>(max_bins);
    if (!(cfg.psd.false_alarm_level > 0.0))
        throw ConfigError("psd.falseAlarmLevel must be > 0");
    if (cfg.events.min_run_bins < 1)
        throw ConfigError("events.minRunBins must be >= 1");
    if (cfg.events.gap_tolerance < 0)
        throw ConfigError("events.gapTolerance must be >= 0");
    if (cfg.psd.segment_bins < 0 || cfg.psd.max_bins < 0 || cfg.psd.smoothing_window < 0)
        throw ConfigError("psd.segmentBins, psd.maxBins and psd.smoothingWindow must be >= 0");

    return cfg;
}

nlohmann::json config_to_json(const AnalysisConfig& cfg)
{
    return {
        {"binning",    {{"binWidth", cfg.binning.bin_width},
                        {"maxBins",  cfg.binning.max_bins}}},
        {"statistics", {{"runningWindow", cfg.statistics.running_window}}},
        {"psd", {
            {"normalization",     to_string(cfg.psd.normalization)},
            {"detrend",           to_string(cfg.psd.detrend)},
            {"significanceSigma", cfg.psd.significance_sigma},
            {"falseAlarmLevel",   cfg.psd.false_alarm_level},
            {"minBins",           cfg.psd.min_bins},
            {"segmentBins",       cfg.psd.segment_bins},
            {"maxBins",           cfg.psd.max_bins},
            {"smoothingWindow",   cfg.psd.smoothing_window},
            {"verbose",           cfg.psd.verbose}}},
        {"events", {
            {"baseline",          to_string(cfg.events.baseline)},
            {"clipSigma",         cfg.events.clip_sigma},
            {"clipIterations",    cfg.events.clip_iterations},
            {"kFlare",            cfg.events.k_flare},
            {"kEclipse",          cfg.events.k_eclipse},
            {"minRunBins",        cfg.events.min_run_bins},
            {"gapTolerance",      cfg.events.gap_tolerance},
            {"includePartialBin", cfg.events.include_partial_bin},
            {"flares",            cfg.events.detect_flares},
            {"eclipses",          cfg.events.detect_eclipses},
            {"countStatistics",   cfg.events.count_statistics},
            {"verbose",           cfg.events.verbose}}},
        {"runPsd",    cfg.run_psd},
        {"runEvents", cfg.run_events},
        {"verbose",   cfg.verbose}
    };
}

/* ---------------------------------------------------------------------- */
/*  results                                                               */
/* ---------------------------------------------------------------------- */
static std::vector<double> to_std(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

nlohmann::json stats_to_json(const ObservationStats& st)
{
    return {
        {"totalCounts", st.total_counts},
        {"nSamples",    st.n_samples},
        {"durationS",   st.duration_s},
        {"durationKs",  st.duration_ks},
        {"rateS",       st.rate_s},
        {"rateKs",      st.rate_ks}
    };
}

nlohmann::json event_to_json(const Event& ev)
{
    return {
        {"kind",                  to_string(ev.kind)},
        {"start",                 ev.start_time},
        {"end",                   ev.end_time},
        {"firstBin",              ev.first_bin},
        {"lastBin",               ev.last_bin},
        {"extremeBin",            ev.extreme_bin},
        {"extremeRate",           ev.extreme_rate},
        {"baseline",              ev.baseline},
        {"dispersion",            ev.dispersion},
        {"amplitude",             ev.amplitude},
        {"significance",          ev.significance},
        {"falseAlarmProbability", ev.false_alarm_probability}
    };
}

nlohmann::json psd_to_json(const PSDResult& r, bool include_spectrum)
{
    nlohmann::json j = {
        {"normalization",       to_string(r.normalization)},
        {"binWidth",            r.bin_width},
        {"nBins",               r.n_bins},
        {"nSegments",           r.n_segments},
        {"resolution",          r.resolution()},
        {"nyquist",             r.nyquist()},
        {"truncatedPartialBin", r.truncated_partial_bin},
        {"dominant",            nullptr}
    };
    if (r.dominant) {
        const auto& d = *r.dominant;
        j["dominant"] = {
            {"frequency",             d.frequency},
            {"period",                d.period},
            {"power",                 d.power},
            {"significance",          d.significance},
            {"falseAlarmProbability", d.false_alarm_probability}
        };
    }
    if (include_spectrum) {
        j["frequency"] = to_std(r.frequency);
        j["power"]     = to_std(r.power);
        if (r.smoothed_power.size()) {
            j["smoothedFrequency"] = to_std(r.smoothed_frequency);
            j["smoothedPower"]     = to_std(r.smoothed_power);
        }
    }
    return j;
}

nlohmann::json report_to_json(const AnalysisReport& rep, bool include_series)
{
    nlohmann::json j;
    j["source"] = rep.source;
    j["obsid"]  = rep.meta.obsid;
    j["ra"]     = rep.meta.ra;
    j["dec"]    = rep.meta.dec;
    j["galaxy"] = rep.meta.galaxy;
    if (!rep.meta.energy_band.empty()) j["band"] = rep.meta.energy_band;

    if (!rep.ok()) {
        j["error"] = rep.error;
        return j;
    }

    j["stats"] = rep.stats ? stats_to_json(*rep.stats) : nlohmann::json(nullptr);
    if (!rep.stats_error.empty()) j["statsError"] = rep.stats_error;

    nlohmann::json b = {
        {"binWidth",   rep.binned.width()},
        {"nBins",      rep.binned.size()},
        {"partialBin", rep.binned.has_partial_final_bin()}
    };
    if (include_series) {
        b["start"]  = to_std(rep.binned.start_times());
        b["counts"] = to_std(rep.binned.net_counts());
        b["rate"]   = to_std(rep.binned.rates());
        b["runningRate"] = to_std(rep.running_rate);
        j["cumulativeCounts"] = rep.cumulative;
    }
    j["binned"] = b;
    if (!rep.running_error.empty()) j["runningError"] = rep.running_error;

    j["psd"] = rep.psd ? psd_to_json(*rep.psd, include_series) : nlohmann::json(nullptr);
    if (!rep.psd_error.empty()) j["psdError"] = rep.psd_error;

    j["events"] = nlohmann::json::array();
    for (const auto& ev : rep.events) j["events"].push_back(event_to_json(ev));
    return j;
}

nlohmann::json reports_to_json(const std::vector<AnalysisReport>& reps, bool include_series)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : reps) arr.push_back(report_to_json(r, include_series));
    return arr;
}

} // namespace xraylc
