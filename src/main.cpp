#include "xraylc/Analysis.hpp"
#include "xraylc/Coordinates.hpp"
#include "xraylc/JsonUtils.hpp"
#include "xraylc/LightcurveLoaders.hpp"
#include "xraylc/ObservationRepository.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

namespace fs = std::filesystem;
using namespace xraylc;

// Load every file into a repository and pick the requested observations
static std::vector<Observation> select_observations(const std::vector<std::string>& files,
                                                    const std::string&              format,
                                                    const cxxopts::ParseResult&     cli)
{
    InMemoryRepository repo;
    for (const auto& f : files) {
        try {
            auto obs = std::make_shared<const Observation>(load_lightcurve(f, format));
            const long long id = obs->meta().obsid;
            if (!repo.try_insert(std::move(obs)))
                std::cerr << "Warning: " << f << " has ObsID " << id
                          << ", already taken by an earlier file; skipping it\n";
        } catch (const std::exception& ex) {
            std::cerr << "Failed to read lightcurve " << f << ": " << ex.what() << '\n';
        }
    }
    std::cout << "Repository holds " << repo.size() << " observation(s)\n";

    std::vector<ObservationPtr> picked;
    if (cli.count("obsid")) {
        for (long long id : cli["obsid"].as<std::vector<long long>>())
            if (auto p = repo.find_by_obsid(id)) picked.push_back(p);
            else std::cerr << "ObsID " << id << " not found\n";
    } else if (cli.count("near")) {
        const SkyPosition centre = to_degrees(cli["near"].as<std::string>());
        picked = repo.find_near(centre, cli["radius"].as<double>() / 60.0);
    } else {
        picked = repo.find_by_galaxy(cli["galaxy"].as<std::string>());
    }

    std::vector<Observation> out;
    out.reserve(picked.size());
    for (const auto& p : picked) out.push_back(*p);
    return out;
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("xraylc", "X-ray lightcurve binning, periodogram and flare / eclipse detection");
        opts.add_options()
            ("files", "Lightcurve files (.txt table or .clc JSON)", cxxopts::value<std::vector<std::string>>())
            ("config", "Analysis configuration JSON", cxxopts::value<std::string>())
            ("b,bin-width", "Bin width in seconds (overrides the configuration)", cxxopts::value<double>())
            ("format", "Input format: auto | ascii | clc", cxxopts::value<std::string>()->default_value("auto"))
            ("threads", "Number of threads", cxxopts::value<unsigned>()->default_value("0"))
            ("o,output", "Write JSON reports to this file (default: stdout)", cxxopts::value<std::string>())
            ("summary", "Leave per-bin series and spectra out of the report")
            ("obsid", "Only analyze these ObsIDs", cxxopts::value<std::vector<long long>>())
            ("near", "Only analyze sources near 'HH MM SS +DD MM SS'", cxxopts::value<std::string>())
            ("radius", "Search radius for --near in arcmin", cxxopts::value<double>()->default_value("1.0"))
            ("galaxy", "Only analyze sources in this galaxy", cxxopts::value<std::string>())
            ("print-config", "Print the effective configuration and exit")
            ("h,help", "Show help");
        opts.parse_positional({"files"});
        opts.positional_help("<lightcurve> [<lightcurve> ...]");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        // Configuration
        AnalysisConfig cfg;
        if (cli.count("config")) {
            auto j = load_json(cli["config"].as<std::string>());
            expand_env(j);
            cfg = config_from_json(j);
            std::cout << "Loaded config from: " << cli["config"].as<std::string>() << '\n';
        }
        if (cli.count("bin-width"))
            cfg.binning.bin_width = cli["bin-width"].as<double>();

        if (cli.count("print-config")) {
            std::cout << config_to_json(cfg).dump(2) << '\n';
            return 0;
        }
        if (!cli.count("files")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        unsigned nthreads = cli["threads"].as<unsigned>();
        if (nthreads == 0) nthreads = std::thread::hardware_concurrency();

        const auto files  = cli["files"].as<std::vector<std::string>>();
        const auto format = cli["format"].as<std::string>();

        // Analysis
        std::vector<AnalysisReport> reports;
        if (cli.count("obsid") || cli.count("near") || cli.count("galaxy"))
            reports = analyze_batch(select_observations(files, format, cli), cfg, nthreads);
        else
            reports = analyze_files(files, cfg, nthreads, format);

        // Output
        const auto j = reports_to_json(reports, cli.count("summary") == 0);
        if (cli.count("output")) {
            const fs::path out = cli["output"].as<std::string>();
            if (out.has_parent_path()) fs::create_directories(out.parent_path());
            std::ofstream f(out);
            if (!f.is_open()) throw std::runtime_error("Cannot write: " + out.string());
            f << j.dump(2) << '\n';
            std::cout << "Wrote " << reports.size() << " report(s) to " << out << '\n';
        } else {
            std::cout << j.dump(2) << '\n';
        }

        std::size_t failed = 0, flagged = 0;
        for (const auto& r : reports) {
            if (!r.ok()) ++failed;
            else if (!r.events.empty()) ++flagged;
        }
        std::cout << "\n" << reports.size() << " lightcurve(s): " << flagged
                  << " with events, " << failed << " failed\n";

        if (failed == reports.size() && !reports.empty()) return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "Took: " << duration / 1000.0 << " s\n";

    return 0;
}
