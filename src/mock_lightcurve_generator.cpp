// src/mock_lightcurve_generator.cpp
//
// Writes synthetic Poisson lightcurves (text tables named after a J2000
// designation and ObsID) plus a truth file listing what was injected.

#include "xraylc/Coordinates.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace xraylc;

static constexpr double kPi = 3.14159265358979323846;

// Parameter distribution types
enum class DistributionType {
    Fixed,
    Gaussian,
    Uniform
};

// "value" | "mean,sigma" | "min:max"
struct ParameterConfig {
    DistributionType type = DistributionType::Fixed;
    double value = 0.0;
    double error = 0.0;  // for Gaussian
    double min = 0.0;    // for Uniform
    double max = 0.0;    // for Uniform

    double sample(std::mt19937& rng) const {
        switch(type) {
            case DistributionType::Fixed:
                return value;
            case DistributionType::Gaussian: {
                std::normal_distribution<> dist(value, error);
                return dist(rng);
            }
            case DistributionType::Uniform: {
                std::uniform_real_distribution<> dist(min, max);
                return dist(rng);
            }
        }
        return value;
    }

    static ParameterConfig from_string(const std::string& str) {
        ParameterConfig config;
        if (auto pos = str.find(','); pos != std::string::npos) {
            config.type  = DistributionType::Gaussian;
            config.value = std::stod(str.substr(0, pos));
            config.error = std::stod(str.substr(pos + 1));
        } else if (auto pos2 = str.find(':'); pos2 != std::string::npos) {
            config.type = DistributionType::Uniform;
            config.min  = std::stod(str.substr(0, pos2));
            config.max  = std::stod(str.substr(pos2 + 1));
        } else {
            config.value = std::stod(str);
        }
        return config;
    }
};

// Rate multiplier over [start, end): > 1 flare, < 1 eclipse
struct Injection {
    std::string kind;
    double start  = 0.0;
    double end    = 0.0;
    double factor = 1.0;
};

// "start:end:factor"
static Injection parse_injection(const std::string& kind, const std::string& s)
{
    std::vector<double> f;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ':')) f.push_back(std::stod(tok));
    if (f.size() != 3 || !(f[1] > f[0]) || f[2] < 0.0)
        throw std::invalid_argument("bad " + kind + " specification '" + s
                                    + "' (expected start:end:factor with end > start)");
    return {kind, f[0], f[1], f[2]};
}

struct MockConfig {
    int             num_lightcurves = 1;
    long long       first_obsid     = 10000;
    double          duration        = 20000.0;          // s
    double          cadence         = 3.24104;          // s, ACIS full-frame time
    ParameterConfig rate{DistributionType::Fixed, 0.1}; // background counts / s
    double          period          = 0.0;              // s, 0: no modulation
    double          modulation      = 0.0;              // fractional amplitude
    double          dead_fraction   = 0.0;              // rows written with zero exposure
    std::vector<Injection> injections;
    std::string     output_dir = "./mock_lightcurves/";
    unsigned        seed       = 42;
};

static std::string designation(std::mt19937& rng)
{
    std::uniform_int_distribution<int> h(0, 23), m(0, 59), d(0, 89);
    std::uniform_real_distribution<double> sec(0.0, 59.99), arcsec(0.0, 59.9);
    std::bernoulli_distribution neg(0.5);

    std::ostringstream os;
    os << 'J' << std::setfill('0')
       << std::setw(2) << h(rng) << std::setw(2) << m(rng)
       << std::setw(5) << std::fixed << std::setprecision(2) << sec(rng)
       << (neg(rng) ? '-' : '+')
       << std::setw(2) << d(rng) << std::setw(2) << m(rng)
       << std::setw(4) << std::setprecision(1) << arcsec(rng);
    return os.str();
}

static nlohmann::json write_lightcurve(const MockConfig& cfg, int index, std::mt19937& rng)
{
    const long long obsid = cfg.first_obsid + index;
    const double    base  = std::max(0.0, cfg.rate.sample(rng));
    const fs::path  path  = fs::path(cfg.output_dir) / (designation(rng) + "_" + std::to_string(obsid) + "_lc.txt");
    const SourceName source = parse_source_name(path.string());

    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot write: " + path.string());
    out << "TIME COUNTS EXPOSURE\n";

    std::bernoulli_distribution dead(cfg.dead_fraction);
    const auto nrow = static_cast<long long>(std::floor(cfg.duration / cfg.cadence));
    long long total = 0;

    for (long long i = 0; i < nrow; ++i) {
        const double t = static_cast<double>(i) * cfg.cadence;
        if (cfg.dead_fraction > 0.0 && dead(rng)) {
            out << std::setprecision(10) << t << " 0 0\n";
            continue;
        }

        double rate = base;
        if (cfg.period > 0.0)
            rate *= 1.0 + cfg.modulation * std::sin(2.0 * kPi * t / cfg.period);
        for (const auto& inj : cfg.injections)
            if (t >= inj.start && t < inj.end) rate *= inj.factor;

        long long c = 0;
        if (rate > 0.0) {
            std::poisson_distribution<long long> draw(rate * cfg.cadence);
            c = draw(rng);
        }
        total += c;
        out << std::setprecision(10) << t << ' ' << c << ' ' << cfg.cadence << '\n';
    }

    nlohmann::json truth = {
        {"file",         path.filename().string()},
        {"obsid",        obsid},
        {"ra",           source.position.ra},
        {"dec",          source.position.dec},
        {"baseRate",     base},
        {"totalCounts",  total},
        {"period",       cfg.period},
        {"modulation",   cfg.modulation},
        {"injections",   nlohmann::json::array()}
    };
    for (const auto& inj : cfg.injections)
        truth["injections"].push_back({{"kind", inj.kind}, {"start", inj.start},
                                       {"end", inj.end}, {"factor", inj.factor}});
    return truth;
}

int main(int argc, char** argv)
{
    cxxopts::Options options("xraylc_mock", "Synthetic X-ray lightcurve generator");
    options.add_options()
        ("n,num", "Number of lightcurves", cxxopts::value<int>()->default_value("1"))
        ("first-obsid", "ObsID of the first lightcurve", cxxopts::value<long long>()->default_value("10000"))
        ("duration", "Exposure length (s)", cxxopts::value<double>()->default_value("20000"))
        ("cadence", "Frame time (s)", cxxopts::value<double>()->default_value("3.24104"))
        ("rate", "Background rate distribution (value | mean,sigma | min:max)", cxxopts::value<std::string>()->default_value("0.1"))
        ("period", "Sinusoidal modulation period (s), 0 for none", cxxopts::value<double>()->default_value("0"))
        ("modulation", "Fractional modulation amplitude", cxxopts::value<double>()->default_value("0"))
        ("flare", "Flare start:end:factor (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("eclipse", "Eclipse start:end:factor (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("dead-fraction", "Fraction of frames with zero exposure", cxxopts::value<double>()->default_value("0"))
        ("seed", "Random seed", cxxopts::value<unsigned>()->default_value("42"))
        ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("./mock_lightcurves/"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        MockConfig cfg;
        cfg.num_lightcurves = result["num"].as<int>();
        cfg.first_obsid     = result["first-obsid"].as<long long>();
        cfg.duration        = result["duration"].as<double>();
        cfg.cadence         = result["cadence"].as<double>();
        cfg.rate            = ParameterConfig::from_string(result["rate"].as<std::string>());
        cfg.period          = result["period"].as<double>();
        cfg.modulation      = result["modulation"].as<double>();
        cfg.dead_fraction   = result["dead-fraction"].as<double>();
        cfg.seed            = result["seed"].as<unsigned>();
        cfg.output_dir      = result["output"].as<std::string>();

        if (cfg.cadence <= 0.0 || cfg.duration < cfg.cadence)
            throw std::invalid_argument("cadence must be positive and not longer than the duration");
        if (cfg.dead_fraction < 0.0 || cfg.dead_fraction >= 1.0)
            throw std::invalid_argument("dead-fraction must lie in [0, 1)");

        if (result.count("flare"))
            for (const auto& s : result["flare"].as<std::vector<std::string>>())
                cfg.injections.push_back(parse_injection("flare", s));
        if (result.count("eclipse"))
            for (const auto& s : result["eclipse"].as<std::vector<std::string>>())
                cfg.injections.push_back(parse_injection("eclipse", s));

        fs::create_directories(cfg.output_dir);
        std::mt19937 rng(cfg.seed);

        nlohmann::json truth = nlohmann::json::array();
        for (int i = 0; i < cfg.num_lightcurves; ++i) {
            truth.push_back(write_lightcurve(cfg, i, rng));
            std::cout << "\rGenerated " << (i + 1) << "/" << cfg.num_lightcurves << std::flush;
        }
        std::cout << '\n';

        std::ofstream tf(fs::path(cfg.output_dir) / "truth.json");
        tf << truth.dump(2) << '\n';
        std::cout << "Wrote " << cfg.num_lightcurves << " lightcurve(s) to " << cfg.output_dir << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
