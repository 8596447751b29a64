#include "xraylc/LightcurveLoaders.hpp"
#include "xraylc/Coordinates.hpp"
#include "xraylc/Errors.hpp"
#include "xraylc/JsonUtils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace xraylc {
namespace {

struct Table {
    std::vector<std::string>         names;
    std::vector<std::vector<double>> rows;
};

std::vector<std::string> split_ws(const std::string& line)
{
    std::string clean = line;
    std::replace(clean.begin(), clean.end(), ',', ' ');
    std::istringstream ss(clean);
    std::vector<std::string> out;
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

// ----------------------------------------------------------------------------
//  Read a whitespace table, skip blank / comment lines, pick up a header
// ----------------------------------------------------------------------------
Table read_ascii_table(const std::string& path, char comment_char = '#')
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    Table t;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;            // blank line
        if (*it == comment_char) continue;         // comment

        if (t.names.empty() && t.rows.empty() && std::isalpha(static_cast<unsigned char>(*it))) {
            t.names = split_ws(line);
            for (auto& n : t.names)
                std::transform(n.begin(), n.end(), n.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            continue;
        }

        std::vector<double> row;
        for (const auto& tok : split_ws(line)) {
            try {
                row.push_back(std::stod(tok));
            } catch (const std::exception&) {
                throw std::runtime_error("'" + path + "' line " + std::to_string(lineno)
                                         + ": not a number: '" + tok + "'");
            }
        }
        if (!t.rows.empty() && row.size() != t.rows.front().size())
            throw std::runtime_error("'" + path + "' line " + std::to_string(lineno)
                                     + ": inconsistent number of columns");
        t.rows.push_back(std::move(row));
    }
    if (t.rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    if (t.names.empty()) {
        const std::size_t nc = t.rows.front().size();
        if (nc == archive_text_columns().size()) t.names = archive_text_columns();
        else if (nc == 2)                        t.names = {"TIME", "COUNTS"};
        else if (nc == 3)                        t.names = {"TIME", "COUNTS", "EXPOSURE"};
        else
            throw std::runtime_error("'" + path + "': cannot infer the meaning of "
                                     + std::to_string(nc) + " unnamed columns");
    }
    if (t.names.size() != t.rows.front().size())
        throw std::runtime_error("'" + path + "': header names " + std::to_string(t.names.size())
                                 + " columns, data has " + std::to_string(t.rows.front().size()));
    return t;
}

int column(const Table& t, const std::string& name)
{
    const auto it = std::find(t.names.begin(), t.names.end(), name);
    return it == t.names.end() ? -1 : static_cast<int>(it - t.names.begin());
}

Count to_count(double v, const std::string& path)
{
    if (!std::isfinite(v) || std::abs(v - std::round(v)) > 1e-6)
        throw InvalidObservation("'" + path + "': COUNTS value " + std::to_string(v)
                                 + " is not an integer");
    return static_cast<Count>(std::llround(v));
}

/*  J2000 designation in the file name, if the name carries one.  Files
 *  named otherwise simply keep default coordinates.                     */
void fill_meta_from_name(const std::string& path, ObservationMeta& meta)
{
    const std::string file = fs::path(path).filename().string();
    if (file.empty() || file[0] != 'J') return;
    try {
        const SourceName sn = parse_source_name(file);
        meta.ra  = sn.position.ra;
        meta.dec = sn.position.dec;
        if (sn.obsid) meta.obsid = *sn.obsid;
    } catch (const std::invalid_argument&) {
        // 'J…' that is not a designation: nothing to recover
    }
}

long long json_obsid(const nlohmann::json& j)
{
    if (j.is_number_integer()) return j.get<long long>();
    if (j.is_string()) {
        const auto s = j.get<std::string>();
        try {
            std::size_t used = 0;
            const long long v = std::stoll(s, &used);
            if (used == s.size()) return v;
        } catch (const std::exception&) {
        }
        throw InvalidObservation("obsid '" + s + "' is not an integer");
    }
    throw InvalidObservation("obsid must be an integer or a numeric string");
}

} // unnamed namespace

// ============================================================================
//  Public loader implementations
// ============================================================================

Observation load_ascii_lightcurve(const std::string& path)
{
    // -------------------- 1. read file -----------------------------------------
    const Table t = read_ascii_table(path);

    const int it_time = column(t, "TIME") >= 0 ? column(t, "TIME") : 0;
    const int it_cnt  = column(t, "COUNTS");
    const int it_exp  = column(t, "EXPOSURE");
    if (it_cnt < 0)
        throw std::runtime_error("'" + path + "': no COUNTS column");

    // -------------------- 2. keep live-time rows -------------------------------
    std::vector<Sample> samples;
    samples.reserve(t.rows.size());
    double t_ref = std::numeric_limits<double>::quiet_NaN();
    for (const auto& r : t.rows) {
        if (it_exp >= 0 && !(r[it_exp] > 0.0)) continue;     // dead time
        if (std::isnan(t_ref)) t_ref = r[it_time];
        samples.push_back({r[it_time] - t_ref, to_count(r[it_cnt], path)});
    }
    if (samples.empty())
        throw InvalidObservation("'" + path + "': every row has zero exposure");

    // -------------------- 3. metadata from the file name -----------------------
    ObservationMeta meta;
    fill_meta_from_name(path, meta);

    return Observation(std::move(samples), std::move(meta));
}

// ----------------------------------------------------------------------------
Observation load_clc(const std::string& path)
{
    const nlohmann::json j = load_json(path);

    for (const char* key : {"phot", "t_res"})
        if (!j.contains(key))
            throw InvalidObservation("'" + path + "': missing key '" + key + "'");

    const double t_res = j["t_res"].is_string() ? std::stod(j["t_res"].get<std::string>())
                                                : j["t_res"].get<double>();
    if (!(t_res > 0.0))
        throw InvalidObservation("'" + path + "': t_res must be positive");

    std::vector<Sample> samples;
    const auto& phot = j["phot"];
    samples.reserve(phot.size());
    for (std::size_t i = 0; i < phot.size(); ++i)
        samples.push_back({static_cast<double>(i) * t_res, to_count(phot[i].get<double>(), path)});

    ObservationMeta meta;
    fill_meta_from_name(path, meta);
    if (j.contains("coords")) {
        const auto coords = j["coords"].get<std::string>();
        const SkyPosition p = !coords.empty() && coords[0] == 'J'
                            ? parse_source_name(coords).position
                            : to_degrees(coords);
        meta.ra  = p.ra;
        meta.dec = p.dec;
    }
    if (j.contains("gal"))   meta.galaxy      = j["gal"].get<std::string>();
    if (j.contains("band"))  meta.energy_band = j["band"].get<std::string>();
    if (j.contains("obsid")) meta.obsid       = json_obsid(j["obsid"]);

    return Observation(std::move(samples), std::move(meta));
}

// ============================================================================
//  Dispatcher
// ============================================================================
using LightcurveLoader = std::function<Observation(const std::string&)>;

static const std::unordered_map<std::string, LightcurveLoader> kLoaderMap = {
    {"ascii", load_ascii_lightcurve},
    {"clc",   load_clc}
};

Observation load_lightcurve(const std::string& path, const std::string& format)
{
    std::string fmt = format;
    if (fmt == "auto") {
        std::string ext = fs::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".fits" || ext == ".fit")
            throw std::runtime_error("'" + path + "': FITS lightcurves must be converted to text first");
        fmt = ext == ".clc" ? "clc" : "ascii";
    }

    auto it = kLoaderMap.find(fmt);
    if (it == kLoaderMap.end())
        throw std::runtime_error("Unsupported lightcurve format: " + format);

    return it->second(path);
}

} // namespace xraylc
