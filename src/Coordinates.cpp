#include "xraylc/Coordinates.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace xraylc {

static constexpr Real kPi       = 3.14159265358979323846;
static constexpr Real kDegToRad = kPi / 180.0;

/* -------------------------------------------------------------- *
 *  "HH MM SS" -> [HH, MM, SS]                                    *
 * -------------------------------------------------------------- */
static std::vector<Real> split_fields(const std::string& s)
{
    std::string clean = s;
    std::replace(clean.begin(), clean.end(), ':', ' ');

    std::istringstream iss(clean);
    std::vector<Real> out;
    std::string tok;
    while (iss >> tok) {
        std::size_t used = 0;
        Real v = 0.0;
        try {
            v = std::stod(tok, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("to_degrees(): cannot parse field '" + tok + "'");
        }
        if (used != tok.size())
            throw std::invalid_argument("to_degrees(): cannot parse field '" + tok + "'");
        out.push_back(v);
    }
    return out;
}

SkyPosition to_degrees(const std::string& sexagesimal)
{
    /* the declination starts at the sign character */
    const auto sign_pos = sexagesimal.find_first_of("+-");
    if (sign_pos == std::string::npos)
        throw std::invalid_argument("to_degrees(): missing declination sign in '" + sexagesimal + "'");

    const auto ra_f  = split_fields(sexagesimal.substr(0, sign_pos));
    const auto dec_f = split_fields(sexagesimal.substr(sign_pos + 1));
    if (ra_f.size() != 3 || dec_f.size() != 3)
        throw std::invalid_argument("to_degrees(): expected 'HH MM SS +DD MM SS', got '"
                                    + sexagesimal + "'");

    if (ra_f[0] < 0 || ra_f[0] >= 24 || ra_f[1] < 0 || ra_f[1] >= 60 || ra_f[2] < 0 || ra_f[2] >= 60)
        throw std::invalid_argument("to_degrees(): right ascension out of range in '" + sexagesimal + "'");
    if (dec_f[0] < 0 || dec_f[0] > 90 || dec_f[1] < 0 || dec_f[1] >= 60 || dec_f[2] < 0 || dec_f[2] >= 60)
        throw std::invalid_argument("to_degrees(): declination out of range in '" + sexagesimal + "'");

    const Real sign = sexagesimal[sign_pos] == '-' ? -1.0 : 1.0;

    SkyPosition p;
    p.ra  = 15.0 * (ra_f[0] + ra_f[1] / 60.0 + ra_f[2] / 3600.0);
    p.dec = sign * (dec_f[0] + dec_f[1] / 60.0 + dec_f[2] / 3600.0);
    if (std::abs(p.dec) > 90.0)
        throw std::invalid_argument("to_degrees(): |dec| > 90 deg in '" + sexagesimal + "'");
    return p;
}

/* -------------------------------------------------------------- *
 *  "013351.02" -> "01 33 51.02"                                  *
 * -------------------------------------------------------------- */
static std::string spaced(const std::string& packed)
{
    return packed.substr(0, 2) + " " + packed.substr(2, 2) + " " + packed.substr(4);
}

SourceName parse_source_name(const std::string& path)
{
    /* J HHMMSS[.s…] ±DDMMSS[.s…] */
    static const std::regex re(R"(^J(\d{6}(?:\.\d+)?)([+-])(\d{6}(?:\.\d+)?))");

    const std::string file = std::filesystem::path(path).filename().string();
    std::smatch m;
    if (!std::regex_search(file, m, re))
        throw std::invalid_argument("parse_source_name(): '" + file
                                    + "' does not start with a J2000 designation");

    SourceName out;
    out.designation = m.str(0);
    out.sexagesimal = spaced(m.str(1)) + " " + m.str(2) + spaced(m.str(3));
    out.position    = to_degrees(out.sexagesimal);

    /* the '_' separated token after the designation is the ObsID when it is all digits */
    const std::size_t after = static_cast<std::size_t>(m.length(0));
    if (after < file.size() && file[after] == '_') {
        const auto stop = file.find_first_of("_.", after + 1);
        const std::string tok = file.substr(after + 1, stop == std::string::npos ? std::string::npos
                                                                                 : stop - after - 1);
        if (!tok.empty() && tok.size() < 19 &&
            std::all_of(tok.begin(), tok.end(), [](unsigned char c) { return std::isdigit(c); }))
            out.obsid = std::stoll(tok);
    }
    return out;
}

Real angular_separation(const SkyPosition& a, const SkyPosition& b)
{
    /* haversine: stable for small separations */
    const Real d1 = a.dec * kDegToRad, d2 = b.dec * kDegToRad;
    const Real dd = d2 - d1;
    const Real da = (b.ra - a.ra) * kDegToRad;
    const Real h  = std::sin(dd / 2) * std::sin(dd / 2)
                  + std::cos(d1) * std::cos(d2) * std::sin(da / 2) * std::sin(da / 2);
    return 2.0 * std::asin(std::min(1.0, std::sqrt(h))) / kDegToRad;
}

} // namespace xraylc
