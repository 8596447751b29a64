#pragma once
#include "Types.hpp"
#include <optional>
#include <string>

namespace xraylc {

// J2000 equatorial position, degrees
struct SkyPosition {
    Real ra  = 0.0;
    Real dec = 0.0;
};

/*  What an archive file name such as
 *
 *        J013351.02+303829.4_1730_lc.fits
 *
 *  tells us about its source.                                        */
struct SourceName {
    std::string              designation;   // "J013351.02+303829.4"
    std::string              sexagesimal;   // "01 33 51.02 +30 38 29.4"
    SkyPosition              position;
    std::optional<long long> obsid;
};

// "HH MM SS.ss ±DD MM SS.s" (any whitespace or ':' separated) -> degrees.
// Throws std::invalid_argument on malformed input or out-of-range fields.
SkyPosition to_degrees(const std::string& sexagesimal);

// Accepts a bare file name or a path; throws std::invalid_argument when the
// name does not start with a J2000 designation.
SourceName parse_source_name(const std::string& path);

// Great-circle distance, degrees.
Real angular_separation(const SkyPosition& a, const SkyPosition& b);

} // namespace xraylc
