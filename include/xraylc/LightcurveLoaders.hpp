// LightcurveLoaders.hpp
#pragma once
#include "xraylc/Observation.hpp"
#include <string>
#include <vector>

namespace xraylc {

// Column layout written by the archive's FITS-to-text conversion
inline const std::vector<std::string>& archive_text_columns()
{
    static const std::vector<std::string> cols = {
        "TIME_BIN", "TIME_MIN", "TIME", "TIME_MAX", "COUNTS",
        "STAT_ERR", "AREA", "EXPOSURE", "COUNT_RATE", "COUNT_RATE_ERR"};
    return cols;
}

// ---------------------------------------------------------------------------
//  Whitespace separated table.  A first line that starts with a letter is a
//  header naming the columns; otherwise ten columns are read with the archive
//  layout above and two or three columns as  TIME COUNTS [EXPOSURE].
//  Rows with EXPOSURE <= 0 are dead time and are dropped.  Times are
//  re-referenced to the first kept row.  Metadata not present in the file is
//  taken from the J2000 designation in the file name when there is one.
// ---------------------------------------------------------------------------
Observation load_ascii_lightcurve(const std::string& path);

// .clc JSON:  { coords, gal, obsid, band, t_res, phot: [counts …] }
Observation load_clc(const std::string& path);

// main entry point: "auto" picks by extension (.clc -> JSON, else text)
Observation load_lightcurve(const std::string& path,
                            const std::string& format = "auto");

} // namespace xraylc
