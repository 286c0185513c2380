/* ──────────────────────────────────────────────────────────────
   importer.hpp   –  measured text data → interpolated Curve
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"
#include "simulation/curve.hpp"

namespace refrax {

struct RawPoint {
    double incidence_deg;
    double deviation_deg;
};

struct BadLine {
    std::size_t line;        // 1-based
    std::string text;
    std::string reason;
};

struct RawParseResult {
    std::vector<RawPoint> points;
    std::vector<BadLine>  bad_lines;
};

/*  One pair per line, separated by blanks, ',', ';' or tabs; '#' starts
    a comment. Lines without two numeric leading fields are recorded and
    skipped, or raise DataFormatError(line) when strict.               */
RawParseResult parse_raw_text(const std::string& text, bool strict = false);
/* unreadable file → InsufficientDataError */
RawParseResult parse_raw_file(const std::string& path, bool strict = false);

/* least-squares index of the prism relation over the samples (golden section) */
double fit_refractive_index(const std::vector<double>& incidence,
                            const std::vector<double>& deviation,
                            double apex_deg);

/*  Drops out-of-domain points, sorts, averages duplicate incidences,
    checks count/span (InsufficientDataError) and resamples with PCHIP
    on opt.grid_points. With opt.extend_to_bound the tail up to 80° is
    the fitted prism relation shifted to meet the last sample.        */
Curve import_raw(const std::vector<RawPoint>& points, const ImportOpt& opt,
                 double apex_deg = 60.0);

}  // namespace refrax
