#include "simulation/importer.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include "errors.hpp"
#include "simulation/pchip.hpp"
#include "simulation/prism_physics.hpp"

namespace refrax {

namespace {

bool to_double(const std::string& tok, double& out)
{
    if (tok.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(tok.c_str(), &end);
    return errno == 0 && end == tok.c_str() + tok.size() && std::isfinite(out);
}

std::string trim(const std::string& s)
{
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

/* sum of squared residuals; TIR anywhere makes n infeasible */
double sse_for_index(double n, const std::vector<double>& xs,
                     const std::vector<double>& ys, double apex)
{
    double s = 0.0;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        double d = 0.0;
        if (!deviation_deg(n, xs[i], apex, d)) return std::numeric_limits<double>::max();
        s += (d - ys[i]) * (d - ys[i]);
    }
    return s;
}

}  // namespace

RawParseResult parse_raw_text(const std::string& text, bool strict)
{
    RawParseResult res;
    std::istringstream in(text);
    std::string raw;
    std::size_t ln = 0;
    while (std::getline(in, raw)) {
        ++ln;
        std::string line = raw;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        for (char& ch : line)
            if (ch == ',' || ch == ';' || ch == '\t') ch = ' ';
        line = trim(line);
        if (line.empty()) continue;

        std::istringstream ls(line);
        std::string a, b;
        ls >> a >> b;
        double x = 0.0, y = 0.0;
        std::string why;
        if (b.empty())               why = "expected two fields";
        else if (!to_double(a, x))   why = "incidence not numeric: '" + a + "'";
        else if (!to_double(b, y))   why = "deviation not numeric: '" + b + "'";

        if (!why.empty()) {
            if (strict) throw DataFormatError("raw data: " + why, ln);
            logW("raw data line " + std::to_string(ln) + " skipped: " + why);
            res.bad_lines.push_back({ln, trim(raw), why});
            continue;
        }
        res.points.push_back({x, y});
    }
    return res;
}

RawParseResult parse_raw_file(const std::string& path, bool strict)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InsufficientDataError("cannot read raw data file " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_raw_text(ss.str(), strict);
}

double fit_refractive_index(const std::vector<double>& incidence,
                            const std::vector<double>& deviation, double apex_deg)
{
    const double phi = 0.5 * (std::sqrt(5.0) - 1.0);
    double a = 1.0 + 1e-6, b = 2.5;
    double c = b - phi * (b - a), d = a + phi * (b - a);
    double fc = sse_for_index(c, incidence, deviation, apex_deg);
    double fd = sse_for_index(d, incidence, deviation, apex_deg);
    for (int it = 0; it < 200 && (b - a) > 1e-10; ++it) {
        if (fc < fd) {
            b = d; d = c; fd = fc;
            c = b - phi * (b - a);
            fc = sse_for_index(c, incidence, deviation, apex_deg);
        } else {
            a = c; c = d; fc = fd;
            d = a + phi * (b - a);
            fd = sse_for_index(d, incidence, deviation, apex_deg);
        }
    }
    return 0.5 * (a + b);
}

Curve import_raw(const std::vector<RawPoint>& points, const ImportOpt& opt, double apex_deg)
{
    std::vector<RawPoint> pts;
    pts.reserve(points.size());
    for (const auto& p : points) {
        if (!std::isfinite(p.incidence_deg) || !std::isfinite(p.deviation_deg) ||
            p.incidence_deg < kMinIncidenceDeg || p.incidence_deg > kMaxIncidenceDeg) {
            logW("import: dropped point (" + format_fixed(p.incidence_deg, 3) + ", " +
                 format_fixed(p.deviation_deg, 3) + ") outside [0, 80]");
            continue;
        }
        pts.push_back(p);
    }
    std::sort(pts.begin(), pts.end(),
              [](const RawPoint& l, const RawPoint& r) { return l.incidence_deg < r.incidence_deg; });

    /* merge duplicate incidences by averaging their deviations */
    std::vector<double> xs, ys;
    for (std::size_t i = 0; i < pts.size();) {
        std::size_t j = i;
        double sum = 0.0;
        while (j < pts.size() && pts[j].incidence_deg - pts[i].incidence_deg < 1e-9)
            sum += pts[j++].deviation_deg;
        xs.push_back(pts[i].incidence_deg);
        ys.push_back(sum / double(j - i));
        i = j;
    }

    if (xs.size() < opt.min_points)
        throw InsufficientDataError("need at least " + std::to_string(opt.min_points) +
                                    " distinct samples, got " + std::to_string(xs.size()));
    const double span = xs.back() - xs.front();
    if (span < opt.min_span_deg)
        throw InsufficientDataError("samples span " + format_fixed(span, 2) + "°, need " +
                                    format_fixed(opt.min_span_deg, 2) + "°");
    if (opt.grid_points < 2)
        throw InvalidRangeError("import grid needs at least two points");

    const Pchip interp(xs, ys);
    const double x0 = xs.front(), x_last = xs.back();
    const bool extend = opt.extend_to_bound && x_last < kMaxIncidenceDeg;
    const double x_end = extend ? kMaxIncidenceDeg : x_last;

    double n_fit = 0.0, offset = 0.0;
    if (extend) {
        n_fit = fit_refractive_index(xs, ys, apex_deg);
        double d_last = 0.0;
        if (deviation_deg(n_fit, x_last, apex_deg, d_last)) {
            offset = ys.back() - d_last;
            logD("import: extension with n=" + format_fixed(n_fit, 4) +
                 ", offset " + format_fixed(offset, 4) + "°");
        } else {
            logW("import: fitted index " + format_fixed(n_fit, 4) +
                 " has no exit ray at the last sample; extension disabled");
            n_fit = 0.0;
        }
    }

    std::vector<double> gx, gy;
    gx.reserve(opt.grid_points);
    gy.reserve(opt.grid_points);
    for (std::size_t k = 0; k < opt.grid_points; ++k) {
        double x = x0 + (x_end - x0) * double(k) / double(opt.grid_points - 1);
        if (k + 1 == opt.grid_points) x = x_end;
        if (x <= x_last) {
            gx.push_back(x);
            gy.push_back(interp(x));
            continue;
        }
        double d = 0.0;
        if (n_fit == 0.0 || !deviation_deg(n_fit, x, apex_deg, d)) break;
        gx.push_back(x);
        gy.push_back(d + offset);
    }
    return Curve(std::move(gx), std::move(gy));
}

}  // namespace refrax
