#include "simulation/curve_render.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

#include "common.hpp"
#include "errors.hpp"

namespace refrax {

namespace {

constexpr double kSubStepPx = 0.25;   // sampling pitch along a segment

inline double to_col(double inc)
{
    return (inc - kAxisIncidenceMin) / (kAxisIncidenceMax - kAxisIncidenceMin) * (kRasterSize - 1);
}

inline double to_row(double dev)
{
    return (1.0 - (dev - kAxisDeviationMin) / (kAxisDeviationMax - kAxisDeviationMin)) *
           (kRasterSize - 1);
}

void stamp(CurveImage& img, double r, double c)
{
    const int r0 = int(std::floor(r - kPenRadiusPx)), r1 = int(std::ceil(r + kPenRadiusPx));
    const int c0 = int(std::floor(c - kPenRadiusPx)), c1 = int(std::ceil(c + kPenRadiusPx));
    const double rr = kPenRadiusPx * kPenRadiusPx + 1e-9;
    for (int y = std::max(0, r0); y <= std::min(kRasterSize - 1, r1); ++y)
        for (int x = std::max(0, c0); x <= std::min(kRasterSize - 1, c1); ++x) {
            const double dy = y - r, dx = x - c;
            if (dy * dy + dx * dx <= rr) img(y, x) = 1.0f;
        }
}

}  // namespace

CurveImage render(const Curve& curve)
{
    CurveImage img = CurveImage::Zero(kRasterSize, kRasterSize);
    const auto& xs = curve.incidence();
    const auto& ys = curve.deviation();
    const double margin = kPenRadiusPx + 1.0;

    for (std::size_t i = 0; i + 1 < xs.size(); ++i) {
        const double c0 = to_col(xs[i]),     r0 = to_row(ys[i]);
        const double c1 = to_col(xs[i + 1]), r1 = to_row(ys[i + 1]);

        /* both ends beyond the same border → nothing to draw */
        if ((c0 < -margin && c1 < -margin) || (c0 > kRasterSize + margin && c1 > kRasterSize + margin) ||
            (r0 < -margin && r1 < -margin) || (r0 > kRasterSize + margin && r1 > kRasterSize + margin))
            continue;

        const double len = std::hypot(c1 - c0, r1 - r0);
        const int steps = std::max(1, int(std::ceil(len / kSubStepPx)));
        for (int s = 0; s <= steps; ++s) {
            const double t = double(s) / steps;
            stamp(img, r0 + t * (r1 - r0), c0 + t * (c1 - c0));
        }
    }
    return img;
}

void write_pgm(const CurveImage& img, const std::string& path)
{
    std::string bytes;
    bytes.reserve(std::size_t(img.size()));
    for (Eigen::Index r = 0; r < img.rows(); ++r)
        for (Eigen::Index c = 0; c < img.cols(); ++c) {
            const float v = std::min(1.0f, std::max(0.0f, img(r, c)));
            bytes.push_back(static_cast<char>(static_cast<unsigned char>(std::lround(v * 255.0f))));
        }
    std::ostringstream out;
    out << "P5\n" << img.cols() << ' ' << img.rows() << "\n255\n" << bytes;
    write_file_atomic(path, out.str());
}

CurveImage read_pgm(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) throw DataFormatError("cannot open image " + path);

    /* header tokens, skipping '#' comments */
    auto token = [&in, &path]() {
        std::string t;
        while (in >> t) {
            if (t[0] != '#') return t;
            std::string rest;
            std::getline(in, rest);
        }
        throw DataFormatError("truncated PGM header in " + path);
    };

    if (token() != "P5") throw DataFormatError("not a binary PGM: " + path);
    int w = 0, h = 0, maxv = 0;
    try {
        w    = std::stoi(token());
        h    = std::stoi(token());
        maxv = std::stoi(token());
    } catch (const std::logic_error&) {
        throw DataFormatError("bad PGM header in " + path);
    }
    if (w <= 0 || h <= 0 || maxv <= 0 || maxv > 255)
        throw DataFormatError("unsupported PGM geometry in " + path);
    in.get();   // single whitespace before the raster

    std::vector<char> buf(std::size_t(w) * std::size_t(h));
    in.read(buf.data(), std::streamsize(buf.size()));
    if (in.gcount() != std::streamsize(buf.size()))
        throw DataFormatError("truncated PGM raster in " + path);

    CurveImage img(h, w);
    std::size_t k = 0;
    for (int r = 0; r < h; ++r)
        for (int c = 0; c < w; ++c)
            img(r, c) = float(static_cast<unsigned char>(buf[k++])) / float(maxv);
    return img;
}

}  // namespace refrax
