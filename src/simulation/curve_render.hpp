/* ──────────────────────────────────────────────────────────────
   curve_render.hpp  –  curve → fixed-window raster, PGM I/O
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <string>

#include <Eigen/Dense>

#include "simulation/curve.hpp"

namespace refrax {

/* kRasterSize × kRasterSize, 1 = ink, row 0 = top of the plot */
using CurveImage = Eigen::MatrixXf;

/*  Polyline with a round pen of kPenRadiusPx over the shared axis
    window (incidence 40…80°, deviation 20…80°). Segments outside the
    window are clipped. No antialiasing, so output is bit-exact.     */
CurveImage render(const Curve& curve);

/* binary P5, 8 bit; throws StorageUnavailableError / DataFormatError */
void       write_pgm(const CurveImage& img, const std::string& path);
CurveImage read_pgm(const std::string& path);

}  // namespace refrax
