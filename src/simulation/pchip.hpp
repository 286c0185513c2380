/* ──────────────────────────────────────────────────────────────
   pchip.hpp   –  Fritsch–Carlson monotone piecewise-cubic Hermite
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <vector>

namespace refrax {

class Pchip {
public:
    /* x strictly increasing, x.size() == y.size() >= 2 */
    Pchip(std::vector<double> x, std::vector<double> y);

    double operator()(double x) const;           // clamps to [x0, xN]

private:
    std::vector<double> x_, y_, d_;
};

}  // namespace refrax
