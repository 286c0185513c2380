/* ──────────────────────────────────────────────────────────────
   curve.hpp   –  immutable (incidence, deviation) sequence
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstddef>
#include <vector>

namespace refrax {

class Curve {
public:
    /* incidence strictly increasing and inside [0°, 80°]; throws InvalidRangeError */
    Curve(std::vector<double> incidence_deg, std::vector<double> deviation_deg);

    std::size_t size() const { return x_.size(); }
    const std::vector<double>& incidence() const { return x_; }
    const std::vector<double>& deviation() const { return y_; }

    double min_incidence() const { return x_.front(); }
    double max_incidence() const { return x_.back(); }

private:
    std::vector<double> x_, y_;
};

}  // namespace refrax
