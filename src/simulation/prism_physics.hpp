/* ──────────────────────────────────────────────────────────────
   prism_physics.hpp  –  minimum-geometry deviation through a prism
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <vector>

#include "config.hpp"

namespace refrax {

/*  r1 = asin(sin i1 / n),  r2 = A − r1,  i2 = asin(n sin r2),
    δ  = i1 + i2 − A   (all in degrees at the interface).
    Returns false when the ray cannot leave the second face
    (total internal reflection) or n ≤ 1.                        */
bool deviation_deg(double n, double incidence_deg, double apex_deg, double& out);

/* lo, lo+step, … up to (and including, within 1e-9) hi */
std::vector<double> incidence_sweep(const SimOpt& opt);

/* index grid lo + i·step for i < floor((hi − lo)/step + 1e-9); hi is the sweep end */
std::vector<double> index_grid(double lo, double hi, double step);

}  // namespace refrax
