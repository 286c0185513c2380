#include "simulation/prism_physics.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace refrax {

bool deviation_deg(double n, double incidence_deg, double apex_deg, double& out)
{
    if (!(n > 1.0)) return false;
    const double A  = deg2rad(apex_deg);
    const double i1 = deg2rad(incidence_deg);

    const double r1 = std::asin(std::sin(i1) / n);
    const double r2 = A - r1;
    const double s  = n * std::sin(r2);
    if (s > 1.0 || s < -1.0) return false;           // TIR on the exit face

    out = rad2deg(i1 + std::asin(s) - A);
    return std::isfinite(out);
}

std::vector<double> incidence_sweep(const SimOpt& opt)
{
    if (opt.incidence_step <= 0.0)
        throw InvalidRangeError("incidence step must be > 0");
    if (opt.incidence_start < kMinIncidenceDeg || opt.incidence_end > kMaxIncidenceDeg ||
        opt.incidence_start >= opt.incidence_end)
        throw InvalidRangeError("incidence sweep [" + format_fixed(opt.incidence_start, 2) + ", " +
                                format_fixed(opt.incidence_end, 2) + "] leaves [0, 80]");

    const auto n = static_cast<std::size_t>(
        std::floor((opt.incidence_end - opt.incidence_start) / opt.incidence_step + 1e-9)) + 1;
    std::vector<double> xs;
    xs.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        xs.push_back(opt.incidence_start + double(i) * opt.incidence_step);
    xs.back() = std::min(xs.back(), opt.incidence_end);
    return xs;
}

std::vector<double> index_grid(double lo, double hi, double step)
{
    if (!(step > 0.0))
        throw InvalidRangeError("index step must be > 0");
    if (!(lo <= hi))
        throw InvalidRangeError("index range is empty");

    const auto n = static_cast<std::size_t>(std::floor((hi - lo) / step + 1e-9));
    if (n == 0)
        throw InvalidRangeError("index range [" + format_fixed(lo, 4) + ", " +
                                format_fixed(hi, 4) + "] holds no step of " +
                                format_fixed(step, 4));
    std::vector<double> ns;
    ns.reserve(n);
    for (std::size_t i = 0; i < n; ++i) ns.push_back(lo + double(i) * step);
    return ns;
}

}  // namespace refrax
