#include "simulation/curve.hpp"

#include <cmath>
#include <string>

#include "common.hpp"
#include "errors.hpp"

namespace refrax {

Curve::Curve(std::vector<double> incidence_deg, std::vector<double> deviation_deg)
    : x_(std::move(incidence_deg)), y_(std::move(deviation_deg))
{
    if (x_.size() != y_.size())
        throw InvalidRangeError("curve: " + std::to_string(x_.size()) + " incidences vs " +
                                std::to_string(y_.size()) + " deviations");
    if (x_.size() < 2)
        throw InvalidRangeError("curve needs at least two points");
    for (std::size_t i = 0; i < x_.size(); ++i) {
        if (!std::isfinite(x_[i]) || !std::isfinite(y_[i]))
            throw InvalidRangeError("curve: non-finite point at " + std::to_string(i));
        if (x_[i] < kMinIncidenceDeg || x_[i] > kMaxIncidenceDeg)
            throw InvalidRangeError("curve: incidence " + format_fixed(x_[i], 3) +
                                    " outside [0, 80]");
        if (i && !(x_[i] > x_[i - 1]))
            throw InvalidRangeError("curve: incidence not strictly increasing at " +
                                    std::to_string(i));
    }
}

}  // namespace refrax
