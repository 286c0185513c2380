#include "simulation/pchip.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace refrax {

namespace {
inline int sgn(double v) { return (v > 0) - (v < 0); }
}

Pchip::Pchip(std::vector<double> x, std::vector<double> y)
    : x_(std::move(x)), y_(std::move(y))
{
    const std::size_t n = x_.size();
    if (n < 2 || n != y_.size())
        throw InvalidRangeError("pchip needs >= 2 matched points");

    std::vector<double> h(n - 1), del(n - 1);
    for (std::size_t k = 0; k + 1 < n; ++k) {
        h[k]   = x_[k + 1] - x_[k];
        del[k] = (y_[k + 1] - y_[k]) / h[k];
    }

    d_.assign(n, 0.0);
    if (n == 2) {
        d_[0] = d_[1] = del[0];
        return;
    }

    /* interior: weighted harmonic mean, zero at local extrema */
    for (std::size_t k = 1; k + 1 < n; ++k) {
        if (sgn(del[k - 1]) * sgn(del[k]) <= 0) continue;
        const double w1 = 2 * h[k] + h[k - 1];
        const double w2 = h[k] + 2 * h[k - 1];
        d_[k] = (w1 + w2) / (w1 / del[k - 1] + w2 / del[k]);
    }

    /* ends: shape-preserving three-point estimate */
    auto edge = [](double h0, double h1, double m0, double m1) {
        double d = ((2 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);
        if (sgn(d) != sgn(m0))
            d = 0.0;
        else if (sgn(m0) != sgn(m1) && std::fabs(d) > 3 * std::fabs(m0))
            d = 3 * m0;
        return d;
    };
    d_[0]     = edge(h[0], h[1], del[0], del[1]);
    d_[n - 1] = edge(h[n - 2], h[n - 3], del[n - 2], del[n - 3]);
}

double Pchip::operator()(double x) const
{
    if (x <= x_.front()) return y_.front();
    if (x >= x_.back())  return y_.back();

    const auto it = std::upper_bound(x_.begin(), x_.end(), x);
    const std::size_t k = std::size_t(it - x_.begin()) - 1;

    const double h  = x_[k + 1] - x_[k];
    const double t  = (x - x_[k]) / h;
    const double t2 = t * t, t3 = t2 * t;
    const double h00 = 2 * t3 - 3 * t2 + 1;
    const double h10 = t3 - 2 * t2 + t;
    const double h01 = -2 * t3 + 3 * t2;
    const double h11 = t3 - t2;
    return h00 * y_[k] + h10 * h * d_[k] + h01 * y_[k + 1] + h11 * h * d_[k + 1];
}

}  // namespace refrax
