#include "training/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace refrax {

EvalMetrics evaluate(const Eigen::VectorXd& pred, const Eigen::VectorXd& truth, double rel_tol)
{
    if (pred.size() != truth.size())
        throw std::runtime_error("Shape mismatch: " + std::to_string(pred.size()) +
                                 " predictions vs " + std::to_string(truth.size()) + " targets");
    EvalMetrics m;
    m.count = std::size_t(truth.size());
    if (m.count == 0) return m;

    const Eigen::VectorXd err = pred - truth;
    const double n = double(m.count);
    m.sse  = err.squaredNorm();
    m.mae  = err.cwiseAbs().mean();
    m.rmse = std::sqrt(m.sse / n);

    std::vector<double> ae(m.count);
    for (std::size_t i = 0; i < m.count; ++i) ae[i] = std::fabs(err(Eigen::Index(i)));
    std::sort(ae.begin(), ae.end());
    m.medae = m.count % 2 ? ae[m.count / 2] : 0.5 * (ae[m.count / 2 - 1] + ae[m.count / 2]);

    const double sst = (truth.array() - truth.mean()).square().sum();
    m.r2 = sst > 0.0 ? 1.0 - m.sse / sst : (m.sse == 0.0 ? 1.0 : 0.0);

    std::size_t hit = 0;
    for (Eigen::Index i = 0; i < truth.size(); ++i)
        if (truth(i) != 0.0 && std::fabs(err(i)) / std::fabs(truth(i)) <= rel_tol) ++hit;
    m.accuracy = 100.0 * double(hit) / n;
    return m;
}

void to_json(json& j, const EvalMetrics& m)
{
    j = {{"mae", m.mae}, {"rmse", m.rmse}, {"medae", m.medae}, {"sse", m.sse},
         {"r2", m.r2}, {"accuracy", m.accuracy}, {"count", m.count}};
}

void from_json(const json& j, EvalMetrics& m)
{
    m.mae      = j.at("mae").get<double>();
    m.rmse     = j.at("rmse").get<double>();
    m.medae    = j.at("medae").get<double>();
    m.sse      = j.at("sse").get<double>();
    m.r2       = j.at("r2").get<double>();
    m.accuracy = j.at("accuracy").get<double>();
    m.count    = j.at("count").get<std::size_t>();
}

}  // namespace refrax
