#pragma once
#include <cstddef>

#include <Eigen/Dense>

#include "common.hpp"

namespace refrax {

/* held-out regression quality of a refractive-index predictor */
struct EvalMetrics {
    double      mae      = 0.0;
    double      rmse     = 0.0;
    double      medae    = 0.0;
    double      sse      = 0.0;
    double      r2       = 0.0;
    double      accuracy = 0.0;   // % of samples with |pred − true| / true ≤ rel_tol
    std::size_t count    = 0;
};

EvalMetrics evaluate(const Eigen::VectorXd& pred, const Eigen::VectorXd& truth,
                     double rel_tol = 1e-3);

void to_json(json& j, const EvalMetrics& m);
void from_json(const json& j, EvalMetrics& m);

}  // namespace refrax
