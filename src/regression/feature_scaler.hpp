#pragma once
#include <Eigen/Dense>

#include "common.hpp"

namespace refrax {

/* per-column z-score; statistics are frozen once fit() has seen the training rows */
class FeatureScaler {
    Eigen::RowVectorXd mean_, std_;
    bool               frozen_ = false;
public:
    void fit(const Eigen::MatrixXd& X);            // zero std → 1
    bool frozen() const { return frozen_; }
    int  dim()    const { return int(mean_.size()); }

    Eigen::VectorXd transform(const Eigen::VectorXd& x) const;   // NaN → 0 after scaling
    Eigen::MatrixXd transform(const Eigen::MatrixXd& X) const;

    json to_json() const;
    static FeatureScaler from_json(const json& j);
};

}  // namespace refrax
