#include "regression/feature_scaler.hpp"

#include <cmath>
#include <stdexcept>

namespace refrax {

void FeatureScaler::fit(const Eigen::MatrixXd& X)
{
    if (frozen_) throw std::logic_error("FeatureScaler: statistics already frozen");
    if (X.rows() == 0) throw std::runtime_error("FeatureScaler: empty training matrix");

    mean_ = X.colwise().mean();
    std_  = ((X.rowwise() - mean_).array().square().colwise().sum() / double(X.rows()))
                .sqrt().matrix();
    for (Eigen::Index c = 0; c < std_.size(); ++c)
        if (!(std_(c) > 1e-12)) std_(c) = 1.0;     // constant or NaN column
    for (Eigen::Index c = 0; c < mean_.size(); ++c)
        if (!std::isfinite(mean_(c))) mean_(c) = 0.0;
    frozen_ = true;
}

Eigen::VectorXd FeatureScaler::transform(const Eigen::VectorXd& x) const
{
    if (x.size() != mean_.size())
        throw std::runtime_error("Shape mismatch: feature " + std::to_string(x.size()) +
                                 " vs scaler " + std::to_string(mean_.size()));
    Eigen::VectorXd z = (x - mean_.transpose()).cwiseQuotient(std_.transpose());
    for (Eigen::Index i = 0; i < z.size(); ++i)
        if (!std::isfinite(z(i))) z(i) = 0.0;
    return z;
}

Eigen::MatrixXd FeatureScaler::transform(const Eigen::MatrixXd& X) const
{
    Eigen::MatrixXd Z(X.rows(), X.cols());
    for (Eigen::Index r = 0; r < X.rows(); ++r)
        Z.row(r) = transform(Eigen::VectorXd(X.row(r).transpose())).transpose();
    return Z;
}

json FeatureScaler::to_json() const
{
    return {{"mean", vec_to_json(mean_.transpose())}, {"std", vec_to_json(std_.transpose())}};
}

FeatureScaler FeatureScaler::from_json(const json& j)
{
    FeatureScaler s;
    s.mean_ = vec_from_json(j.at("mean")).transpose();
    s.std_  = vec_from_json(j.at("std")).transpose();
    if (s.mean_.size() != s.std_.size())
        throw std::runtime_error("Shape mismatch in FeatureScaler::from_json");
    s.frozen_ = true;
    return s;
}

}  // namespace refrax
