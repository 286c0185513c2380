/* ──────────────────────────────────────────────────────────────
   kernel_svr.hpp   –  ε-insensitive kernel regression (libsvm)
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <memory>

#include <Eigen/Dense>

#include "config.hpp"

namespace refrax {

/*  ε-SVR trained by libsvm (EPSILON_SVR, RBF or LINEAR kernel).
    f(x) = Σ coefᵢ k(svᵢ, x) − ρ.
    The fitted support set is copied out of libsvm and shared between
    copies; trained and deserialized models predict through the same
    svm_model view.                                                    */
class KernelSvr {
public:
    explicit KernelSvr(const SvrOpt& opt = {});

    void   fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y);
    double predict(const Eigen::VectorXd& x) const;
    Eigen::VectorXd predict(const Eigen::MatrixXd& X) const;

    int    n_support() const;
    double gamma()     const { return gamma_; }

    json to_json() const;
    static KernelSvr from_json(const json& j);

private:
    struct Fitted;

    SvrOpt                        opt_;
    double                        gamma_ = 1.0;
    std::shared_ptr<const Fitted> fit_;
};

}  // namespace refrax
