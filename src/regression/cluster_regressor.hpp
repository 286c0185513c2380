/* ──────────────────────────────────────────────────────────────
   cluster_regressor.hpp  –  clustering + one kernel SVR per cluster
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <memory>
#include <vector>

#include <Eigen/Dense>

#include "clustering/cluster_iface.hpp"
#include "config.hpp"
#include "regression/feature_scaler.hpp"
#include "regression/kernel_svr.hpp"

namespace refrax {

struct ClusterModel {
    KernelSvr   svr;
    std::size_t n_samples = 0;
    double      radius    = 0.0;    // mean member distance to the representative
    double      val_mae   = 0.0;    // held-out MAE (training MAE when not estimated)
    bool        val_held_out = false;
};

struct ClusterPrediction {
    double value      = 0.0;
    int    cluster_id = -1;
    double confidence = 0.0;
    double distance   = 0.0;        // standardized feature → representative
};

/*  1 − (w_d · d/(d+r) + w_e · e/(e+s)), clamped to [0,1].
    d distance, r cluster radius, e cluster MAE, s target spread.   */
double combine_confidence(double distance, double radius, double mae, double spread,
                          const ConfidenceOpt& opt);

class ClusterRegressionModel {
public:
    /*  Standardize → cluster (algo, k) → one SVR per cluster with at
        least copt.min_cluster_samples members. Smaller clusters are
        dropped and the clusterer re-indexed; if none qualifies
        InsufficientValidSamplesError.                                */
    static ClusterRegressionModel fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                                      ClusterAlgo algo, int k, const ClusterOpt& copt,
                                      const SvrOpt& sopt, const ConfidenceOpt& conf = {});

    ClusterPrediction predict(const Eigen::VectorXd& feature) const;
    Eigen::VectorXd   predict_values(const Eigen::MatrixXd& X) const;

    int  n_clusters()  const { return int(clusters_.size()); }
    int  feature_dim() const { return scaler_.dim(); }
    ClusterAlgo algorithm() const { return clusterer_->kind(); }
    const ClusterModel& cluster(int id) const { return clusters_.at(std::size_t(id)); }
    const IClusterer&   clusterer() const { return *clusterer_; }
    const std::vector<int>& dropped_clusters() const { return dropped_; }
    double target_spread() const { return target_spread_; }

    json to_json() const;
    static ClusterRegressionModel from_json(const json& j);

private:
    FeatureScaler               scaler_;
    std::unique_ptr<IClusterer> clusterer_;
    std::vector<ClusterModel>   clusters_;
    std::vector<int>            dropped_;        // pre-reindex ids of dropped clusters
    ConfidenceOpt               conf_{};
    double                      target_spread_ = 1.0;
};

}  // namespace refrax
