/* ──────────────────────────────────────────────────────────────
   kmeans_clusterer.hpp  –  k-means++ seeded Lloyd iterations
   ────────────────────────────────────────────────────────────── */
#pragma once

#include "clustering/cluster_iface.hpp"

namespace refrax {

class KMeansClusterer final : public IClusterer {
public:
    KMeansClusterer(int k, const ClusterOpt& opt);

    void fit(const Eigen::MatrixXd& X) override;
    int  assign(const Eigen::VectorXd& x, double* dist = nullptr) const override;
    Eigen::VectorXd representative(int id) const override { return C_.row(id).transpose(); }
    int  n_clusters() const override { return int(C_.rows()); }
    void retain(const std::vector<int>& ids) override;

    ClusterAlgo kind() const override { return ClusterAlgo::KMeans; }
    json to_json() const override;
    void from_json(const json& j) override;

    double inertia() const { return inertia_; }
    const Eigen::MatrixXd& centroids() const { return C_; }

private:
    int             k_;
    ClusterOpt      opt_;
    Eigen::MatrixXd C_;          // k × d
    double          inertia_ = 0.0;
};

}  // namespace refrax
