/* ──────────────────────────────────────────────────────────────
   som_clusterer.hpp  –  rectangular self-organizing map
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <random>
#include <vector>

#include "clustering/cluster_iface.hpp"

namespace refrax {

/* rows = largest divisor of k not above √k, cols = k / rows */
void som_grid_shape(int k, int& rows, int& cols);

class SomClusterer final : public IClusterer {
public:
    SomClusterer(int k, const ClusterOpt& opt);

    void fit(const Eigen::MatrixXd& X) override;
    int  assign(const Eigen::VectorXd& x, double* dist = nullptr) const override;
    Eigen::VectorXd representative(int id) const override;
    int  n_clusters() const override { return int(active_.size()); }
    void retain(const std::vector<int>& ids) override;

    ClusterAlgo kind() const override { return ClusterAlgo::Som; }
    json to_json() const override;
    void from_json(const json& j) override;

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    const Eigen::MatrixXd& weights() const { return W_; }       // (rows·cols) × d, node r*cols+c

    /* sampled every kErrorEvery updates, first entry before training */
    const std::vector<double>& quantization_history() const { return qe_hist_; }
    const std::vector<double>& topographic_history()  const { return te_hist_; }
    double quantization_error(const Eigen::MatrixXd& X) const;
    double topographic_error(const Eigen::MatrixXd& X) const;

    /* mean distance of every node to its 4-neighbours, rows × cols */
    Eigen::MatrixXd u_matrix() const;

    static constexpr int kErrorEvery = 10;

private:
    void   init_weights(const Eigen::MatrixXd& X, std::mt19937& rng);
    int    best_node(const Eigen::RowVectorXd& x, double& d2) const;   // over all nodes
    double decay(const std::string& how, double v0, int t) const;
    double neighbourhood(double grid_d2, double sigma) const;

    int              rows_ = 1, cols_ = 1;
    ClusterOpt       opt_;
    Eigen::MatrixXd  W_;
    std::vector<int> active_;            // cluster id → node index
    std::vector<double> qe_hist_, te_hist_;
};

}  // namespace refrax
