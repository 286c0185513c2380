#include "regression/cluster_regressor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

#include "errors.hpp"

namespace refrax {

namespace {

Eigen::MatrixXd take_rows(const Eigen::MatrixXd& X, const std::vector<int>& rows)
{
    Eigen::MatrixXd out(Eigen::Index(rows.size()), X.cols());
    for (std::size_t i = 0; i < rows.size(); ++i) out.row(Eigen::Index(i)) = X.row(rows[i]);
    return out;
}

Eigen::VectorXd take(const Eigen::VectorXd& y, const std::vector<int>& rows)
{
    Eigen::VectorXd out(Eigen::Index(rows.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) out(Eigen::Index(i)) = y(rows[i]);
    return out;
}

/* k-fold MAE over one cluster's members; training MAE when too small */
double cluster_mae(const Eigen::MatrixXd& Xc, const Eigen::VectorXd& yc, const KernelSvr& full,
                   const ClusterOpt& copt, const SvrOpt& sopt, std::uint32_t seed, bool& held_out)
{
    const int m = int(Xc.rows());
    const int F = copt.cluster_cv_folds;
    held_out = copt.estimate_cluster_error && F >= 2 && m >= 2 * F;
    if (!held_out)
        return (full.predict(Xc) - yc).cwiseAbs().mean();

    std::vector<int> idx(static_cast<std::size_t>(m));
    std::iota(idx.begin(), idx.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(idx.begin(), idx.end(), rng);

    double err = 0.0;
    for (int f = 0; f < F; ++f) {
        std::vector<int> tr, va;
        for (int i = 0; i < m; ++i) (i % F == f ? va : tr).push_back(idx[std::size_t(i)]);
        KernelSvr svr(sopt);
        svr.fit(take_rows(Xc, tr), take(yc, tr));
        err += (svr.predict(take_rows(Xc, va)) - take(yc, va)).cwiseAbs().sum();
    }
    return err / double(m);
}

}  // namespace

double combine_confidence(double distance, double radius, double mae, double spread,
                          const ConfidenceOpt& opt)
{
    const double dn = distance > 0.0 ? distance / (distance + std::max(radius, 1e-12)) : 0.0;
    const double en = mae > 0.0 ? mae / (mae + std::max(spread, opt.min_target_spread)) : 0.0;
    const double wd = opt.distance_weight;
    const double c  = 1.0 - (wd * dn + (1.0 - wd) * en);
    return std::min(1.0, std::max(0.0, c));
}

ClusterRegressionModel ClusterRegressionModel::fit(const Eigen::MatrixXd& X,
                                                   const Eigen::VectorXd& y, ClusterAlgo algo,
                                                   int k, const ClusterOpt& copt,
                                                   const SvrOpt& sopt, const ConfidenceOpt& conf)
{
    if (X.rows() != y.size() || X.rows() == 0)
        throw std::runtime_error("Shape mismatch: " + std::to_string(X.rows()) + " rows vs " +
                                 std::to_string(y.size()) + " targets");

    ClusterRegressionModel M;
    M.conf_ = conf;
    M.scaler_.fit(X);
    const Eigen::MatrixXd Z = M.scaler_.transform(X);

    const double ystd = std::sqrt((y.array() - y.mean()).square().mean());
    M.target_spread_ = std::max(ystd, conf.min_target_spread);

    M.clusterer_ = make_clusterer(algo, k, copt);
    M.clusterer_->fit(Z);
    const std::vector<int> label = M.clusterer_->assign_all(Z);

    const int K = M.clusterer_->n_clusters();
    std::vector<std::vector<int>> members(static_cast<std::size_t>(K));
    for (std::size_t i = 0; i < label.size(); ++i) members[std::size_t(label[i])].push_back(int(i));

    std::vector<int> keep;
    for (int c = 0; c < K; ++c) {
        if (members[std::size_t(c)].size() >= copt.min_cluster_samples) {
            keep.push_back(c);
            continue;
        }
        M.dropped_.push_back(c);
        logW(to_string(algo) + " cluster " + std::to_string(c) + " dropped: " +
             std::to_string(members[std::size_t(c)].size()) + " samples < " +
             std::to_string(copt.min_cluster_samples));
    }
    if (keep.empty())
        throw InsufficientValidSamplesError("insufficient valid samples: no " + to_string(algo) +
                                            " cluster of k=" + std::to_string(k) + " reaches " +
                                            std::to_string(copt.min_cluster_samples) + " members");
    M.clusterer_->retain(keep);

    for (std::size_t id = 0; id < keep.size(); ++id) {
        const auto& rows = members[std::size_t(keep[id])];
        const Eigen::MatrixXd Zc = take_rows(Z, rows);
        const Eigen::VectorXd yc = take(y, rows);

        ClusterModel cm{KernelSvr(sopt)};
        cm.svr.fit(Zc, yc);
        cm.n_samples = rows.size();

        const Eigen::VectorXd rep = M.clusterer_->representative(int(id));
        double rsum = 0.0;
        for (Eigen::Index r = 0; r < Zc.rows(); ++r) rsum += (Zc.row(r).transpose() - rep).norm();
        cm.radius  = rsum / double(Zc.rows());
        cm.val_mae = cluster_mae(Zc, yc, cm.svr, copt, sopt, copt.seed + std::uint32_t(id),
                                 cm.val_held_out);
        logD("cluster " + std::to_string(id) + ": " + std::to_string(cm.n_samples) +
             " samples, " + std::to_string(cm.svr.n_support()) + " SVs, radius " +
             format_fixed(cm.radius, 3) + ", MAE " + format_fixed(cm.val_mae, 5));
        M.clusters_.push_back(std::move(cm));
    }
    return M;
}

ClusterPrediction ClusterRegressionModel::predict(const Eigen::VectorXd& feature) const
{
    const Eigen::VectorXd z = scaler_.transform(feature);
    ClusterPrediction p;
    p.cluster_id = clusterer_->assign(z, &p.distance);
    const ClusterModel& cm = clusters_.at(std::size_t(p.cluster_id));
    p.value      = cm.svr.predict(z);
    p.confidence = combine_confidence(p.distance, cm.radius, cm.val_mae, target_spread_, conf_);
    return p;
}

Eigen::VectorXd ClusterRegressionModel::predict_values(const Eigen::MatrixXd& X) const
{
    Eigen::VectorXd out(X.rows());
    for (Eigen::Index r = 0; r < X.rows(); ++r)
        out(r) = predict(Eigen::VectorXd(X.row(r).transpose())).value;
    return out;
}

json ClusterRegressionModel::to_json() const
{
    json cl = json::array();
    for (const auto& c : clusters_)
        cl.push_back({{"svr", c.svr.to_json()}, {"n_samples", c.n_samples},
                      {"radius", c.radius}, {"val_mae", c.val_mae},
                      {"val_held_out", c.val_held_out}});
    return {{"scaler", scaler_.to_json()},
            {"clusterer", clusterer_->to_json()},
            {"clusters", cl},
            {"dropped", dropped_},
            {"target_spread", target_spread_},
            {"confidence", {{"distance_weight", conf_.distance_weight},
                            {"min_target_spread", conf_.min_target_spread}}}};
}

ClusterRegressionModel ClusterRegressionModel::from_json(const json& j)
{
    ClusterRegressionModel M;
    M.scaler_    = FeatureScaler::from_json(j.at("scaler"));
    M.clusterer_ = clusterer_from_json(j.at("clusterer"));
    for (const auto& c : j.at("clusters")) {
        ClusterModel cm{KernelSvr::from_json(c.at("svr"))};
        cm.n_samples    = c.at("n_samples").get<std::size_t>();
        cm.radius       = c.at("radius").get<double>();
        cm.val_mae      = c.at("val_mae").get<double>();
        cm.val_held_out = c.value("val_held_out", false);
        M.clusters_.push_back(std::move(cm));
    }
    M.dropped_       = j.value("dropped", std::vector<int>{});
    M.target_spread_ = j.at("target_spread").get<double>();
    const auto& cj = j.at("confidence");
    M.conf_.distance_weight   = cj.at("distance_weight").get<double>();
    M.conf_.min_target_spread = cj.at("min_target_spread").get<double>();
    if (int(M.clusters_.size()) != M.clusterer_->n_clusters())
        throw ModelFormatError("model has " + std::to_string(M.clusters_.size()) +
                               " regressors for " + std::to_string(M.clusterer_->n_clusters()) +
                               " clusters");
    return M;
}

}  // namespace refrax
