#include "clustering/kmeans_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

#include "errors.hpp"

namespace refrax {

namespace {

/* k-means++: first centre uniform, the rest ∝ squared distance */
Eigen::MatrixXd seed_plus_plus(const Eigen::MatrixXd& X, int k, std::mt19937& rng)
{
    const Eigen::Index n = X.rows();
    Eigen::MatrixXd C(k, X.cols());
    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
    C.row(0) = X.row(pick(rng));

    Eigen::VectorXd d2(n);
    for (Eigen::Index i = 0; i < n; ++i) d2(i) = (X.row(i) - C.row(0)).squaredNorm();

    for (int c = 1; c < k; ++c) {
        const double tot = d2.sum();
        Eigen::Index chosen = pick(rng);
        if (tot > 0.0) {
            std::uniform_real_distribution<double> U(0.0, tot);
            double r = U(rng), acc = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                acc += d2(i);
                if (acc >= r) { chosen = i; break; }
            }
        }
        C.row(c) = X.row(chosen);
        for (Eigen::Index i = 0; i < n; ++i)
            d2(i) = std::min(d2(i), (X.row(i) - C.row(c)).squaredNorm());
    }
    return C;
}

int nearest(const Eigen::MatrixXd& C, const Eigen::RowVectorXd& x, double& d2)
{
    int best = 0;
    d2 = std::numeric_limits<double>::max();
    for (Eigen::Index c = 0; c < C.rows(); ++c) {
        const double v = (C.row(c) - x).squaredNorm();
        if (v < d2) { d2 = v; best = int(c); }
    }
    return best;
}

}  // namespace

KMeansClusterer::KMeansClusterer(int k, const ClusterOpt& opt) : k_(k), opt_(opt)
{
    if (k_ < 1) throw InvalidRangeError("k-means needs k >= 1");
}

void KMeansClusterer::fit(const Eigen::MatrixXd& X)
{
    const Eigen::Index n = X.rows();
    if (n < k_)
        throw InsufficientValidSamplesError("k-means: " + std::to_string(n) +
                                            " samples cannot form " + std::to_string(k_) +
                                            " clusters");

    /* tolerance relative to the mean per-feature variance */
    const Eigen::RowVectorXd mu = X.colwise().mean();
    const double var = (X.rowwise() - mu).array().square().colwise().mean().mean();
    const double tol = opt_.tol * (var > 0.0 ? var : 1.0);

    std::mt19937 rng(opt_.seed);
    double best_inertia = std::numeric_limits<double>::max();
    std::vector<int> label(static_cast<std::size_t>(n));

    for (int run = 0; run < std::max(1, opt_.n_init); ++run) {
        Eigen::MatrixXd C = seed_plus_plus(X, k_, rng);
        double inertia = 0.0;
        int it = 0;
        for (; it < opt_.max_iter; ++it) {
            inertia = 0.0;
            Eigen::VectorXd dist(n);
            for (Eigen::Index i = 0; i < n; ++i) {
                double d2 = 0.0;
                label[std::size_t(i)] = nearest(C, X.row(i), d2);
                dist(i) = d2;
                inertia += d2;
            }

            Eigen::MatrixXd S = Eigen::MatrixXd::Zero(k_, X.cols());
            Eigen::VectorXi cnt = Eigen::VectorXi::Zero(k_);
            for (Eigen::Index i = 0; i < n; ++i) {
                S.row(label[std::size_t(i)]) += X.row(i);
                ++cnt(label[std::size_t(i)]);
            }
            Eigen::MatrixXd Cn(k_, X.cols());
            for (int c = 0; c < k_; ++c) {
                if (cnt(c) > 0) {
                    Cn.row(c) = S.row(c) / double(cnt(c));
                    continue;
                }
                /* empty: reseed at the point farthest from its centre */
                Eigen::Index far = 0;
                dist.maxCoeff(&far);
                Cn.row(c) = X.row(far);
                dist(far) = 0.0;
            }
            const double shift = (Cn - C).squaredNorm();
            C = Cn;
            if (shift <= tol) { ++it; break; }
        }
        /* final inertia against the converged centres */
        inertia = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            double d2 = 0.0;
            nearest(C, X.row(i), d2);
            inertia += d2;
        }
        logD("k-means run " + std::to_string(run) + ": inertia " + format_fixed(inertia, 4) +
             " after " + std::to_string(it) + " iterations");
        if (inertia < best_inertia) {
            best_inertia = inertia;
            C_ = C;
        }
    }
    inertia_ = best_inertia;
}

int KMeansClusterer::assign(const Eigen::VectorXd& x, double* dist) const
{
    if (C_.rows() == 0) throw std::logic_error("k-means: assign before fit");
    if (x.size() != C_.cols())
        throw std::runtime_error("Shape mismatch: feature " + std::to_string(x.size()) +
                                 " vs centroid " + std::to_string(C_.cols()));
    double d2 = 0.0;
    const int id = nearest(C_, x.transpose(), d2);
    if (dist) *dist = std::sqrt(d2);
    return id;
}

void KMeansClusterer::retain(const std::vector<int>& ids)
{
    Eigen::MatrixXd C(Eigen::Index(ids.size()), C_.cols());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] < 0 || ids[i] >= C_.rows())
            throw InvalidRangeError("retain: no cluster " + std::to_string(ids[i]));
        C.row(Eigen::Index(i)) = C_.row(ids[i]);
    }
    C_ = C;
    k_ = int(ids.size());
}

json KMeansClusterer::to_json() const
{
    return {{"kind", "kmeans"}, {"k", k_}, {"centroids", mat_to_json(C_)},
            {"inertia", inertia_}};
}

void KMeansClusterer::from_json(const json& j)
{
    C_       = mat_from_json(j.at("centroids"));
    k_       = int(C_.rows());
    inertia_ = j.value("inertia", 0.0);
}

/* ────────── factories ────────── */
std::unique_ptr<IClusterer> make_kmeans(int k, const ClusterOpt& opt)
{
    return std::make_unique<KMeansClusterer>(k, opt);
}

std::unique_ptr<IClusterer> make_clusterer(ClusterAlgo algo, int k, const ClusterOpt& opt)
{
    switch (algo) {
    case ClusterAlgo::KMeans: return make_kmeans(k, opt);
    case ClusterAlgo::Som:    return make_som(k, opt);
    }
    throw InvalidRangeError("unknown clustering algorithm");
}

std::unique_ptr<IClusterer> clusterer_from_json(const json& j)
{
    const std::string kind = j.at("kind").get<std::string>();
    ClusterAlgo algo;
    try {
        algo = parse_cluster_algo(kind);
    } catch (const InvalidRangeError& e) {
        throw ModelFormatError(e.what());
    }
    ClusterOpt opt;
    auto c = make_clusterer(algo, std::max(1, j.value("k", 1)), opt);
    c->from_json(j);
    return c;
}

}  // namespace refrax
