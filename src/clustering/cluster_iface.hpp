/* ──────────────────────────────────────────────────────────────
   cluster_iface.hpp   –  the clustering abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <memory>
#include <vector>

#include <Eigen/Dense>

#include "config.hpp"

namespace refrax {

struct IClusterer {
    virtual ~IClusterer() = default;

    /*  partition the (already standardized) rows of X. Throws
        InsufficientValidSamplesError if X cannot hold the requested
        number of clusters.                                          */
    virtual void fit(const Eigen::MatrixXd& X) = 0;

    /*  nearest cluster under the metric used in fit (Euclidean to the
        centroid / best-matching node); optional distance out.       */
    virtual int assign(const Eigen::VectorXd& x, double* dist = nullptr) const = 0;

    virtual Eigen::VectorXd representative(int id) const = 0;
    virtual int             n_clusters() const = 0;

    /*  keep only `ids` (ascending), renumbered 0..ids.size()-1 in that
        order; later assignments only consider the survivors.         */
    virtual void retain(const std::vector<int>& ids) = 0;

    virtual ClusterAlgo kind() const = 0;
    virtual json        to_json() const = 0;
    virtual void        from_json(const json& j) = 0;

    std::vector<int> assign_all(const Eigen::MatrixXd& X) const
    {
        std::vector<int> out(std::size_t(X.rows()));
        for (Eigen::Index r = 0; r < X.rows(); ++r)
            out[std::size_t(r)] = assign(X.row(r).transpose());
        return out;
    }
};

/* factory fns, one per algorithm */
std::unique_ptr<IClusterer> make_kmeans(int k, const ClusterOpt& opt);
std::unique_ptr<IClusterer> make_som(int k, const ClusterOpt& opt);

std::unique_ptr<IClusterer> make_clusterer(ClusterAlgo algo, int k, const ClusterOpt& opt);
/* rebuilds whatever to_json() wrote; ModelFormatError on unknown kind */
std::unique_ptr<IClusterer> clusterer_from_json(const json& j);

}  // namespace refrax
