#include <gtest/gtest.h>

#include <set>

#include "clustering/kmeans_clusterer.hpp"
#include "clustering/som_clusterer.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::make_blobs;

namespace {

/* every blob maps onto exactly one cluster and no two blobs share one */
void expect_blobs_separated(const IClusterer& c, const Eigen::MatrixXd& X,
                            const std::vector<int>& blob, int n_blobs)
{
    const auto a = c.assign_all(X);
    std::vector<std::set<int>> per_blob(static_cast<std::size_t>(n_blobs));
    for (std::size_t i = 0; i < a.size(); ++i) per_blob[std::size_t(blob[i])].insert(a[i]);
    std::set<int> used;
    for (const auto& s : per_blob) {
        ASSERT_EQ(s.size(), 1u);
        used.insert(*s.begin());
    }
    EXPECT_EQ(int(used.size()), n_blobs);
}

}  // namespace

TEST(SomGrid, ShapeFollowsNodeCount)
{
    int r = 0, c = 0;
    som_grid_shape(4, r, c);
    EXPECT_EQ(r, 2); EXPECT_EQ(c, 2);
    som_grid_shape(6, r, c);
    EXPECT_EQ(r, 2); EXPECT_EQ(c, 3);
    som_grid_shape(5, r, c);
    EXPECT_EQ(r, 1); EXPECT_EQ(c, 5);
    EXPECT_THROW(som_grid_shape(0, r, c), InvalidRangeError);
}

TEST(KMeans, SeparatesBlobs)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    std::vector<int> blob;
    make_blobs({15, 15, 15}, 4, 3, X, y, &blob);

    ClusterOpt opt;
    KMeansClusterer km(3, opt);
    km.fit(X);
    EXPECT_EQ(km.n_clusters(), 3);
    expect_blobs_separated(km, X, blob, 3);
    EXPECT_GT(km.inertia(), 0.0);

    double d = -1.0;
    km.assign(X.row(0).transpose(), &d);
    EXPECT_GE(d, 0.0);
    EXPECT_LT(d, 5.0);
}

TEST(KMeans, SameSeedSameCentroids)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({10, 10, 10}, 4, 5, X, y);
    ClusterOpt opt;
    KMeansClusterer a(3, opt), b(3, opt);
    a.fit(X);
    b.fit(X);
    EXPECT_TRUE(a.centroids().isApprox(b.centroids()));
}

TEST(KMeans, MoreClustersThanSamplesIsInsufficient)
{
    Eigen::MatrixXd X = Eigen::MatrixXd::Random(3, 2);
    KMeansClusterer km(5, ClusterOpt{});
    EXPECT_THROW(km.fit(X), InsufficientValidSamplesError);
}

TEST(KMeans, RetainRenumbersSurvivors)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({10, 10, 10}, 4, 9, X, y);
    KMeansClusterer km(3, ClusterOpt{});
    km.fit(X);
    const Eigen::VectorXd keep = km.representative(2);
    km.retain({2});
    EXPECT_EQ(km.n_clusters(), 1);
    EXPECT_TRUE(km.representative(0).isApprox(keep));
    for (Eigen::Index r = 0; r < X.rows(); ++r) EXPECT_EQ(km.assign(X.row(r).transpose()), 0);
    EXPECT_THROW(km.retain({3}), InvalidRangeError);
}

TEST(KMeans, JsonRestoresAssignments)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({8, 8}, 3, 2, X, y);
    KMeansClusterer km(2, ClusterOpt{});
    km.fit(X);
    const auto back = clusterer_from_json(km.to_json());
    EXPECT_EQ(back->kind(), ClusterAlgo::KMeans);
    EXPECT_EQ(back->assign_all(X), km.assign_all(X));
}

TEST(Som, TrainingReducesQuantizationError)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    std::vector<int> blob;
    make_blobs({12, 12, 12, 12}, 6, 4, X, y, &blob);

    ClusterOpt opt;
    SomClusterer som(4, opt);
    som.fit(X);
    EXPECT_EQ(som.rows(), 2);
    EXPECT_EQ(som.cols(), 2);
    EXPECT_EQ(som.n_clusters(), 4);

    const auto& qe = som.quantization_history();
    const auto& te = som.topographic_history();
    ASSERT_GE(qe.size(), 2u);
    EXPECT_EQ(qe.size(), te.size());
    EXPECT_LT(qe.back(), qe.front());
    EXPECT_DOUBLE_EQ(qe.back(), som.quantization_error(X));
    for (double t : te) {
        EXPECT_GE(t, 0.0);
        EXPECT_LE(t, 1.0);
    }

    const Eigen::MatrixXd U = som.u_matrix();
    EXPECT_EQ(U.rows(), 2);
    EXPECT_EQ(U.cols(), 2);
    EXPECT_GT(U.minCoeff(), 0.0);
}

TEST(Som, RetainAndJson)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({10, 10, 10, 10}, 6, 8, X, y);
    ClusterOpt opt;
    SomClusterer som(4, opt);
    som.fit(X);
    som.retain({1, 3});
    EXPECT_EQ(som.n_clusters(), 2);

    const auto back = clusterer_from_json(som.to_json());
    EXPECT_EQ(back->kind(), ClusterAlgo::Som);
    EXPECT_EQ(back->n_clusters(), 2);
    EXPECT_EQ(back->assign_all(X), som.assign_all(X));
    EXPECT_TRUE(back->representative(1).isApprox(som.representative(1)));
}

TEST(Som, TooFewSamplesForTheGrid)
{
    SomClusterer som(6, ClusterOpt{});
    EXPECT_THROW(som.fit(Eigen::MatrixXd::Random(4, 3)), InsufficientValidSamplesError);
}

TEST(ClusterFactory, BuildsRequestedKind)
{
    ClusterOpt opt;
    EXPECT_EQ(make_clusterer(ClusterAlgo::KMeans, 3, opt)->kind(), ClusterAlgo::KMeans);
    EXPECT_EQ(make_clusterer(ClusterAlgo::Som, 3, opt)->kind(), ClusterAlgo::Som);

    EXPECT_THROW(clusterer_from_json(json{{"kind", "dbscan"}, {"k", 2}}), ModelFormatError);

    opt.som.sigma_decay = "cubic";
    EXPECT_THROW(make_som(4, opt), InvalidRangeError);
    opt.som.sigma_decay  = "linear";
    opt.som.neighborhood = "triangle";
    EXPECT_THROW(make_som(4, opt), InvalidRangeError);
}
