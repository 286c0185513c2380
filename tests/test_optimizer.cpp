#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <set>

#include "errors.hpp"
#include "training/optimizer.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::make_blobs;

namespace {

RefraxConfig quick_config(int n_trials)
{
    RefraxConfig cfg;
    cfg.tune.n_trials  = n_trials;
    cfg.tune.n_startup = 3;
    cfg.tune.k_min     = 1;
    cfg.tune.k_max     = 3;
    cfg.tune.cv_folds  = 3;
    cfg.cluster.n_init = 3;
    cfg.cluster.som.max_iter = 200;
    cfg.cluster.min_cluster_samples = 8;
    return cfg;
}

}  // namespace

TEST(Splits, KFoldPartitionsEveryRow)
{
    const auto splits = make_splits(20, 4, 0.2, 7);
    ASSERT_EQ(splits.size(), 4u);
    std::multiset<int> seen;
    for (const auto& s : splits) {
        EXPECT_EQ(s.val.size(), 5u);
        EXPECT_EQ(s.train.size(), 15u);
        seen.insert(s.val.begin(), s.val.end());
        std::set<int> both(s.train.begin(), s.train.end());
        for (int v : s.val) EXPECT_EQ(both.count(v), 0u);
    }
    ASSERT_EQ(seen.size(), 20u);
    for (int i = 0; i < 20; ++i) EXPECT_EQ(seen.count(i), 1u);

    EXPECT_EQ(make_splits(20, 4, 0.2, 7)[2].val, splits[2].val);
}

TEST(Splits, HoldoutKeepsBothSidesNonEmpty)
{
    const auto s = make_splits(10, 1, 0.2, 3);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s[0].val.size(), 2u);
    EXPECT_EQ(s[0].train.size(), 8u);

    const auto tiny = make_splits(2, 0, 0.9, 3);
    EXPECT_EQ(tiny[0].val.size(), 1u);
    EXPECT_EQ(tiny[0].train.size(), 1u);
    EXPECT_THROW(make_splits(1, 3, 0.2, 3), InsufficientValidSamplesError);
}

TEST(Tpe, SamplesStayInsideTheSpaceAndRepeat)
{
    const std::vector<ParamSpec> space{{"algo", ParamSpec::Categorical, 0, 0, 3},
                                       {"k", ParamSpec::Int, 2, 5, 0},
                                       {"C", ParamSpec::LogFloat, 1e-3, 1e3, 0}};
    TpeConfig tc;
    tc.n_startup = 5;
    TpeSampler a(space, tc), b(space, tc);
    for (int i = 0; i < 30; ++i) {
        const ParamSet pa = a.ask();
        const ParamSet pb = b.ask();
        EXPECT_EQ(pa, pb);

        const double algo = pa.at("algo"), k = pa.at("k"), C = pa.at("C");
        EXPECT_TRUE(algo == 0 || algo == 1 || algo == 2);
        EXPECT_EQ(k, std::round(k));
        EXPECT_GE(k, 2);
        EXPECT_LE(k, 5);
        EXPECT_GE(C, 1e-3);
        EXPECT_LE(C, 1e3);

        /* k = 3 is cheap, everything else is not; failures every fifth ask */
        const double score = i % 5 == 4 ? std::numeric_limits<double>::infinity()
                                        : std::fabs(k - 3.0) + std::fabs(std::log10(C));
        a.tell(pa, score);
        b.tell(pb, score);
    }
    EXPECT_EQ(a.n_observed(), 30u);
}

TEST(Tpe, RejectsEmptyRanges)
{
    TpeConfig tc;
    EXPECT_THROW(TpeSampler({{"C", ParamSpec::LogFloat, 0.0, 1.0, 0}}, tc), InvalidRangeError);
    EXPECT_THROW(TpeSampler({{"a", ParamSpec::Categorical, 0, 0, 0}}, tc), InvalidRangeError);
    tc.gamma = 1.5;
    EXPECT_THROW(TpeSampler({{"k", ParamSpec::Int, 1, 3, 0}}, tc), InvalidRangeError);
}

TEST(Optimize, BestIsTheLowestSuccessfulTrial)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12, 12, 12}, 6, 31, X, y);
    const RefraxConfig cfg = quick_config(6);

    int events = 0;
    const auto res = optimize(X, y, cfg, nullptr, [&](const ProgressEvent&) { ++events; });
    EXPECT_EQ(res.history.size(), 6u);
    EXPECT_EQ(events, 6);
    EXPECT_FALSE(res.cancelled);
    EXPECT_FALSE(res.timed_out);
    ASSERT_TRUE(res.best.ok);

    double lowest = std::numeric_limits<double>::infinity();
    for (const auto& t : res.history) {
        if (t.ok) lowest = std::min(lowest, t.score);
        EXPECT_GE(t.params.k, 1);
        EXPECT_LE(t.params.k, 3);
    }
    EXPECT_DOUBLE_EQ(res.best.score, lowest);
    EXPECT_TRUE(std::isfinite(res.best.score));
}

TEST(Optimize, CancelBeforeFirstTrialAborts)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12}, 4, 5, X, y);
    CancelToken tok;
    tok.cancel();
    EXPECT_THROW(optimize(X, y, quick_config(5), &tok), TrainingAbortedError);
}

TEST(Optimize, CancelMidRunKeepsBestSoFar)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12, 12}, 4, 6, X, y);
    RefraxConfig cfg = quick_config(20);
    cfg.tune.k_max = 1;                       // every trial succeeds

    CancelToken tok;
    const auto res = optimize(X, y, cfg, &tok, [&](const ProgressEvent& e) {
        if (e.count == 3) tok.cancel();
    });
    EXPECT_TRUE(res.cancelled);
    EXPECT_EQ(res.history.size(), 3u);
    EXPECT_TRUE(res.best.ok);
}

TEST(Optimize, TimeoutBeforeFirstTrialIsReportedAsTimeout)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12}, 4, 5, X, y);
    RefraxConfig cfg = quick_config(5);
    cfg.tune.timeout_s = 0.0;
    try {
        optimize(X, y, cfg);
        FAIL() << "expected TrainingAbortedError";
    } catch (const TrainingAbortedError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
    }
}

TEST(Optimize, EveryTrialScoresOnTheSameFolds)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12, 12, 12}, 6, 23, X, y);
    const RefraxConfig cfg = quick_config(5);
    const auto res = optimize(X, y, cfg);
    ASSERT_EQ(res.history.size(), 5u);

    /* rescoring each trial on the run's seeded folds reproduces its score */
    const auto folds = make_splits(int(X.rows()), cfg.tune.cv_folds, cfg.tune.validation_ratio,
                                   cfg.tune.seed);
    for (const auto& t : res.history) {
        if (!t.ok) continue;
        EXPECT_DOUBLE_EQ(score_trial(X, y, folds, t.params, cfg), t.score) << t.number;
    }

    /* a different shuffle gives different folds, hence different scores */
    const auto other = make_splits(int(X.rows()), cfg.tune.cv_folds, cfg.tune.validation_ratio,
                                   cfg.tune.seed + 1);
    EXPECT_NE(other[0].val, folds[0].val);
}

TEST(Optimize, NoClusterEverLargeEnough)
{
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12}, 4, 8, X, y);
    RefraxConfig cfg = quick_config(3);
    cfg.cluster.min_cluster_samples = 100;
    EXPECT_THROW(optimize(X, y, cfg), NoValidConfigurationError);
}

TEST(TrialRecord, FailedScoreSurvivesJson)
{
    TrialRecord t;
    t.number  = 4;
    t.score   = std::numeric_limits<double>::infinity();
    t.message = "insufficient valid samples";
    t.params.algo = ClusterAlgo::Som;
    t.params.k    = 2;
    const json j = t;
    EXPECT_TRUE(j.at("score").is_null());

    const auto back = json::parse(j.dump()).get<TrialRecord>();
    EXPECT_TRUE(std::isinf(back.score));
    EXPECT_FALSE(back.ok);
    EXPECT_EQ(back.params.algo, ClusterAlgo::Som);
    EXPECT_EQ(back.params.k, 2);
}
