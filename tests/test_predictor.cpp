#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "errors.hpp"
#include "inference/predictor.hpp"
#include "training/trainer.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::TempDir;
using refrax::testing_util::small_backbone;
using refrax::testing_util::prism_points;

namespace {

void write_points(const std::string& path, const std::vector<RawPoint>& pts)
{
    std::ofstream out(path);
    out << "# incidence, deviation\n";
    for (const auto& p : pts) out << p.incidence_deg << ", " << p.deviation_deg << "\n";
}

}  // namespace

/* one small model trained on simulated templates, shared by every test */
class PredictorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite()
    {
        tmp_      = new TempDir();
        backbone_ = small_backbone(*tmp_);
        FeatureExtractor fx(backbone_);

        PrismSimulator sim(SimOpt{});
        const Dataset ds = dataset_from_curves(sim.generate(1.40, 1.60, 0.01).curves, fx);

        RefraxConfig cfg;
        cfg.tune.n_trials  = 4;
        cfg.tune.n_startup = 2;
        cfg.tune.k_min     = 1;
        cfg.tune.k_max     = 2;
        cfg.cluster.n_init = 3;
        cfg.cluster.som.max_iter = 200;
        cfg.cluster.min_cluster_samples = 5;
        Trainer trainer(cfg, fx.backbone_digest());
        model_ = std::make_shared<const TrainedModel>(trainer.run(ds));
    }

    static void TearDownTestSuite()
    {
        model_.reset();
        backbone_.reset();
        delete tmp_;
        tmp_ = nullptr;
    }

    Predictor loaded_predictor() const
    {
        Predictor p(backbone_, ImportOpt{}, 60.0);
        p.load(model_);
        return p;
    }

    static TempDir*                             tmp_;
    static BackboneHandle                       backbone_;
    static std::shared_ptr<const TrainedModel> model_;
};

TempDir*                             PredictorTest::tmp_ = nullptr;
BackboneHandle                       PredictorTest::backbone_;
std::shared_ptr<const TrainedModel> PredictorTest::model_;

TEST_F(PredictorTest, NothingLoaded)
{
    Predictor p(backbone_, ImportOpt{}, 60.0);
    EXPECT_FALSE(p.loaded());
    EXPECT_THROW(p.predict_one(prism_points(1.5, 44, 80)), NoModelLoadedError);
    EXPECT_THROW(p.predict_features(FeatureVector::Zero(128)), NoModelLoadedError);
    EXPECT_THROW(p.predict_batch({}), NoModelLoadedError);
    EXPECT_THROW(p.model_id(), NoModelLoadedError);
}

TEST_F(PredictorTest, MeasuredCurveGivesIndexAndConfidence)
{
    const Predictor p = loaded_predictor();
    const PredictionResult r = p.predict_one(prism_points(1.50, 44, 80));
    EXPECT_GT(r.refractive_index, 1.3);
    EXPECT_LT(r.refractive_index, 1.8);
    EXPECT_GE(r.confidence, 0.0);
    EXPECT_LE(r.confidence, 1.0);
    EXPECT_GE(r.cluster_id, 0);
    EXPECT_LT(r.cluster_id, model_->regressor.n_clusters());

    /* the same points again: same answer */
    const PredictionResult again = p.predict_one(prism_points(1.50, 44, 80));
    EXPECT_DOUBLE_EQ(again.refractive_index, r.refractive_index);
    EXPECT_DOUBLE_EQ(again.confidence, r.confidence);
}

TEST_F(PredictorTest, TooFewPointsAreInsufficient)
{
    const Predictor p = loaded_predictor();
    EXPECT_THROW(p.predict_one(prism_points(1.5, 50, 52)), InsufficientDataError);
}

TEST_F(PredictorTest, UnloadForgetsTheModel)
{
    Predictor p = loaded_predictor();
    EXPECT_TRUE(p.loaded());
    p.unload();
    EXPECT_THROW(p.predict_one(prism_points(1.5, 44, 80)), NoModelLoadedError);
}

TEST_F(PredictorTest, ModelFromAnotherBackboneIsRefused)
{
    TempDir other;
    Predictor p(small_backbone(other, 99), ImportOpt{}, 60.0);
    EXPECT_THROW(p.load(model_), ModelFormatError);
    EXPECT_FALSE(p.loaded());
}

TEST_F(PredictorTest, BatchReportsEachItem)
{
    TempDir dir;
    std::vector<BatchInput> inputs;
    for (int i = 0; i < 10; ++i) {
        const std::string path = dir.file("sample_" + std::to_string(i) + ".txt");
        if (i == 3) {
            std::ofstream out(path);
            out << "incidence deviation\nnot a number\n";
        } else {
            write_points(path, prism_points(1.42 + 0.015 * i, 44, 80));
        }
        inputs.push_back(BatchInput::file(path));
    }

    const Predictor p = loaded_predictor();
    BatchCursor cur = p.predict_batch(inputs);
    std::vector<BatchItem> lazy;
    while (cur.has_next()) lazy.push_back(cur.next());
    EXPECT_THROW(cur.next(), std::out_of_range);

    ASSERT_EQ(lazy.size(), 10u);
    int ok = 0;
    for (std::size_t i = 0; i < lazy.size(); ++i) {
        EXPECT_EQ(lazy[i].index, i);
        if (lazy[i].ok()) {
            ++ok;
            EXPECT_TRUE(lazy[i].error.empty());
        }
    }
    EXPECT_EQ(ok, 9);
    EXPECT_FALSE(lazy[3].ok());
    EXPECT_FALSE(lazy[3].error.empty());
    EXPECT_EQ(lazy[3].bad_lines.size(), 2u);

    int events = 0;
    const auto all = p.predict_all(inputs, [&](const ProgressEvent&) { ++events; });
    EXPECT_EQ(events, 10);
    ASSERT_EQ(all.size(), lazy.size());
    for (std::size_t i = 0; i < all.size(); ++i) {
        ASSERT_EQ(all[i].ok(), lazy[i].ok());
        if (all[i].ok())
            EXPECT_DOUBLE_EQ(all[i].result->refractive_index, lazy[i].result->refractive_index);
    }

    const std::string report = write_batch_report(all, dir.sub("predictions"), "batch.csv");
    std::ifstream in(report);
    std::string line;
    int lines = 0;
    std::getline(in, line);
    EXPECT_EQ(line, "index,source,refractive_index,confidence,cluster,model,skipped_lines,error");
    while (std::getline(in, line)) ++lines;
    EXPECT_EQ(lines, 10);

    EXPECT_THROW(write_batch_report(all, dir.file("absent")), StorageUnavailableError);
}

TEST_F(PredictorTest, PointSetsAndFilesMix)
{
    const Predictor p = loaded_predictor();
    const auto items = p.predict_all({BatchInput::points_of("bench", prism_points(1.47, 44, 80)),
                                      BatchInput::file("/nonexistent/raw.txt")});
    ASSERT_EQ(items.size(), 2u);
    EXPECT_TRUE(items[0].ok());
    EXPECT_EQ(items[0].source, "bench");
    EXPECT_FALSE(items[1].ok());
}

TEST_F(PredictorTest, BatchKeepsTheModelItStartedWith)
{
    std::vector<BatchInput> inputs;
    for (int i = 0; i < 3; ++i)
        inputs.push_back(BatchInput::points_of("p" + std::to_string(i),
                                               prism_points(1.45 + 0.03 * i, 44, 80)));

    TrainedModel copy = TrainedModel::from_json(model_->to_json());
    copy.model_id = "replacement";
    const auto replacement = std::make_shared<const TrainedModel>(std::move(copy));

    const Predictor reference = loaded_predictor();
    Predictor p = loaded_predictor();
    BatchCursor cur = p.predict_batch(inputs);
    EXPECT_EQ(cur.model_id(), model_->model_id);

    std::vector<BatchItem> items;
    items.push_back(cur.next());
    p.load(replacement);
    items.push_back(cur.next());
    p.unload();
    items.push_back(cur.next());
    EXPECT_FALSE(cur.has_next());

    for (std::size_t i = 0; i < items.size(); ++i) {
        ASSERT_TRUE(items[i].ok()) << items[i].error;
        EXPECT_EQ(items[i].result->model_id, model_->model_id);
        EXPECT_DOUBLE_EQ(items[i].result->refractive_index,
                         reference.predict_one(inputs[i].points).refractive_index);
    }

    /* a new batch sees the unload */
    EXPECT_THROW(p.predict_batch(inputs), NoModelLoadedError);
    p.load(replacement);
    EXPECT_EQ(p.predict_batch(inputs).model_id(), "replacement");
}

TEST_F(PredictorTest, SkippedLinesAreReportedPerItem)
{
    TempDir dir;
    const std::string path = dir.file("partial.txt");
    {
        std::ofstream out(path);
        out << "# incidence, deviation\n";
        const auto pts = prism_points(1.50, 44, 80);
        for (std::size_t i = 0; i < pts.size(); ++i) {
            if (i == 2) out << "n/a 41.0\n";
            if (i == 5) out << "52.0\n";
            out << pts[i].incidence_deg << ", " << pts[i].deviation_deg << "\n";
        }
    }

    const Predictor p = loaded_predictor();
    BatchCursor cur = p.predict_batch({BatchInput::file(path)});
    const BatchItem it = cur.next();
    ASSERT_TRUE(it.ok()) << it.error;
    ASSERT_EQ(it.bad_lines.size(), 2u);
    EXPECT_EQ(it.bad_lines[0].line, 4u);
    EXPECT_EQ(it.bad_lines[1].line, 8u);
    EXPECT_EQ(it.bad_lines[1].reason, "expected two fields");

    const std::string report = write_batch_report({it}, dir.sub("predictions"), "partial.csv");
    std::ifstream in(report);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    EXPECT_NE(row.find(",4;8,"), std::string::npos) << row;
}
