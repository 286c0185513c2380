#include <gtest/gtest.h>

#include <fstream>
#include <thread>

#include "errors.hpp"
#include "features/dataset.hpp"
#include "features/feature_extractor.hpp"
#include "simulation/prism_simulator.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::TempDir;
using refrax::testing_util::small_backbone;
using refrax::testing_util::prism_points;

TEST(Backbone, LoadsWeightsAndExposesShape)
{
    TempDir tmp;
    const BackboneHandle bb = small_backbone(tmp);
    EXPECT_EQ(bb->input_size(), kRasterSize);
    EXPECT_EQ(bb->feature_dim(), 8 * 4 * 4);
    EXPECT_EQ(bb->digest().size(), 16u);

    const BackboneHandle again = load_backbone(tmp.file("backbone_7.json"));
    EXPECT_EQ(again->digest(), bb->digest());
    EXPECT_NE(small_backbone(tmp, 8)->digest(), bb->digest());
}

TEST(Backbone, MissingOrBrokenWeightsAreFatal)
{
    TempDir tmp;
    EXPECT_THROW(load_backbone(tmp.file("absent.json")), BackboneLoadError);

    {
        std::ofstream out(tmp.file("garbage.json"));
        out << "{ not json";
    }
    EXPECT_THROW(load_backbone(tmp.file("garbage.json")), BackboneLoadError);

    small_backbone(tmp);
    json j = json::parse(read_text_file(tmp.file("backbone_7.json")));
    j["layers"][1]["weights"].erase(0);
    {
        std::ofstream out(tmp.file("short.json"));
        out << j.dump();
    }
    EXPECT_THROW(load_backbone(tmp.file("short.json")), BackboneLoadError);

    EXPECT_THROW({ FeatureExtractor none(BackboneHandle{}); }, BackboneLoadError);
}

TEST(FeatureExtractor, ExtractIsPure)
{
    TempDir tmp;
    FeatureExtractor fx(small_backbone(tmp));
    const CurveImage img = render(import_raw(prism_points(1.5, 44.0, 80.0), ImportOpt{}));

    const FeatureVector a = fx.extract(img);
    const FeatureVector b = fx.extract(img);
    ASSERT_EQ(a.size(), fx.feature_dim());
    EXPECT_TRUE((a.array() == b.array()).all());
    EXPECT_GT(a.cwiseAbs().sum(), 0.0);

    /* shared handle, concurrent readers */
    FeatureVector c, d;
    std::thread t1([&] { c = fx.extract(img); });
    std::thread t2([&] { d = fx.extract(img); });
    t1.join();
    t2.join();
    EXPECT_TRUE((c.array() == a.array()).all());
    EXPECT_TRUE((d.array() == a.array()).all());
}

TEST(FeatureExtractor, DifferentCurvesGiveDifferentFeatures)
{
    TempDir tmp;
    FeatureExtractor fx(small_backbone(tmp));
    const FeatureVector a = fx.extract(render(import_raw(prism_points(1.45, 44, 80), ImportOpt{})));
    const FeatureVector b = fx.extract(render(import_raw(prism_points(1.58, 44, 80), ImportOpt{})));
    EXPECT_GT((a - b).norm(), 1e-6);
}

TEST(FeatureExtractor, RejectsWrongRasterSize)
{
    TempDir tmp;
    FeatureExtractor fx(small_backbone(tmp));
    EXPECT_THROW(fx.extract(CurveImage::Zero(64, 64)), InvalidRangeError);
}

TEST(Dataset, ParsesTemplateNames)
{
    double n = 0.0;
    EXPECT_TRUE(parse_template_name("Rn_1.455.pgm", n));
    EXPECT_DOUBLE_EQ(n, 1.455);
    EXPECT_FALSE(parse_template_name("Rn_abc.pgm", n));
    EXPECT_FALSE(parse_template_name("Rn_1.455.png", n));
    EXPECT_FALSE(parse_template_name("curve_1.455.pgm", n));
}

TEST(Dataset, LoadsTemplatesAndSkipsBadFiles)
{
    TempDir tmp;
    StorageLayout layout{tmp.sub("template"), tmp.sub("models"), tmp.sub("pred")};
    PrismSimulator sim(SimOpt{}, layout);
    ASSERT_EQ(sim.generate(1.40, 1.52, 0.01).curves.size(), 12u);
    {
        std::ofstream out(join_path(layout.images_dir, "notes.txt"));
        out << "not an image";
        std::ofstream bad(join_path(layout.images_dir, "Rn_1.999.pgm"));
        bad << "P5\n128 128\n255\n";
    }
    FeatureExtractor fx(small_backbone(tmp));
    const Dataset ds = load_template_dataset(layout.images_dir, fx);
    ASSERT_EQ(ds.size(), 12);
    EXPECT_EQ(ds.X.cols(), fx.feature_dim());
    EXPECT_NEAR(ds.y(0), 1.40, 1e-9);
    EXPECT_EQ(ds.sources.front(), "Rn_1.400.pgm");
}

TEST(Dataset, TooFewTemplatesAreInsufficient)
{
    TempDir tmp;
    StorageLayout layout{tmp.sub("template"), tmp.sub("models"), tmp.sub("pred")};
    PrismSimulator sim(SimOpt{}, layout);
    sim.generate(1.40, 1.45, 0.01);
    FeatureExtractor fx(small_backbone(tmp));
    EXPECT_THROW(load_template_dataset(layout.images_dir, fx), InsufficientValidSamplesError);
}
