#include <gtest/gtest.h>

#include <fstream>

#include "errors.hpp"
#include "simulation/importer.hpp"
#include "simulation/pchip.hpp"
#include "simulation/prism_physics.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::TempDir;
using refrax::testing_util::prism_points;

TEST(RawParse, AcceptsMixedSeparatorsAndRecordsBadLines)
{
    const std::string text =
        "# incidence deviation\n"
        "44.0 40.1\n"
        "45,39.8\n"
        "46;39.6   # trailing comment\n"
        "\n"
        "47\t39.5\n"
        "forty-eight 39.4\n"
        "49\n";
    const RawParseResult r = parse_raw_text(text);
    ASSERT_EQ(r.points.size(), 4u);
    EXPECT_DOUBLE_EQ(r.points[1].incidence_deg, 45.0);
    EXPECT_DOUBLE_EQ(r.points[3].deviation_deg, 39.5);
    ASSERT_EQ(r.bad_lines.size(), 2u);
    EXPECT_EQ(r.bad_lines[0].line, 7u);
    EXPECT_EQ(r.bad_lines[1].line, 8u);
}

TEST(RawParse, StrictModeReportsTheFailingLine)
{
    try {
        parse_raw_text("44 40\n45 x\n46 39\n", /*strict=*/true);
        FAIL() << "expected DataFormatError";
    } catch (const DataFormatError& e) {
        EXPECT_EQ(e.line(), 2u);
    }
}

TEST(RawParse, UnreadableFileIsInsufficientData)
{
    EXPECT_THROW(parse_raw_file("/nonexistent/refrax.txt"), InsufficientDataError);
}

TEST(Import, NarrowSpanFileIsRejected)
{
    TempDir tmp;
    {
        std::ofstream out(tmp.file("short.txt"));
        out << "50 38.0\n52 38.5\n55 39.2\n";
    }
    const RawParseResult raw = parse_raw_file(tmp.file("short.txt"));
    ASSERT_EQ(raw.points.size(), 3u);
    EXPECT_THROW(import_raw(raw.points, ImportOpt{}), InsufficientDataError);
}

TEST(Import, TooFewDistinctPointsAreRejected)
{
    /* duplicates collapse to two distinct incidences */
    std::vector<RawPoint> pts{{45, 40}, {45, 41}, {60, 45}};
    EXPECT_THROW(import_raw(pts, ImportOpt{}), InsufficientDataError);
}

TEST(Import, ResamplesOntoRegularGrid)
{
    std::vector<RawPoint> pts{{70, 50}, {50, 38}, {60, 42}, {60, 44}, {85, 90}};
    ImportOpt opt;
    opt.grid_points = 101;
    const Curve c = import_raw(pts, opt);
    ASSERT_EQ(c.size(), 101u);
    EXPECT_DOUBLE_EQ(c.min_incidence(), 50.0);
    EXPECT_DOUBLE_EQ(c.max_incidence(), 70.0);      // 85° dropped
    EXPECT_NEAR(c.deviation()[50], 43.0, 1e-12);    // 60° duplicates averaged
}

TEST(Pchip, PreservesMonotonicityWithoutOvershoot)
{
    const Pchip p({0, 1, 2, 3, 4, 5}, {0, 0, 0.1, 0.9, 1, 1});
    double prev = p(0.0);
    for (double x = 0.0; x <= 5.0; x += 0.01) {
        const double v = p(x);
        EXPECT_GE(v, prev - 1e-12);
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
        prev = v;
    }
    EXPECT_DOUBLE_EQ(p(3.0), 0.9);
}

TEST(Import, MonotoneSamplesGiveMonotoneCurve)
{
    /* above the symmetric angle the deviation only grows */
    const auto pts = prism_points(1.5, 50.0, 78.0);
    const Curve c = import_raw(pts, ImportOpt{});
    for (std::size_t i = 1; i < c.size(); ++i)
        EXPECT_GE(c.deviation()[i], c.deviation()[i - 1] - 1e-12);
}

TEST(Import, FitRecoversTheIndex)
{
    std::vector<double> x, y;
    for (const auto& p : prism_points(1.52, 44.0, 70.0)) {
        x.push_back(p.incidence_deg);
        y.push_back(p.deviation_deg);
    }
    EXPECT_NEAR(fit_refractive_index(x, y, 60.0), 1.52, 1e-5);
}

TEST(Import, PhysicalExtensionReachesBoundAndJoinsContinuously)
{
    const auto pts = prism_points(1.52, 44.0, 65.0);
    ImportOpt opt;
    opt.extend_to_bound = true;
    const Curve c = import_raw(pts, opt);
    EXPECT_DOUBLE_EQ(c.max_incidence(), 80.0);

    double at80 = 0.0;
    ASSERT_TRUE(deviation_deg(1.52, 80.0, 60.0, at80));
    EXPECT_NEAR(c.deviation().back(), at80, 0.01);

    /* no jump where the samples end */
    const auto& xs = c.incidence();
    const auto& ys = c.deviation();
    for (std::size_t i = 1; i < xs.size(); ++i)
        EXPECT_LT(std::fabs(ys[i] - ys[i - 1]), 0.2) << "at " << xs[i];
}
