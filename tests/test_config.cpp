#include <gtest/gtest.h>

#include <fstream>

#include "config.hpp"
#include "errors.hpp"
#include "progress_queue.hpp"
#include "storage.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::TempDir;

TEST(Config, DefaultsMatchThePrismSetup)
{
    RefraxConfig c;
    EXPECT_DOUBLE_EQ(c.sim.apex_deg, 60.0);
    EXPECT_DOUBLE_EQ(c.sim.incidence_start, 44.0);
    EXPECT_DOUBLE_EQ(c.sim.incidence_end, 80.0);
    EXPECT_EQ(c.tune.n_trials, 100);
    EXPECT_DOUBLE_EQ(c.tune.timeout_s, 7200.0);
    EXPECT_EQ(c.cluster.min_cluster_samples, 10u);
    EXPECT_DOUBLE_EQ(c.train.test_ratio, 0.2);
    EXPECT_NO_THROW(c.validate());
}

TEST(Config, JsonSectionsOverrideDefaults)
{
    RefraxConfig c;
    c.apply_json(json::parse(R"({
        "sim":     {"apex_deg": 45.0},
        "cluster": {"n_init": 4, "som_neighborhood": "bubble"},
        "svr":     {"kernel": "linear", "C": 3.5},
        "tune":    {"algorithms": ["kmeans"], "n_trials": 7},
        "storage": {"models_dir": "/srv/models"}
    })"));
    EXPECT_DOUBLE_EQ(c.sim.apex_deg, 45.0);
    EXPECT_EQ(c.cluster.n_init, 4);
    EXPECT_EQ(c.cluster.som.neighborhood, "bubble");
    EXPECT_EQ(c.svr.kernel, KernelKind::Linear);
    EXPECT_DOUBLE_EQ(c.svr.C, 3.5);
    ASSERT_EQ(c.tune.algorithms.size(), 1u);
    EXPECT_EQ(c.tune.n_trials, 7);
    EXPECT_EQ(c.storage.models_dir, "/srv/models");
}

TEST(Config, CliFlagsWinAndOtherArgsPassThrough)
{
    RefraxConfig c;
    const char* argv[] = {"refrax", "train", "--tune.n_trials=12", "--cluster.n_init=3",
                          "--log.level=debug", "--lo=1.4", "input.txt"};
    const auto rest = c.apply_cli(7, const_cast<char**>(argv));
    EXPECT_EQ(c.tune.n_trials, 12);
    EXPECT_EQ(c.cluster.n_init, 3);
    EXPECT_EQ(c.log.level, "debug");
    ASSERT_EQ(rest.size(), 3u);
    EXPECT_EQ(rest[0], "train");
    EXPECT_EQ(rest[1], "--lo=1.4");
    EXPECT_EQ(rest[2], "input.txt");
}

TEST(Config, ValidateRejectsInconsistentValues)
{
    RefraxConfig c;
    c.sim.incidence_step = 0.0;
    EXPECT_THROW(c.validate(), InvalidRangeError);

    RefraxConfig d;
    d.tune.k_min = 5;
    d.tune.k_max = 2;
    EXPECT_THROW(d.validate(), InvalidRangeError);

    RefraxConfig e;
    EXPECT_THROW(e.apply_json(json::parse(R"({"svr": {"kernel": "poly"}})")), InvalidRangeError);
}

TEST(Config, FileRoundTripsThroughToJson)
{
    TempDir tmp;
    RefraxConfig c;
    c.tune.cv_folds = 5;
    c.confidence.distance_weight = 0.7;
    {
        std::ofstream out(tmp.file("cfg.json"));
        out << c.to_json().dump(2);
    }
    const RefraxConfig back = RefraxConfig::from_file(tmp.file("cfg.json"));
    EXPECT_EQ(back.tune.cv_folds, 5);
    EXPECT_DOUBLE_EQ(back.confidence.distance_weight, 0.7);
    EXPECT_THROW(RefraxConfig::from_file(tmp.file("missing.json")), InvalidRangeError);
}

TEST(Logging, ParsesLevels)
{
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_THROW(parse_log_level("loud"), InvalidRangeError);
}

TEST(ProgressQueue, DropsOldestWhenFull)
{
    ProgressQueue q(3);
    auto sink = q.sink();
    for (int i = 0; i < 5; ++i) emit_progress(sink, "simulate", std::size_t(i + 1), 5);
    EXPECT_EQ(q.dropped(), 2u);
    const auto ev = q.drain();
    ASSERT_EQ(ev.size(), 3u);
    EXPECT_EQ(ev.front().count, 3u);
    EXPECT_DOUBLE_EQ(ev.back().percent, 100.0);
    EXPECT_EQ(q.size(), 0u);
}

TEST(Storage, RequireWritableFailsOnMissingDirectory)
{
    TempDir tmp;
    EXPECT_NO_THROW(require_writable(tmp.path, "images"));
    EXPECT_THROW(require_writable(tmp.file("nope"), "images"), StorageUnavailableError);
    EXPECT_THROW(require_writable("", "images"), StorageUnavailableError);
}

TEST(Storage, AtomicWriteLeavesNoTemporary)
{
    TempDir tmp;
    write_file_atomic(tmp.file("a.txt"), "hello");
    EXPECT_EQ(read_text_file(tmp.file("a.txt")), "hello");
    EXPECT_FALSE(file_exists(tmp.file("a.txt.tmp")));
    EXPECT_THROW(write_file_atomic(tmp.file("no/such/dir.txt"), "x"), StorageUnavailableError);
}
