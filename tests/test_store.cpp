#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>

#include "errors.hpp"
#include "store/model_store.hpp"
#include "test_helpers.hpp"

using namespace refrax;
using refrax::testing_util::TempDir;
using refrax::testing_util::make_blobs;
using refrax::testing_util::make_model;

namespace fs = std::filesystem;

TEST(ModelStore, SaveClaimsTimestampedIds)
{
    TempDir tmp;
    ModelStore store(tmp.sub("models"));
    const TrainedModel m = make_model(0.01, 1000);

    const std::string a = store.save(m);
    const std::string b = store.save(m);
    EXPECT_TRUE(std::regex_match(a, std::regex(R"(model_\d{8}_\d{6}_\d{3}(_\d+)?)"))) << a;
    EXPECT_NE(a, b);
    EXPECT_TRUE(store.exists(a));
    EXPECT_TRUE(store.exists(b));

    for (const auto& e : fs::recursive_directory_iterator(store.dir()))
        EXPECT_NE(e.path().extension(), ".tmp") << e.path();

    const auto ids = store.list();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST(ModelStore, LoadRestoresTheArtifact)
{
    TempDir tmp;
    ModelStore store(tmp.sub("models"));
    const TrainedModel m = make_model(0.025, 123456, 3);
    const std::string id = store.save(m);

    const TrainedModel back = store.load(id);
    EXPECT_EQ(back.model_id, id);
    EXPECT_EQ(back.format_version, kModelFormatVersion);
    EXPECT_EQ(back.meta.timestamp_ms, 123456);
    EXPECT_DOUBLE_EQ(back.meta.validation_score, 0.025);
    EXPECT_EQ(back.params.k, 2);
    EXPECT_EQ(back.regressor.n_clusters(), m.regressor.n_clusters());

    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    make_blobs({12, 12}, 6, 3, X, y);
    EXPECT_TRUE(back.regressor.predict_values(X).isApprox(m.regressor.predict_values(X)));

    const ModelMeta meta = store.read_meta(id);
    EXPECT_EQ(meta.backbone_digest, "none");
    EXPECT_EQ(meta.feature_dim, 6);
}

TEST(ModelStore, BrokenDocumentsAreFormatErrors)
{
    TempDir tmp;
    ModelStore store(tmp.sub("models"));
    EXPECT_THROW(store.load("model_missing"), ModelFormatError);
    EXPECT_THROW(store.load("../escape"), InvalidRangeError);

    tmp.sub("models/model_garbage");
    {
        std::ofstream out(tmp.file("models/model_garbage/model.json"));
        out << "{ \"format_version\": 1, ";
    }
    EXPECT_THROW(store.load("model_garbage"), ModelFormatError);

    const std::string id = store.save(make_model(0.02, 5));
    json j = json::parse(read_text_file(store.model_path(id)));

    j["format_version"] = 2;
    tmp.sub("models/model_future");
    {
        std::ofstream out(tmp.file("models/model_future/model.json"));
        out << j.dump();
    }
    EXPECT_THROW(store.load("model_future"), ModelFormatError);
    EXPECT_THROW(store.read_meta("model_future"), ModelFormatError);

    j["format_version"] = 1;
    j["meta"]["feature_dim"] = 7;
    tmp.sub("models/model_mismatch");
    {
        std::ofstream out(tmp.file("models/model_mismatch/model.json"));
        out << j.dump();
    }
    EXPECT_THROW(store.load("model_mismatch"), ModelFormatError);
}

TEST(ModelStore, UnpublishedDirectoriesAreInvisible)
{
    TempDir tmp;
    ModelStore store(tmp.sub("models"));
    tmp.sub("models/model_partial");
    {
        std::ofstream out(tmp.file("models/model_partial/model.json.tmp"));
        out << "{";
    }
    EXPECT_TRUE(store.list().empty());
    EXPECT_FALSE(store.exists("model_partial"));
}

TEST(ModelStore, MissingDirectoryIsUnavailable)
{
    TempDir tmp;
    EXPECT_THROW(ModelStore(tmp.file("nowhere")), StorageUnavailableError);
}
