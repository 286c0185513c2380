/* ──────────────────────────────────────────────────────────────
   model_artifact.hpp  –  everything persisted for one trained model
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "regression/cluster_regressor.hpp"
#include "training/metrics.hpp"
#include "training/optimizer.hpp"

namespace refrax {

constexpr int kModelFormatVersion = 1;

struct ModelMeta {
    std::string  created_at;            // local time, human readable
    std::int64_t timestamp_ms     = 0;
    std::size_t  n_train          = 0;
    std::size_t  n_test           = 0;
    double       validation_score = 0.0;   // best trial score (mean validation MAE)
    EvalMetrics  test_metrics{};
    double       training_seconds = 0.0;
    int          feature_dim      = 0;
    std::string  backbone_digest;
    int          n_trials         = 0;
    bool         cancelled        = false;
};

void to_json(json& j, const ModelMeta& m);
void from_json(const json& j, ModelMeta& m);

struct TrainedModel {
    int                      format_version = kModelFormatVersion;
    std::string              model_id;       // set by ModelStore::save
    ClusterRegressionModel   regressor;
    TrialParams              params{};
    ModelMeta                meta{};
    std::vector<TrialRecord> history;

    json to_json() const;
    /* ModelFormatError on a wrong version or a malformed document */
    static TrainedModel from_json(const json& j);
};

}  // namespace refrax
