#include "store/model_artifact.hpp"

#include "errors.hpp"

namespace refrax {

void to_json(json& j, const ModelMeta& m)
{
    j = {{"created_at", m.created_at}, {"timestamp_ms", m.timestamp_ms},
         {"n_train", m.n_train}, {"n_test", m.n_test},
         {"validation_score", m.validation_score}, {"test_metrics", m.test_metrics},
         {"training_seconds", m.training_seconds}, {"feature_dim", m.feature_dim},
         {"backbone_digest", m.backbone_digest}, {"n_trials", m.n_trials},
         {"cancelled", m.cancelled}};
}

void from_json(const json& j, ModelMeta& m)
{
    m.created_at       = j.value("created_at", std::string{});
    m.timestamp_ms     = j.at("timestamp_ms").get<std::int64_t>();
    m.n_train          = j.value("n_train", std::size_t{0});
    m.n_test           = j.value("n_test", std::size_t{0});
    m.validation_score = j.at("validation_score").get<double>();
    if (j.contains("test_metrics")) m.test_metrics = j.at("test_metrics").get<EvalMetrics>();
    m.training_seconds = j.value("training_seconds", 0.0);
    m.feature_dim      = j.at("feature_dim").get<int>();
    m.backbone_digest  = j.at("backbone_digest").get<std::string>();
    m.n_trials         = j.value("n_trials", 0);
    m.cancelled        = j.value("cancelled", false);
}

json TrainedModel::to_json() const
{
    return {{"format_version", format_version}, {"model_id", model_id},
            {"params", params}, {"meta", meta}, {"history", history},
            {"regressor", regressor.to_json()}};
}

TrainedModel TrainedModel::from_json(const json& j)
{
    try {
        const int v = j.at("format_version").get<int>();
        if (v != kModelFormatVersion)
            throw ModelFormatError("unsupported model format_version " + std::to_string(v) +
                                   " (expected " + std::to_string(kModelFormatVersion) + ")");
        TrainedModel m;
        m.format_version = v;
        m.model_id  = j.value("model_id", std::string{});
        m.params    = j.at("params").get<TrialParams>();
        m.meta      = j.at("meta").get<ModelMeta>();
        m.history   = j.value("history", std::vector<TrialRecord>{});
        m.regressor = ClusterRegressionModel::from_json(j.at("regressor"));
        if (m.regressor.feature_dim() != m.meta.feature_dim)
            throw ModelFormatError("regressor expects " + std::to_string(m.regressor.feature_dim()) +
                                   " features, metadata says " + std::to_string(m.meta.feature_dim));
        return m;
    } catch (const ModelFormatError&) {
        throw;
    } catch (const RefraxError& e) {
        throw ModelFormatError(std::string("invalid model document: ") + e.what());
    } catch (const json::exception& e) {
        throw ModelFormatError(std::string("malformed model document: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw ModelFormatError(std::string("inconsistent model document: ") + e.what());
    }
}

}  // namespace refrax
