#include "inference/predictor.hpp"

#include <sstream>

#include "errors.hpp"
#include "storage.hpp"

namespace refrax {

BatchInput BatchInput::file(std::string path)
{
    BatchInput in;
    in.source    = std::move(path);
    in.from_file = true;
    return in;
}

BatchInput BatchInput::points_of(std::string label, std::vector<RawPoint> pts)
{
    BatchInput in;
    in.source = std::move(label);
    in.points = std::move(pts);
    return in;
}

Predictor::Predictor(BackboneHandle backbone, ImportOpt import_opt, double apex_deg)
    : fx_(std::move(backbone)), import_opt_(std::move(import_opt)), apex_deg_(apex_deg) {}

void Predictor::load(std::shared_ptr<const TrainedModel> model)
{
    if (!model) throw NoModelLoadedError("load() called with an empty model");
    if (model->meta.feature_dim != fx_.feature_dim() ||
        model->regressor.feature_dim() != fx_.feature_dim())
        throw ModelFormatError("model " + model->model_id + " expects " +
                               std::to_string(model->meta.feature_dim) + " features, backbone yields " +
                               std::to_string(fx_.feature_dim()));
    if (model->meta.backbone_digest != fx_.backbone_digest())
        throw ModelFormatError("model " + model->model_id + " was trained with backbone " +
                               model->meta.backbone_digest + ", loaded backbone is " +
                               fx_.backbone_digest());
    model_ = std::move(model);
    logI("predictor: model " + model_->model_id + " loaded (" +
         std::to_string(model_->regressor.n_clusters()) + " clusters)");
}

const std::string& Predictor::model_id() const
{
    return require_model()->model_id;
}

std::shared_ptr<const TrainedModel> Predictor::require_model() const
{
    auto m = model_;
    if (!m) throw NoModelLoadedError("no trained model loaded");
    return m;
}

PredictionResult Predictor::predict_features(const FeatureVector& f) const
{
    const auto m = require_model();
    const ClusterPrediction cp = m->regressor.predict(f);
    PredictionResult r;
    r.refractive_index = cp.value;
    r.confidence       = cp.confidence;
    r.cluster_id       = cp.cluster_id;
    r.model_id         = m->model_id;
    return r;
}

PredictionResult Predictor::predict_image(const CurveImage& image) const
{
    require_model();
    return predict_features(fx_.extract(image));
}

PredictionResult Predictor::predict_curve(const Curve& curve) const
{
    require_model();
    return predict_image(render(curve));
}

PredictionResult Predictor::predict_one(const std::vector<RawPoint>& points) const
{
    require_model();      // before any work
    return predict_curve(import_raw(points, import_opt_, apex_deg_));
}

namespace {

std::string line_list(const std::vector<BadLine>& bad)
{
    std::string s;
    for (const auto& b : bad) {
        if (!s.empty()) s += ';';
        s += std::to_string(b.line);
    }
    return s;
}

}  // namespace

BatchItem Predictor::predict_item(std::size_t index, const BatchInput& in) const
{
    BatchItem it;
    it.index  = index;
    it.source = in.source;
    try {
        if (in.from_file) {
            RawParseResult raw = parse_raw_file(in.source, import_opt_.strict_lines);
            it.bad_lines = std::move(raw.bad_lines);
            if (!it.bad_lines.empty())
                logW("batch item " + std::to_string(index) + " (" + in.source + "): " +
                     std::to_string(it.bad_lines.size()) + " malformed line(s) skipped: " +
                     line_list(it.bad_lines));
            it.result = predict_one(raw.points);
        } else {
            it.result = predict_one(in.points);
        }
    } catch (const std::exception& e) {
        it.error = e.what();
        logW("batch item " + std::to_string(index) + " (" + in.source + ") failed: " + it.error);
    }
    return it;
}

BatchItem BatchCursor::next()
{
    if (!has_next()) throw std::out_of_range("batch cursor exhausted");
    const std::size_t i = pos_++;
    return pinned_.predict_item(i, inputs_[i]);
}

BatchCursor Predictor::predict_batch(std::vector<BatchInput> inputs) const
{
    require_model();
    return BatchCursor(*this, std::move(inputs));   // copy: backbone handle + model snapshot
}

std::vector<BatchItem> Predictor::predict_all(const std::vector<BatchInput>& inputs,
                                              const ProgressSink& sink) const
{
    require_model();
    const Predictor pinned = *this;
    const int N = int(inputs.size());
    std::vector<BatchItem> out(inputs.size());
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < N; ++i)
        out[std::size_t(i)] = pinned.predict_item(std::size_t(i), inputs[std::size_t(i)]);

    std::size_t failed = 0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (!out[i].ok()) ++failed;
        emit_progress(sink, "predict", i + 1, out.size(), out[i].source);
    }
    logI("batch: " + std::to_string(out.size() - failed) + " predicted, " +
         std::to_string(failed) + " failed");
    return out;
}

/* ────────── report ────────── */
namespace {

std::string csv_field(const std::string& s)
{
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string q = "\"";
    for (char c : s) {
        if (c == '"') q += '"';
        q += c;
    }
    return q + '"';
}

}  // namespace

std::string write_batch_report(const std::vector<BatchItem>& items,
                               const std::string& predictions_dir, const std::string& file_name)
{
    require_writable(predictions_dir, "predictions");
    const std::string name =
        file_name.empty() ? "batch_" + timestamp_string(now_ms(), true) + ".csv" : file_name;

    std::ostringstream out;
    out << "index,source,refractive_index,confidence,cluster,model,skipped_lines,error\n";
    for (const auto& it : items) {
        out << it.index << ',' << csv_field(it.source) << ',';
        if (it.ok())
            out << format_fixed(it.result->refractive_index, 6) << ','
                << format_fixed(it.result->confidence, 4) << ','
                << it.result->cluster_id << ',' << csv_field(it.result->model_id) << ',';
        else
            out << ",,,,";
        out << line_list(it.bad_lines) << ',' << csv_field(it.error) << '\n';
    }
    const std::string path = join_path(predictions_dir, name);
    write_file_atomic(path, out.str());
    logI("batch report written to " + path);
    return path;
}

}  // namespace refrax
