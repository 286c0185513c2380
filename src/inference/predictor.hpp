/* ──────────────────────────────────────────────────────────────
   predictor.hpp   –  measured points → refractive index + confidence
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "features/feature_extractor.hpp"
#include "simulation/importer.hpp"
#include "store/model_artifact.hpp"

namespace refrax {

struct PredictionResult {
    double      refractive_index = 0.0;
    double      confidence       = 0.0;
    int         cluster_id       = -1;
    std::string model_id;
};

/* a point set, or a raw-data file to parse */
struct BatchInput {
    std::string           source;       // file path, or a caller label for point sets
    std::vector<RawPoint> points;
    bool                  from_file = false;

    static BatchInput file(std::string path);
    static BatchInput points_of(std::string label, std::vector<RawPoint> pts);
};

struct BatchItem {
    std::size_t                     index = 0;
    std::string                     source;
    std::optional<PredictionResult> result;
    std::string                     error;     // set iff !result
    std::vector<BadLine>            bad_lines; // malformed lines skipped while parsing a file

    bool ok() const { return result.has_value(); }
};

class BatchCursor;

class Predictor {
public:
    Predictor(BackboneHandle backbone, ImportOpt import_opt, double apex_deg);

    /* ModelFormatError if the model was trained on another backbone */
    void load(std::shared_ptr<const TrainedModel> model);
    void unload() { model_.reset(); }
    bool loaded() const { return model_ != nullptr; }
    const std::string& model_id() const;

    /* NoModelLoadedError when nothing is loaded */
    PredictionResult predict_one(const std::vector<RawPoint>& points) const;
    PredictionResult predict_curve(const Curve& curve) const;
    PredictionResult predict_image(const CurveImage& image) const;
    PredictionResult predict_features(const FeatureVector& f) const;

    /* one item's failure is reported in its BatchItem, never thrown */
    BatchItem   predict_item(std::size_t index, const BatchInput& in) const;
    /* pins the current backbone and model; later load()/unload() calls
       do not reach an open cursor */
    BatchCursor predict_batch(std::vector<BatchInput> inputs) const;
    /* all items, in input order, computed in parallel when OpenMP is on */
    std::vector<BatchItem> predict_all(const std::vector<BatchInput>& inputs,
                                       const ProgressSink& sink = {}) const;

private:
    std::shared_ptr<const TrainedModel> require_model() const;

    FeatureExtractor                    fx_;
    ImportOpt                           import_opt_;
    double                              apex_deg_;
    std::shared_ptr<const TrainedModel> model_;
};

/* lazy: every next() runs the pipeline on exactly one input */
class BatchCursor {
public:
    bool      has_next() const { return pos_ < inputs_.size(); }
    BatchItem next();
    const std::string& model_id() const { return pinned_.model_id(); }

private:
    friend class Predictor;
    BatchCursor(Predictor pinned, std::vector<BatchInput> inputs)
        : pinned_(std::move(pinned)), inputs_(std::move(inputs)) {}

    Predictor               pinned_;
    std::vector<BatchInput> inputs_;
    std::size_t             pos_ = 0;
};

/* CSV (index,source,refractive_index,confidence,cluster,model,skipped_lines,error),
   written atomically; skipped_lines lists line numbers separated by ';' */
std::string write_batch_report(const std::vector<BatchItem>& items,
                               const std::string& predictions_dir,
                               const std::string& file_name = "");

}  // namespace refrax
