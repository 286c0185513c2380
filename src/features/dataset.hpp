/* ──────────────────────────────────────────────────────────────
   dataset.hpp   –  feature matrix + refractive-index targets
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "features/feature_extractor.hpp"
#include "simulation/prism_simulator.hpp"

namespace refrax {

struct Dataset {
    Eigen::MatrixXd          X;          // one row per sample
    Eigen::VectorXd          y;          // refractive index
    std::vector<std::string> sources;    // file name or "sim:n"

    Eigen::Index size() const { return X.rows(); }
    Dataset subset(const std::vector<int>& rows) const;
};

constexpr std::size_t kMinTemplateSamples = 10;

/* "Rn_1.450.pgm" → 1.450; false for any other name */
bool parse_template_name(const std::string& file_name, double& refractive_index);

/*  Every Rn_<n>.pgm in images_dir, sorted by name. Unreadable or
    mis-named files are logged and skipped; fewer than
    kMinTemplateSamples usable ones → InsufficientValidSamplesError. */
Dataset load_template_dataset(const std::string& images_dir, const FeatureExtractor& fx,
                              const ProgressSink& sink = {});

/* renders and extracts simulated curves without touching the disk */
Dataset dataset_from_curves(const std::vector<SimulatedCurve>& curves, const FeatureExtractor& fx);

}  // namespace refrax
