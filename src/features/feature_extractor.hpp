/* ──────────────────────────────────────────────────────────────
   feature_extractor.hpp  –  CurveImage → FeatureVector
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <Eigen/Dense>

#include "features/backbone.hpp"
#include "simulation/curve_render.hpp"

namespace refrax {

using FeatureVector = Eigen::VectorXd;

class FeatureExtractor {
public:
    /* a null handle is a load failure the caller did not surface: BackboneLoadError */
    explicit FeatureExtractor(BackboneHandle backbone);

    /* pure; InvalidRangeError unless image is kRasterSize² */
    FeatureVector extract(const CurveImage& image) const;

    int feature_dim() const { return bb_->feature_dim(); }
    const std::string& backbone_digest() const { return bb_->digest(); }
    const BackboneHandle& backbone() const { return bb_; }

private:
    BackboneHandle bb_;
};

}  // namespace refrax
