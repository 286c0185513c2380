/* ──────────────────────────────────────────────────────────────
   backbone.hpp   –  frozen conv3×3/ReLU/max-pool feature network
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "common.hpp"

namespace refrax {

struct BackboneSpec {
    int              input_size = kRasterSize;
    std::vector<int> channels{8, 16, 16};    // output channels per stage
    int              pool_grid  = 4;         // adaptive average pool → grid × grid cells
};

struct ConvLayer {
    int in_ch = 0, out_ch = 0;
    std::vector<Eigen::Matrix3f> w;          // [out_ch * in_ch], index o*in_ch + c
    Eigen::VectorXf              b;          // [out_ch]
};

class Backbone {
public:
    /* throws BackboneLoadError on a missing, unreadable or inconsistent file */
    static Backbone load(const std::string& path);
    static Backbone from_json(const json& j);

    /* image: input_size × input_size, single channel */
    Eigen::VectorXd forward(const Eigen::MatrixXf& image) const;

    int  input_size()  const { return input_size_; }
    int  pool_grid()   const { return pool_grid_; }
    int  feature_dim() const { return layers_.back().out_ch * pool_grid_ * pool_grid_; }
    const std::string& digest() const { return digest_; }

private:
    Backbone() = default;
    void compute_digest();

    int                    input_size_ = 0;
    int                    pool_grid_  = 0;
    std::vector<ConvLayer> layers_;
    std::string            digest_;
};

/* loaded once by the caller, shared read-only by every extractor */
using BackboneHandle = std::shared_ptr<const Backbone>;

BackboneHandle load_backbone(const std::string& path);

/* He-scaled seeded weights for a fresh installation */
void write_backbone_weights(const std::string& path, const BackboneSpec& spec, std::uint32_t seed);

}  // namespace refrax
