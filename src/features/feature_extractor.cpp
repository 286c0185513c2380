#include "features/feature_extractor.hpp"

#include "errors.hpp"

namespace refrax {

FeatureExtractor::FeatureExtractor(BackboneHandle backbone) : bb_(std::move(backbone))
{
    if (!bb_) throw BackboneLoadError("feature extractor constructed without a backbone");
    if (bb_->input_size() != kRasterSize)
        throw BackboneLoadError("backbone input " + std::to_string(bb_->input_size()) +
                                " does not match the " + std::to_string(kRasterSize) + "px raster");
}

FeatureVector FeatureExtractor::extract(const CurveImage& image) const
{
    if (image.rows() != kRasterSize || image.cols() != kRasterSize)
        throw InvalidRangeError("image is " + std::to_string(image.rows()) + "×" +
                                std::to_string(image.cols()) + ", expected " +
                                std::to_string(kRasterSize) + "²");
    return bb_->forward(image);
}

}  // namespace refrax
