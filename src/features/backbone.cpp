#include "features/backbone.hpp"

#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

#include "errors.hpp"

namespace refrax {

namespace {

using Channels = std::vector<Eigen::MatrixXf>;

/* zero-padded "same" 3×3 convolution + bias + ReLU */
Channels conv_relu(const Channels& in, const ConvLayer& L)
{
    const Eigen::Index H = in[0].rows(), W = in[0].cols();
    Channels padded(in.size());
    for (std::size_t c = 0; c < in.size(); ++c) {
        padded[c] = Eigen::MatrixXf::Zero(H + 2, W + 2);
        padded[c].block(1, 1, H, W) = in[c];
    }

    Channels out(std::size_t(L.out_ch));
#pragma omp parallel for schedule(dynamic)
    for (int o = 0; o < L.out_ch; ++o) {
        Eigen::MatrixXf acc = Eigen::MatrixXf::Constant(H, W, L.b(o));
        for (int c = 0; c < L.in_ch; ++c) {
            const Eigen::Matrix3f& k = L.w[std::size_t(o * L.in_ch + c)];
            for (int ky = 0; ky < 3; ++ky)
                for (int kx = 0; kx < 3; ++kx)
                    acc.noalias() += k(ky, kx) * padded[std::size_t(c)].block(ky, kx, H, W);
        }
        out[std::size_t(o)] = acc.cwiseMax(0.0f);
    }
    return out;
}

Channels max_pool2(const Channels& in)
{
    const Eigen::Index H = in[0].rows() / 2, W = in[0].cols() / 2;
    Channels out(in.size());
    for (std::size_t c = 0; c < in.size(); ++c) {
        out[c].resize(H, W);
        for (Eigen::Index r = 0; r < H; ++r)
            for (Eigen::Index q = 0; q < W; ++q)
                out[c](r, q) = in[c].block(2 * r, 2 * q, 2, 2).maxCoeff();
    }
    return out;
}

/* FNV-1a over shapes and raw float bits */
struct Fnv {
    std::uint64_t h = 1469598103934665603ULL;
    void bytes(const void* p, std::size_t n)
    {
        const auto* c = static_cast<const unsigned char*>(p);
        for (std::size_t i = 0; i < n; ++i) { h ^= c[i]; h *= 1099511628211ULL; }
    }
    void i(int v) { bytes(&v, sizeof v); }
    void f(float v) { bytes(&v, sizeof v); }
};

}  // namespace

Backbone Backbone::from_json(const json& j)
{
    Backbone bb;
    try {
        bb.input_size_ = j.at("input_size").get<int>();
        bb.pool_grid_  = j.at("pool_grid").get<int>();
        const auto& layers = j.at("layers");
        if (!layers.is_array() || layers.empty())
            throw BackboneLoadError("backbone has no layers");

        int prev_ch = 1, size = bb.input_size_;
        for (const auto& lj : layers) {
            ConvLayer L;
            L.in_ch  = lj.at("in").get<int>();
            L.out_ch = lj.at("out").get<int>();
            if (L.in_ch != prev_ch || L.out_ch <= 0)
                throw BackboneLoadError("backbone layer " + std::to_string(bb.layers_.size()) +
                                        " expects " + std::to_string(L.in_ch) +
                                        " input channels, previous stage yields " +
                                        std::to_string(prev_ch));
            const auto w = lj.at("weights").get<std::vector<float>>();
            const auto b = lj.at("bias").get<std::vector<float>>();
            if (w.size() != std::size_t(L.out_ch * L.in_ch * 9) || b.size() != std::size_t(L.out_ch))
                throw BackboneLoadError("Shape mismatch in backbone layer " +
                                        std::to_string(bb.layers_.size()));
            L.w.resize(std::size_t(L.out_ch * L.in_ch));
            for (std::size_t k = 0; k < L.w.size(); ++k)
                for (int t = 0; t < 9; ++t) L.w[k](t / 3, t % 3) = w[k * 9 + std::size_t(t)];
            L.b = Eigen::Map<const Eigen::VectorXf>(b.data(), Eigen::Index(b.size()));
            bb.layers_.push_back(std::move(L));
            prev_ch = bb.layers_.back().out_ch;
            size /= 2;
        }
        if (bb.input_size_ <= 0 || bb.pool_grid_ <= 0 || size < bb.pool_grid_)
            throw BackboneLoadError("backbone geometry: input " + std::to_string(bb.input_size_) +
                                    " pooled to " + std::to_string(size) + " < grid " +
                                    std::to_string(bb.pool_grid_));
    } catch (const json::exception& e) {
        throw BackboneLoadError(std::string("malformed backbone weights: ") + e.what());
    }
    bb.compute_digest();
    return bb;
}

Backbone Backbone::load(const std::string& path)
{
    if (!file_exists(path)) throw BackboneLoadError("backbone weights not found: " + path);
    std::string text;
    try {
        text = read_text_file(path);
    } catch (const std::runtime_error& e) {
        throw BackboneLoadError(e.what());
    }
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw BackboneLoadError("backbone weights are not JSON: " + path);
    Backbone bb = from_json(j);
    logI("backbone " + path + " loaded: " + std::to_string(bb.layers_.size()) + " stages, " +
         std::to_string(bb.feature_dim()) + " features, digest " + bb.digest());
    return bb;
}

void Backbone::compute_digest()
{
    Fnv f;
    f.i(input_size_);
    f.i(pool_grid_);
    for (const auto& L : layers_) {
        f.i(L.in_ch);
        f.i(L.out_ch);
        for (const auto& k : L.w)
            for (int t = 0; t < 9; ++t) f.f(k(t / 3, t % 3));
        for (Eigen::Index o = 0; o < L.b.size(); ++o) f.f(L.b(o));
    }
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << f.h;
    digest_ = ss.str();
}

Eigen::VectorXd Backbone::forward(const Eigen::MatrixXf& image) const
{
    if (image.rows() != input_size_ || image.cols() != input_size_)
        throw std::runtime_error("Shape mismatch: backbone expects " + std::to_string(input_size_) +
                                 "² input");
    Channels x{image};
    for (const auto& L : layers_) x = max_pool2(conv_relu(x, L));

    /* adaptive average pool onto pool_grid × pool_grid, channel-major */
    const int g = pool_grid_;
    const Eigen::Index H = x[0].rows(), W = x[0].cols();
    Eigen::VectorXd feat(feature_dim());
    Eigen::Index k = 0;
    for (const auto& ch : x)
        for (int gy = 0; gy < g; ++gy) {
            const Eigen::Index r0 = gy * H / g, r1 = ((gy + 1) * H + g - 1) / g;
            for (int gx = 0; gx < g; ++gx) {
                const Eigen::Index c0 = gx * W / g, c1 = ((gx + 1) * W + g - 1) / g;
                feat(k++) = double(ch.block(r0, c0, r1 - r0, c1 - c0).mean());
            }
        }
    return feat;
}

BackboneHandle load_backbone(const std::string& path)
{
    return std::make_shared<const Backbone>(Backbone::load(path));
}

void write_backbone_weights(const std::string& path, const BackboneSpec& spec, std::uint32_t seed)
{
    if (spec.channels.empty() || spec.pool_grid <= 0 || spec.input_size <= 0)
        throw InvalidRangeError("backbone spec needs channels, a pool grid and an input size");

    std::mt19937 rng(seed);
    json layers = json::array();
    int in_ch = 1;
    for (int out_ch : spec.channels) {
        if (out_ch <= 0) throw InvalidRangeError("backbone channel count must be > 0");
        std::normal_distribution<float> N(0.0f, std::sqrt(2.0f / float(in_ch * 9)));
        std::vector<float> w(std::size_t(out_ch * in_ch * 9));
        for (auto& v : w) v = N(rng);
        std::vector<float> b(std::size_t(out_ch), 0.01f);
        layers.push_back({{"in", in_ch}, {"out", out_ch}, {"weights", w}, {"bias", b}});
        in_ch = out_ch;
    }
    json j = {{"input_size", spec.input_size}, {"pool_grid", spec.pool_grid}, {"layers", layers}};
    write_file_atomic(path, j.dump());
    logI("wrote backbone weights to " + path + " (seed " + std::to_string(seed) + ")");
}

}  // namespace refrax
