#include "training/tpe_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "errors.hpp"

namespace refrax {

namespace {

constexpr double kInvSqrt2 = 0.7071067811865476;

double norm_cdf(double z) { return 0.5 * (1.0 + std::erf(z * kInvSqrt2)); }

/* truncated-Gaussian mixture over [lo, hi]: observed points + one wide prior */
struct Parzen {
    std::vector<double> mu, sigma;
    double lo, hi;

    Parzen(std::vector<double> pts, double lo_, double hi_) : lo(lo_), hi(hi_)
    {
        const double range = std::max(hi - lo, 1e-12);
        std::sort(pts.begin(), pts.end());
        const double min_bw = range / std::min(100.0, 1.0 + double(pts.size()));
        for (std::size_t i = 0; i < pts.size(); ++i) {
            const double left  = pts[i] - (i ? pts[i - 1] : lo);
            const double right = (i + 1 < pts.size() ? pts[i + 1] : hi) - pts[i];
            mu.push_back(pts[i]);
            sigma.push_back(std::min(range, std::max(min_bw, std::max(left, right))));
        }
        mu.push_back(0.5 * (lo + hi));
        sigma.push_back(range);
    }

    double log_pdf(double x) const
    {
        double p = 0.0;
        for (std::size_t j = 0; j < mu.size(); ++j) {
            const double s = sigma[j];
            const double z = (x - mu[j]) / s;
            const double mass = norm_cdf((hi - mu[j]) / s) - norm_cdf((lo - mu[j]) / s);
            p += std::exp(-0.5 * z * z) / (s * 2.5066282746310002 * std::max(mass, 1e-12));
        }
        return std::log(std::max(p / double(mu.size()), std::numeric_limits<double>::min()));
    }

    double draw(std::mt19937& rng) const
    {
        std::uniform_int_distribution<std::size_t> pick(0, mu.size() - 1);
        const std::size_t j = pick(rng);
        std::normal_distribution<double> N(mu[j], sigma[j]);
        for (int t = 0; t < 32; ++t) {
            const double v = N(rng);
            if (v >= lo && v <= hi) return v;
        }
        return std::min(hi, std::max(lo, mu[j]));
    }
};

}  // namespace

TpeSampler::TpeSampler(std::vector<ParamSpec> space, TpeConfig cfg)
    : space_(std::move(space)), cfg_(cfg), rng_(cfg.seed)
{
    for (const auto& s : space_) {
        if (s.kind == ParamSpec::Categorical && s.n_choices < 1)
            throw InvalidRangeError("parameter " + s.name + " has no choices");
        if (s.kind != ParamSpec::Categorical && !(s.lo <= s.hi))
            throw InvalidRangeError("parameter " + s.name + " has an empty range");
        if (s.kind == ParamSpec::LogFloat && !(s.lo > 0.0))
            throw InvalidRangeError("log parameter " + s.name + " needs a positive range");
    }
    if (!(cfg_.gamma > 0.0 && cfg_.gamma < 1.0) || cfg_.n_candidates < 1)
        throw InvalidRangeError("TPE needs 0 < gamma < 1 and at least one candidate");
}

double TpeSampler::sample_uniform(const ParamSpec& s)
{
    switch (s.kind) {
    case ParamSpec::Categorical:
        return double(std::uniform_int_distribution<int>(0, s.n_choices - 1)(rng_));
    case ParamSpec::Int:
        return double(std::uniform_int_distribution<int>(int(s.lo), int(s.hi))(rng_));
    case ParamSpec::LogFloat:
        break;
    }
    return std::exp(std::uniform_real_distribution<double>(std::log(s.lo), std::log(s.hi))(rng_));
}

double TpeSampler::sample_numeric(const ParamSpec& s, const std::vector<double>& good,
                                  const std::vector<double>& bad)
{
    const bool is_log = s.kind == ParamSpec::LogFloat;
    auto fwd = [is_log](double v) { return is_log ? std::log(v) : v; };
    const double lo = fwd(s.lo), hi = fwd(s.hi);
    if (hi - lo <= 0.0) return s.lo;

    std::vector<double> g, b;
    for (double v : good) g.push_back(fwd(v));
    for (double v : bad)  b.push_back(fwd(v));
    const Parzen l(g, lo, hi), gd(b, lo, hi);

    double best = l.draw(rng_), best_ratio = -std::numeric_limits<double>::infinity();
    for (int c = 0; c < cfg_.n_candidates; ++c) {
        double x = l.draw(rng_);
        if (s.kind == ParamSpec::Int) x = std::round(x);
        const double r = l.log_pdf(x) - gd.log_pdf(x);
        if (r > best_ratio) { best_ratio = r; best = x; }
    }
    const double v = is_log ? std::exp(best) : best;
    return std::min(s.hi, std::max(s.lo, v));
}

double TpeSampler::sample_categorical(const ParamSpec& s, const std::vector<double>& good,
                                      const std::vector<double>& bad)
{
    const std::size_t C = std::size_t(s.n_choices);
    std::vector<double> pg(C, 1.0), pb(C, 1.0);              // +1 prior per choice
    for (double v : good) pg[std::size_t(v)] += 1.0;
    for (double v : bad)  pb[std::size_t(v)] += 1.0;
    const double sg = double(good.size() + C), sb = double(bad.size() + C);

    std::discrete_distribution<int> draw(pg.begin(), pg.end());
    int best = draw(rng_);
    double best_ratio = -std::numeric_limits<double>::infinity();
    for (int c = 0; c < cfg_.n_candidates; ++c) {
        const int x = draw(rng_);
        const double r = (pg[std::size_t(x)] / sg) / (pb[std::size_t(x)] / sb);
        if (r > best_ratio) { best_ratio = r; best = x; }
    }
    return double(best);
}

ParamSet TpeSampler::ask()
{
    std::vector<const Obs*> finite;
    for (const auto& o : obs_)
        if (std::isfinite(o.score)) finite.push_back(&o);

    ParamSet out;
    if (int(obs_.size()) < cfg_.n_startup || finite.empty()) {
        for (const auto& s : space_) out[s.name] = sample_uniform(s);
        return out;
    }

    /* split: best ⌈γ·n⌉ finite observations are "good", everything else "bad" */
    std::vector<const Obs*> sorted;
    for (const auto& o : obs_) sorted.push_back(&o);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Obs* a, const Obs* b) { return a->score < b->score; });
    std::size_t n_good = std::size_t(std::ceil(cfg_.gamma * double(sorted.size())));
    n_good = std::max<std::size_t>(1, std::min(n_good, finite.size()));

    for (const auto& s : space_) {
        std::vector<double> good, bad;
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            auto it = sorted[i]->p.find(s.name);
            if (it == sorted[i]->p.end()) continue;
            (i < n_good ? good : bad).push_back(it->second);
        }
        out[s.name] = s.kind == ParamSpec::Categorical ? sample_categorical(s, good, bad)
                                                       : sample_numeric(s, good, bad);
    }
    return out;
}

void TpeSampler::tell(const ParamSet& params, double score)
{
    obs_.push_back({params, std::isnan(score) ? std::numeric_limits<double>::infinity() : score});
}

}  // namespace refrax
