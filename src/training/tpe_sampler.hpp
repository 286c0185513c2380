/* ──────────────────────────────────────────────────────────────
   tpe_sampler.hpp  –  Tree-structured Parzen Estimator (ask / tell)
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace refrax {

struct ParamSpec {
    enum Kind { Categorical, Int, LogFloat };
    std::string name;
    Kind        kind = LogFloat;
    double      lo = 0.0, hi = 1.0;   // Int / LogFloat bounds (inclusive)
    int         n_choices = 0;        // Categorical
};

/* categorical → choice index, int → value, log-float → value */
using ParamSet = std::map<std::string, double>;

struct TpeConfig {
    int           n_startup    = 10;
    int           n_candidates = 24;
    double        gamma        = 0.25;   // share of observations treated as "good"
    std::uint32_t seed         = 42;
};

/*  Independent per-parameter TPE: observations split at the γ
    quantile of the score (lower is better, failures count as bad),
    a Parzen mixture per side, n_candidates drawn from the good side,
    the one with the largest l(x)/g(x) wins.                         */
class TpeSampler {
public:
    TpeSampler(std::vector<ParamSpec> space, TpeConfig cfg);

    ParamSet ask();
    void     tell(const ParamSet& params, double score);   // +inf for a failed trial

    std::size_t n_observed() const { return obs_.size(); }
    const std::vector<ParamSpec>& space() const { return space_; }

private:
    struct Obs { ParamSet p; double score; };

    double sample_uniform(const ParamSpec& s);
    double sample_numeric(const ParamSpec& s, const std::vector<double>& good,
                          const std::vector<double>& bad);
    double sample_categorical(const ParamSpec& s, const std::vector<double>& good,
                              const std::vector<double>& bad);

    std::vector<ParamSpec> space_;
    TpeConfig              cfg_;
    std::mt19937           rng_;
    std::vector<Obs>       obs_;
};

}  // namespace refrax
