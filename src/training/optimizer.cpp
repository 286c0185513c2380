#include "training/optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

#include "errors.hpp"
#include "regression/cluster_regressor.hpp"

namespace refrax {

namespace {

Eigen::MatrixXd rows_of(const Eigen::MatrixXd& X, const std::vector<int>& r)
{
    Eigen::MatrixXd out(Eigen::Index(r.size()), X.cols());
    for (std::size_t i = 0; i < r.size(); ++i) out.row(Eigen::Index(i)) = X.row(r[i]);
    return out;
}

Eigen::VectorXd rows_of(const Eigen::VectorXd& y, const std::vector<int>& r)
{
    Eigen::VectorXd out(Eigen::Index(r.size()));
    for (std::size_t i = 0; i < r.size(); ++i) out(Eigen::Index(i)) = y(r[i]);
    return out;
}

std::string describe(const TrialParams& p)
{
    return to_string(p.algo) + " k=" + std::to_string(p.k) + " " + to_string(p.svr.kernel) +
           " C=" + format_fixed(p.svr.C, 4) + " eps=" + format_fixed(p.svr.epsilon, 6) +
           " gs=" + format_fixed(p.svr.gamma_scale, 3);
}

}  // namespace

/* ────────── JSON ────────── */
void to_json(json& j, const TrialParams& p)
{
    j = {{"algo", to_string(p.algo)}, {"k", p.k}, {"kernel", to_string(p.svr.kernel)},
         {"C", p.svr.C}, {"epsilon", p.svr.epsilon}, {"gamma_scale", p.svr.gamma_scale}};
}

void from_json(const json& j, TrialParams& p)
{
    p.algo            = parse_cluster_algo(j.at("algo").get<std::string>());
    p.k               = j.at("k").get<int>();
    p.svr.kernel      = parse_kernel(j.at("kernel").get<std::string>());
    p.svr.C           = j.at("C").get<double>();
    p.svr.epsilon     = j.at("epsilon").get<double>();
    p.svr.gamma_scale = j.at("gamma_scale").get<double>();
}

void to_json(json& j, const TrialRecord& t)
{
    j = {{"number", t.number}, {"params", t.params}, {"ok", t.ok},
         {"message", t.message}, {"seconds", t.seconds}};
    j["score"] = std::isfinite(t.score) ? json(t.score) : json(nullptr);   // JSON has no inf
}

void from_json(const json& j, TrialRecord& t)
{
    t.number  = j.at("number").get<int>();
    t.params  = j.at("params").get<TrialParams>();
    t.ok      = j.at("ok").get<bool>();
    t.message = j.value("message", std::string{});
    t.seconds = j.value("seconds", 0.0);
    const auto& s = j.at("score");
    t.score = s.is_null() ? std::numeric_limits<double>::infinity() : s.get<double>();
}

/* ────────── splits / search space ────────── */
std::vector<Split> make_splits(int n, int folds, double val_ratio, std::uint32_t seed)
{
    if (n < 2) throw InsufficientValidSamplesError("need at least two rows to validate");
    std::vector<int> idx(static_cast<std::size_t>(n));
    std::iota(idx.begin(), idx.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(idx.begin(), idx.end(), rng);

    std::vector<Split> out;
    if (folds >= 2) {
        const int F = std::min(folds, n);
        for (int f = 0; f < F; ++f) {
            Split s;
            for (int i = 0; i < n; ++i) (i % F == f ? s.val : s.train).push_back(idx[std::size_t(i)]);
            out.push_back(std::move(s));
        }
        return out;
    }
    int n_val = int(std::lround(double(n) * val_ratio));
    n_val = std::min(n - 1, std::max(1, n_val));
    Split s;
    s.val.assign(idx.begin(), idx.begin() + n_val);
    s.train.assign(idx.begin() + n_val, idx.end());
    out.push_back(std::move(s));
    return out;
}

std::vector<ParamSpec> build_search_space(const TuneOpt& tune, int k_hi)
{
    std::vector<ParamSpec> sp;
    sp.push_back({"algo", ParamSpec::Categorical, 0, 0, int(tune.algorithms.size())});
    sp.push_back({"k", ParamSpec::Int, double(tune.k_min), double(std::max(tune.k_min, k_hi)), 0});
    sp.push_back({"kernel", ParamSpec::Categorical, 0, 0, int(tune.kernels.size())});
    sp.push_back({"C", ParamSpec::LogFloat, tune.c_min, tune.c_max, 0});
    sp.push_back({"epsilon", ParamSpec::LogFloat, tune.eps_min, tune.eps_max, 0});
    sp.push_back({"gamma_scale", ParamSpec::LogFloat, tune.gamma_min, tune.gamma_max, 0});
    return sp;
}

TrialParams decode_params(const ParamSet& p, const TuneOpt& tune, const SvrOpt& base)
{
    TrialParams t;
    t.algo            = tune.algorithms.at(std::size_t(p.at("algo")));
    t.k               = int(std::lround(p.at("k")));
    t.svr             = base;
    t.svr.kernel      = tune.kernels.at(std::size_t(p.at("kernel")));
    t.svr.C           = p.at("C");
    t.svr.epsilon     = p.at("epsilon");
    t.svr.gamma_scale = p.at("gamma_scale");
    return t;
}

/* ────────── scoring ────────── */
double score_trial(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                   const std::vector<Split>& splits, const TrialParams& params,
                   const RefraxConfig& cfg)
{
    ClusterOpt copt = cfg.cluster;
    copt.estimate_cluster_error = false;     // validation rows score the trial instead

    double sum = 0.0;
    for (const auto& s : splits) {
        auto model = ClusterRegressionModel::fit(rows_of(X, s.train), rows_of(y, s.train),
                                                 params.algo, params.k, copt, params.svr,
                                                 cfg.confidence);
        const Eigen::VectorXd pred = model.predict_values(rows_of(X, s.val));
        sum += (pred - rows_of(y, s.val)).cwiseAbs().mean();
    }
    return sum / double(splits.size());
}

OptimizeResult optimize(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                        const RefraxConfig& cfg, const CancelToken* cancel,
                        const ProgressSink& sink)
{
    using clock = std::chrono::steady_clock;
    const auto& tune = cfg.tune;
    if (X.rows() != y.size())
        throw std::runtime_error("Shape mismatch: " + std::to_string(X.rows()) + " rows vs " +
                                 std::to_string(y.size()) + " targets");

    const auto splits = make_splits(int(X.rows()), tune.cv_folds, tune.validation_ratio, tune.seed);
    std::size_t min_train = std::numeric_limits<std::size_t>::max();
    for (const auto& s : splits) min_train = std::min(min_train, s.train.size());
    const int k_cap = int(min_train / std::max<std::size_t>(1, cfg.cluster.min_cluster_samples));
    const int k_hi  = std::max(tune.k_min, std::min(tune.k_max, k_cap));
    if (k_cap < tune.k_max)
        logI("optimize: cluster count capped at " + std::to_string(k_hi) + " (" +
             std::to_string(min_train) + " training rows per fold)");

    TpeConfig tc;
    tc.n_startup    = tune.n_startup;
    tc.n_candidates = tune.n_candidates;
    tc.gamma        = tune.gamma_quantile;
    tc.seed         = tune.seed;
    TpeSampler sampler(build_search_space(tune, k_hi), tc);

    OptimizeResult res;
    res.best.score = std::numeric_limits<double>::infinity();
    const auto t0 = clock::now();

    for (int n = 0; n < tune.n_trials; ++n) {
        if (cancel && cancel->cancelled()) {
            res.cancelled = true;
            logW("optimize: cancelled after " + std::to_string(n) + " trials");
            break;
        }
        const double elapsed = std::chrono::duration<double>(clock::now() - t0).count();
        if (elapsed >= tune.timeout_s) {
            res.timed_out = true;
            logW("optimize: timeout after " + std::to_string(n) + " trials");
            break;
        }

        const ParamSet ps = sampler.ask();
        TrialRecord tr;
        tr.number = n;
        tr.params = decode_params(ps, tune, cfg.svr);
        const auto ts = clock::now();
        try {
            tr.score = score_trial(X, y, splits, tr.params, cfg);
            tr.ok    = true;
        } catch (const InsufficientValidSamplesError& e) {
            tr.score   = std::numeric_limits<double>::infinity();
            tr.message = e.what();
            logW("trial " + std::to_string(n) + " failed (" + describe(tr.params) + "): " + e.what());
        }
        tr.seconds = std::chrono::duration<double>(clock::now() - ts).count();
        sampler.tell(ps, tr.score);

        if (tr.ok) {
            logD("trial " + std::to_string(n) + " " + describe(tr.params) + " → MAE " +
                 format_fixed(tr.score, 6));
            if (tr.score < res.best.score) res.best = tr;
        }
        res.history.push_back(tr);
        emit_progress(sink, "optimize", std::size_t(n + 1), std::size_t(tune.n_trials),
                      tr.ok ? "MAE " + format_fixed(tr.score, 6) : "failed");
    }

    if (!res.best.ok) {
        if (res.cancelled)
            throw TrainingAbortedError("training cancelled before any trial succeeded (" +
                                       std::to_string(res.history.size()) + " run)");
        if (res.timed_out && res.history.empty())
            throw TrainingAbortedError("training timed out after " +
                                       format_fixed(tune.timeout_s, 1) +
                                       " s before the first trial ran");
        throw NoValidConfigurationError("no valid configuration: all " +
                                        std::to_string(res.history.size()) +
                                        " trials had insufficient valid samples" +
                                        (res.timed_out ? " (stopped by the timeout)" : ""));
    }
    logI("optimize: best trial " + std::to_string(res.best.number) + " " +
         describe(res.best.params) + " MAE " + format_fixed(res.best.score, 6));
    return res;
}

}  // namespace refrax
