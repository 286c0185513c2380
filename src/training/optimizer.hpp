/* ──────────────────────────────────────────────────────────────
   optimizer.hpp  –  trial loop over clustering / SVR configurations
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <atomic>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "config.hpp"
#include "training/tpe_sampler.hpp"

namespace refrax {

/* cooperative stop flag, polled between trials */
class CancelToken {
    std::atomic<bool> flag_{false};
public:
    void cancel()          { flag_ = true; }
    void reset()           { flag_ = false; }
    bool cancelled() const { return flag_; }
};

struct TrialParams {
    ClusterAlgo algo = ClusterAlgo::KMeans;
    int         k    = 3;
    SvrOpt      svr{};
};

void to_json(json& j, const TrialParams& p);
void from_json(const json& j, TrialParams& p);

struct TrialRecord {
    int         number  = 0;
    TrialParams params{};
    double      score   = 0.0;      // mean validation MAE, +inf when failed
    bool        ok      = false;
    std::string message;
    double      seconds = 0.0;
};

void to_json(json& j, const TrialRecord& t);
void from_json(const json& j, TrialRecord& t);

struct OptimizeResult {
    TrialRecord              best;
    std::vector<TrialRecord> history;
    bool                     cancelled = false;
    bool                     timed_out = false;
};

/* train/validation row indices, shared by every trial of a run */
struct Split {
    std::vector<int> train, val;
};

/*  folds >= 2 → k-fold over a seeded shuffle; otherwise one holdout
    of `val_ratio` rows (at least one row on each side).             */
std::vector<Split> make_splits(int n, int folds, double val_ratio, std::uint32_t seed);

/* search space of one run; the cluster-count ceiling is capped by the smallest fold */
std::vector<ParamSpec> build_search_space(const TuneOpt& tune, int k_hi);
TrialParams            decode_params(const ParamSet& p, const TuneOpt& tune, const SvrOpt& base);

/*  Runs up to tune.n_trials trials (or until tune.timeout_s) on a fixed
    split. A trial whose every configuration loses its clusters is
    recorded as failed. Throws TrainingAbortedError when cancelled
    before any success and NoValidConfigurationError when all failed. */
OptimizeResult optimize(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                        const RefraxConfig& cfg, const CancelToken* cancel = nullptr,
                        const ProgressSink& sink = {});

/* mean validation MAE of one configuration over the splits */
double score_trial(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                   const std::vector<Split>& splits, const TrialParams& params,
                   const RefraxConfig& cfg);

}  // namespace refrax
