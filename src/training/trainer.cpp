#include "training/trainer.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <random>
#include <stdexcept>

#include "errors.hpp"
#include "store/model_store.hpp"

namespace refrax {

void split_train_test(int n, double test_ratio, std::uint32_t seed,
                      std::vector<int>& train_out, std::vector<int>& test_out)
{
    train_out.clear();
    test_out.clear();
    if (n <= 0) return;

    std::vector<int> tmp(static_cast<std::size_t>(n));                   // shuffle a copy of the row ids
    std::iota(tmp.begin(), tmp.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(tmp.begin(), tmp.end(), rng);

    int n_test = 0;
    if (test_ratio > 0.0) n_test = std::max(1, int(std::lround(double(n) * test_ratio)));
    n_test = std::min(n_test, n - 1);
    const int split = n - n_test;

    train_out.assign(tmp.begin(), tmp.begin() + split);
    test_out .assign(tmp.begin() + split, tmp.end());
}

Trainer::Trainer(RefraxConfig cfg, std::string backbone_digest)
    : cfg_(std::move(cfg)), digest_(std::move(backbone_digest))
{
    cfg_.validate();
}

TrainedModel Trainer::run(const Dataset& ds, const CancelToken* cancel) const
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    if (ds.size() < 2)
        throw InsufficientValidSamplesError("training needs at least two samples, got " +
                                            std::to_string(ds.size()));

    std::vector<int> tr_idx, te_idx;
    split_train_test(int(ds.size()), cfg_.train.test_ratio, cfg_.train.seed, tr_idx, te_idx);
    const Dataset train = ds.subset(tr_idx);
    const Dataset test  = ds.subset(te_idx);
    logI("training on " + std::to_string(train.size()) + " samples, " +
         std::to_string(test.size()) + " held out for testing");

    OptimizeResult opt = optimize(train.X, train.y, cfg_, cancel, sink_);

    /* final fit on every training row, with per-cluster error estimates */
    emit_progress(sink_, "fit", 0, 1, "final fit");
    ClusterOpt copt = cfg_.cluster;
    copt.estimate_cluster_error = true;
    const TrialParams& best = opt.best.params;

    TrainedModel m;
    m.regressor = ClusterRegressionModel::fit(train.X, train.y, best.algo, best.k, copt,
                                              best.svr, cfg_.confidence);
    m.params    = best;
    m.history   = std::move(opt.history);
    emit_progress(sink_, "fit", 1, 1, std::to_string(m.regressor.n_clusters()) + " clusters");

    if (test.size() > 0) {
        m.meta.test_metrics = evaluate(m.regressor.predict_values(test.X), test.y);
        logI("test MAE " + format_fixed(m.meta.test_metrics.mae, 6) + ", RMSE " +
             format_fixed(m.meta.test_metrics.rmse, 6) + ", R² " +
             format_fixed(m.meta.test_metrics.r2, 4) + ", accuracy " +
             format_fixed(m.meta.test_metrics.accuracy, 1) + "%");
    }
    emit_progress(sink_, "evaluate", 1, 1);

    m.meta.timestamp_ms     = now_ms();
    m.meta.created_at       = timestamp_string(m.meta.timestamp_ms, false);
    m.meta.n_train          = std::size_t(train.size());
    m.meta.n_test           = std::size_t(test.size());
    m.meta.validation_score = opt.best.score;
    m.meta.feature_dim      = int(ds.X.cols());
    m.meta.backbone_digest  = digest_;
    m.meta.n_trials         = int(m.history.size());
    m.meta.cancelled        = opt.cancelled;
    m.meta.training_seconds = std::chrono::duration<double>(clock::now() - t0).count();

    if (store_) m.model_id = store_->save(m);
    return m;
}

/* ────────── background job ────────── */
TrainingJob::TrainingJob(Trainer trainer) : trainer_(std::move(trainer)) {}

TrainingJob::~TrainingJob()
{
    cancel_.cancel();
    std::lock_guard<std::mutex> tl(th_mtx_);
    if (th_.joinable()) th_.join();
}

void TrainingJob::start(Dataset ds)
{
    std::lock_guard<std::mutex> tl(th_mtx_);
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) throw std::logic_error("a training run is already active");
    if (th_.joinable()) th_.join();

    error_  = nullptr;
    result_ = nullptr;
    running_ = true;
    th_ = std::thread([this, ds = std::move(ds)]() {
        std::shared_ptr<const TrainedModel> res;
        std::exception_ptr err;
        try {
            res = std::make_shared<const TrainedModel>(trainer_.run(ds, &cancel_));
        } catch (const std::exception& e) {
            logE(std::string("training run failed: ") + e.what());
            err = std::current_exception();
        }
        std::lock_guard<std::mutex> g(mtx_);
        result_  = std::move(res);
        error_   = err;
        cancel_.reset();
        running_ = false;
    });
}

std::shared_ptr<const TrainedModel> TrainingJob::wait()
{
    std::lock_guard<std::mutex> tl(th_mtx_);
    if (th_.joinable()) th_.join();
    std::lock_guard<std::mutex> lk(mtx_);
    if (error_) std::rethrow_exception(error_);
    return result_;
}

}  // namespace refrax
