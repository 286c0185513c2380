/* ──────────────────────────────────────────────────────────────
   trainer.hpp   –  split → optimize → final fit → evaluate → save
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "config.hpp"
#include "features/dataset.hpp"
#include "store/model_artifact.hpp"
#include "training/optimizer.hpp"

namespace refrax {

class ModelStore;

/* seeded shuffle; at least one test row when test_ratio > 0 */
void split_train_test(int n, double test_ratio, std::uint32_t seed,
                      std::vector<int>& train_out, std::vector<int>& test_out);

class Trainer {
public:
    Trainer(RefraxConfig cfg, std::string backbone_digest);

    /* saved after every successful run when attached; must outlive the trainer */
    void attach_store(ModelStore* store) { store_ = store; }
    void set_progress_sink(ProgressSink sink) { sink_ = std::move(sink); }

    TrainedModel run(const Dataset& ds, const CancelToken* cancel = nullptr) const;

    const RefraxConfig& config() const { return cfg_; }

private:
    RefraxConfig cfg_;
    std::string  digest_;
    ModelStore*  store_ = nullptr;
    ProgressSink sink_;
};

/*  One background training run at a time. start() while a run is in
    flight throws std::logic_error; wait() joins and rethrows the run's
    exception, if any, and may be called from several threads. The
    cancel flag is cleared when a run ends, so a cancel() issued before
    start() stops the next run before its first trial.                 */
class TrainingJob {
public:
    explicit TrainingJob(Trainer trainer);
    ~TrainingJob();

    TrainingJob(const TrainingJob&)            = delete;
    TrainingJob& operator=(const TrainingJob&) = delete;

    void start(Dataset ds);
    void cancel() { cancel_.cancel(); }
    bool running() const { return running_; }

    std::shared_ptr<const TrainedModel> wait();

private:
    Trainer                             trainer_;
    CancelToken                         cancel_;
    std::thread                         th_;
    std::mutex                          th_mtx_;    // guards th_; taken before mtx_
    std::atomic<bool>                   running_{false};
    std::mutex                          mtx_;
    std::exception_ptr                  error_;
    std::shared_ptr<const TrainedModel> result_;
};

}  // namespace refrax
