/* ──────────────────────────────────────────────────────────────
   model_comparator.hpp  –  incremental ranking of stored models
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "store/model_store.hpp"
#include "training/metrics.hpp"

namespace refrax {

struct CachedScore {
    double       score        = 0.0;
    std::int64_t timestamp_ms = 0;
    bool         needs_eval   = false;
    EvalMetrics  metrics{};
};

struct RankedModel {
    std::string  model_id;
    double       score        = 0.0;
    std::int64_t timestamp_ms = 0;
    int          rank         = 0;      // 1 = best
    EvalMetrics  metrics{};
};

class ModelComparator {
public:
    explicit ModelComparator(const ModelStore& store) : store_(store) {}

    /*  Ranked by ascending score, then newer timestamp, then id. Only
        ids without a current cache entry are read from the store;
        unreadable models are logged and left out.                    */
    std::vector<RankedModel> compare(const std::vector<std::string>& ids);
    std::vector<RankedModel> compare_all() { return compare(store_.list()); }

    void               invalidate(const std::string& model_id);
    const CachedScore* cached(const std::string& model_id) const;
    std::size_t        evaluations() const { return evaluations_; }

    /* score becomes the MAE on (X, y); every cached entry needs re-evaluation */
    void set_reference(Eigen::MatrixXd X, Eigen::VectorXd y);
    void clear_reference();
    bool has_reference() const { return ref_X_.rows() > 0; }

    void save_cache(const std::string& path) const;
    void load_cache(const std::string& path);

    static void export_csv(const std::vector<RankedModel>& ranking, const std::string& path);

private:
    bool evaluate_into(const std::string& id, CachedScore& out);
    void mark_all_stale();

    const ModelStore&                  store_;
    std::map<std::string, CachedScore> cache_;
    Eigen::MatrixXd                    ref_X_;
    Eigen::VectorXd                    ref_y_;
    std::size_t                        evaluations_ = 0;
};

}  // namespace refrax
