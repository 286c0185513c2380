/* ──────────────────────────────────────────────────────────────
   config.hpp   –  option structs for every stage of the pipeline
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common.hpp"

namespace refrax {

enum class ClusterAlgo { KMeans, Som };
enum class KernelKind  { Rbf, Linear };

std::string to_string(ClusterAlgo a);
std::string to_string(KernelKind k);
ClusterAlgo parse_cluster_algo(const std::string& s);
KernelKind  parse_kernel(const std::string& s);

/* prism + incidence sweep used by the simulator (and the importer's extension) */
struct SimOpt {
    double apex_deg        = 60.0;
    double incidence_start = 44.0;
    double incidence_end   = 80.0;
    double incidence_step  = 0.5;
};

struct ImportOpt {
    std::size_t min_points      = 3;
    double      min_span_deg    = 10.0;
    std::size_t grid_points     = 500;
    bool        extend_to_bound = false;   // continue the curve to 80° with the fitted prism relation
    bool        strict_lines    = false;   // first bad line throws DataFormatError
};

struct SomOpt {
    double      learning_rate = 0.5;
    double      sigma         = 1.0;
    std::string sigma_decay   = "exponential";   // linear | exponential | inverse
    std::string lr_decay      = "exponential";
    std::string neighborhood  = "gaussian";      // gaussian | bubble | mexican_hat
    int         max_iter      = 1000;
};

struct ClusterOpt {
    int           n_init   = 10;       // k-means restarts
    int           max_iter = 300;
    double        tol      = 1e-4;
    SomOpt        som{};
    std::size_t   min_cluster_samples    = 10;
    int           cluster_cv_folds       = 3;     // per-cluster held-out error estimate
    bool          estimate_cluster_error = true;
    std::uint32_t seed     = 42;
};

struct SvrOpt {
    KernelKind kernel      = KernelKind::Rbf;
    double     C           = 1.0;
    double     epsilon     = 1e-3;
    double     gamma_scale = 1.0;    // γ = gamma_scale / (d · var(X))
    double     tol         = 1e-4;   // libsvm stopping tolerance
    double     cache_mb    = 100.0;  // libsvm kernel cache
};

struct ConfidenceOpt {
    double distance_weight   = 0.5;   // error weight = 1 - distance_weight
    double min_target_spread = 1e-3;
};

struct TuneOpt {
    int    n_trials         = 100;
    double timeout_s        = 7200.0;
    int    cv_folds         = 3;       // < 2 ⇒ single holdout of validation_ratio
    double validation_ratio = 0.2;
    std::vector<ClusterAlgo> algorithms{ClusterAlgo::KMeans, ClusterAlgo::Som};
    int    k_min = 2, k_max = 5;
    std::vector<KernelKind> kernels{KernelKind::Rbf, KernelKind::Linear};
    double c_min     = 1e-3, c_max     = 1e3;
    double eps_min   = 1e-6, eps_max   = 1e-1;
    double gamma_min = 0.1,  gamma_max = 10.0;
    int    n_startup      = 10;
    int    n_candidates   = 24;
    double gamma_quantile = 0.25;
    std::uint32_t seed    = 42;
};

struct TrainOpt {
    double        test_ratio = 0.2;
    std::uint32_t seed       = 42;
};

struct StorageOpt {
    std::string images_dir      = "template";
    std::string models_dir      = "saved_models";
    std::string predictions_dir = "predictions";
    std::string backbone_path   = "backbone.json";
};

struct LogOpt {
    std::string level = "info";
    std::string file;
};

struct RefraxConfig {
    SimOpt        sim{};
    ImportOpt     import{};
    ClusterOpt    cluster{};
    SvrOpt        svr{};
    ConfidenceOpt confidence{};
    TuneOpt       tune{};
    TrainOpt      train{};
    StorageOpt    storage{};
    LogOpt        log{};

    /* nested objects named after the sections above; unknown keys are logged */
    void apply_json(const json& j);
    /* --section.key=value, value parsed as JSON when possible; returns the other args */
    std::vector<std::string> apply_cli(int argc, char* argv[]);
    void validate() const;           // throws InvalidRangeError
    json to_json() const;

    static RefraxConfig from_file(const std::string& path);
};

}  // namespace refrax
