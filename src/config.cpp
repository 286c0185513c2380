/* ──────────────────────────────────────────────────────────────
   config.cpp   –  defaults → JSON file → --section.key=value flags
   ────────────────────────────────────────────────────────────── */
#include "config.hpp"

#include <initializer_list>
#include <set>

#include "errors.hpp"

namespace refrax {

std::string to_string(ClusterAlgo a) { return a == ClusterAlgo::KMeans ? "kmeans" : "som"; }
std::string to_string(KernelKind k)  { return k == KernelKind::Rbf ? "rbf" : "linear"; }

ClusterAlgo parse_cluster_algo(const std::string& s)
{
    if (s == "kmeans") return ClusterAlgo::KMeans;
    if (s == "som")    return ClusterAlgo::Som;
    throw InvalidRangeError("unknown clustering algorithm: " + s);
}

KernelKind parse_kernel(const std::string& s)
{
    if (s == "rbf")    return KernelKind::Rbf;
    if (s == "linear") return KernelKind::Linear;
    throw InvalidRangeError("unknown SVR kernel: " + s);
}

namespace {

template <typename T>
void take(const json& o, const char* key, T& field)
{
    if (o.contains(key)) field = o.at(key).get<T>();
}

void warn_unknown(const std::string& section, const json& o,
                  std::initializer_list<const char*> known)
{
    std::set<std::string> k(known.begin(), known.end());
    for (auto it = o.begin(); it != o.end(); ++it)
        if (!k.count(it.key()))
            logW("config: ignored key " + section + "." + it.key());
}

}  // namespace

void RefraxConfig::apply_json(const json& j)
{
    if (!j.is_object()) throw InvalidRangeError("config root must be a JSON object");

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& sec = it.key();
        const json& o = it.value();
        if (!o.is_object()) { logW("config: section " + sec + " is not an object"); continue; }

        if (sec == "sim") {
            take(o, "apex_deg", sim.apex_deg);
            take(o, "incidence_start", sim.incidence_start);
            take(o, "incidence_end", sim.incidence_end);
            take(o, "incidence_step", sim.incidence_step);
            warn_unknown(sec, o, {"apex_deg", "incidence_start", "incidence_end", "incidence_step"});
        } else if (sec == "import") {
            take(o, "min_points", import.min_points);
            take(o, "min_span_deg", import.min_span_deg);
            take(o, "grid_points", import.grid_points);
            take(o, "extend_to_bound", import.extend_to_bound);
            take(o, "strict_lines", import.strict_lines);
            warn_unknown(sec, o, {"min_points", "min_span_deg", "grid_points",
                                  "extend_to_bound", "strict_lines"});
        } else if (sec == "cluster") {
            take(o, "n_init", cluster.n_init);
            take(o, "max_iter", cluster.max_iter);
            take(o, "tol", cluster.tol);
            take(o, "min_cluster_samples", cluster.min_cluster_samples);
            take(o, "cluster_cv_folds", cluster.cluster_cv_folds);
            take(o, "estimate_cluster_error", cluster.estimate_cluster_error);
            take(o, "seed", cluster.seed);
            take(o, "som_learning_rate", cluster.som.learning_rate);
            take(o, "som_sigma", cluster.som.sigma);
            take(o, "som_sigma_decay", cluster.som.sigma_decay);
            take(o, "som_lr_decay", cluster.som.lr_decay);
            take(o, "som_neighborhood", cluster.som.neighborhood);
            take(o, "som_max_iter", cluster.som.max_iter);
            warn_unknown(sec, o, {"n_init", "max_iter", "tol", "min_cluster_samples",
                                  "cluster_cv_folds", "estimate_cluster_error", "seed",
                                  "som_learning_rate", "som_sigma", "som_sigma_decay",
                                  "som_lr_decay", "som_neighborhood", "som_max_iter"});
        } else if (sec == "svr") {
            if (o.contains("kernel")) svr.kernel = parse_kernel(o.at("kernel").get<std::string>());
            take(o, "C", svr.C);
            take(o, "epsilon", svr.epsilon);
            take(o, "gamma_scale", svr.gamma_scale);
            take(o, "tol", svr.tol);
            take(o, "cache_mb", svr.cache_mb);
            warn_unknown(sec, o, {"kernel", "C", "epsilon", "gamma_scale", "tol", "cache_mb"});
        } else if (sec == "confidence") {
            take(o, "distance_weight", confidence.distance_weight);
            take(o, "min_target_spread", confidence.min_target_spread);
            warn_unknown(sec, o, {"distance_weight", "min_target_spread"});
        } else if (sec == "tune") {
            take(o, "n_trials", tune.n_trials);
            take(o, "timeout_s", tune.timeout_s);
            take(o, "cv_folds", tune.cv_folds);
            take(o, "validation_ratio", tune.validation_ratio);
            if (o.contains("algorithms")) {
                tune.algorithms.clear();
                for (const auto& a : o.at("algorithms"))
                    tune.algorithms.push_back(parse_cluster_algo(a.get<std::string>()));
            }
            if (o.contains("kernels")) {
                tune.kernels.clear();
                for (const auto& k : o.at("kernels"))
                    tune.kernels.push_back(parse_kernel(k.get<std::string>()));
            }
            take(o, "k_min", tune.k_min);
            take(o, "k_max", tune.k_max);
            take(o, "c_min", tune.c_min);
            take(o, "c_max", tune.c_max);
            take(o, "eps_min", tune.eps_min);
            take(o, "eps_max", tune.eps_max);
            take(o, "gamma_min", tune.gamma_min);
            take(o, "gamma_max", tune.gamma_max);
            take(o, "n_startup", tune.n_startup);
            take(o, "n_candidates", tune.n_candidates);
            take(o, "gamma_quantile", tune.gamma_quantile);
            take(o, "seed", tune.seed);
            warn_unknown(sec, o, {"n_trials", "timeout_s", "cv_folds", "validation_ratio",
                                  "algorithms", "kernels", "k_min", "k_max", "c_min", "c_max",
                                  "eps_min", "eps_max", "gamma_min", "gamma_max", "n_startup",
                                  "n_candidates", "gamma_quantile", "seed"});
        } else if (sec == "train") {
            take(o, "test_ratio", train.test_ratio);
            take(o, "seed", train.seed);
            warn_unknown(sec, o, {"test_ratio", "seed"});
        } else if (sec == "storage") {
            take(o, "images_dir", storage.images_dir);
            take(o, "models_dir", storage.models_dir);
            take(o, "predictions_dir", storage.predictions_dir);
            take(o, "backbone_path", storage.backbone_path);
            warn_unknown(sec, o, {"images_dir", "models_dir", "predictions_dir", "backbone_path"});
        } else if (sec == "log") {
            take(o, "level", log.level);
            take(o, "file", log.file);
            warn_unknown(sec, o, {"level", "file"});
        } else {
            logW("config: ignored section " + sec);
        }
    }
}

std::vector<std::string> RefraxConfig::apply_cli(int argc, char* argv[])
{
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto eq  = a.find('=');
        auto dot = a.find('.');
        if (a.rfind("--", 0) != 0 || eq == std::string::npos ||
            dot == std::string::npos || dot > eq) {
            rest.push_back(a);
            continue;
        }
        std::string section = a.substr(2, dot - 2);
        std::string key     = a.substr(dot + 1, eq - dot - 1);
        std::string raw     = a.substr(eq + 1);

        json value = json::parse(raw, nullptr, /*allow_exceptions=*/false);
        if (value.is_discarded()) value = raw;        // bare word → string
        json patch;
        patch[section][key] = value;
        apply_json(patch);
    }
    return rest;
}

void RefraxConfig::validate() const
{
    auto need = [](bool ok, const std::string& what) {
        if (!ok) throw InvalidRangeError("invalid configuration: " + what);
    };
    need(sim.apex_deg > 0.0 && sim.apex_deg < 180.0, "sim.apex_deg must be in (0, 180)");
    need(sim.incidence_step > 0.0, "sim.incidence_step must be > 0");
    need(sim.incidence_start >= kMinIncidenceDeg && sim.incidence_end <= kMaxIncidenceDeg &&
         sim.incidence_start < sim.incidence_end, "sim incidence sweep must lie in [0, 80]");
    need(import.min_points >= 2, "import.min_points must be >= 2");
    need(import.grid_points >= 2, "import.grid_points must be >= 2");
    need(cluster.n_init >= 1 && cluster.max_iter >= 1, "cluster iterations must be >= 1");
    need(cluster.min_cluster_samples >= 1, "cluster.min_cluster_samples must be >= 1");
    need(cluster.som.max_iter >= 1 && cluster.som.sigma > 0.0 && cluster.som.learning_rate > 0.0,
         "cluster.som_* must be positive");
    need(svr.C > 0.0 && svr.epsilon >= 0.0 && svr.gamma_scale > 0.0 && svr.tol > 0.0 &&
         svr.cache_mb > 0.0, "svr parameters out of range");
    need(confidence.distance_weight >= 0.0 && confidence.distance_weight <= 1.0,
         "confidence.distance_weight must be in [0, 1]");
    need(tune.n_trials >= 1 && tune.timeout_s > 0.0, "tune budget must be positive");
    need(tune.validation_ratio > 0.0 && tune.validation_ratio < 1.0,
         "tune.validation_ratio must be in (0, 1)");
    need(!tune.algorithms.empty() && !tune.kernels.empty(), "tune search space is empty");
    need(tune.k_min >= 1 && tune.k_min <= tune.k_max, "tune.k_min..k_max is empty");
    need(tune.c_min > 0.0 && tune.c_min <= tune.c_max, "tune C range");
    need(tune.eps_min > 0.0 && tune.eps_min <= tune.eps_max, "tune epsilon range");
    need(tune.gamma_min > 0.0 && tune.gamma_min <= tune.gamma_max, "tune gamma range");
    need(tune.gamma_quantile > 0.0 && tune.gamma_quantile < 1.0, "tune.gamma_quantile");
    need(train.test_ratio >= 0.0 && train.test_ratio < 1.0, "train.test_ratio must be in [0, 1)");
}

json RefraxConfig::to_json() const
{
    json algos = json::array(), kernels = json::array();
    for (auto a : tune.algorithms) algos.push_back(to_string(a));
    for (auto k : tune.kernels)    kernels.push_back(to_string(k));
    return {
        {"sim", {{"apex_deg", sim.apex_deg}, {"incidence_start", sim.incidence_start},
                 {"incidence_end", sim.incidence_end}, {"incidence_step", sim.incidence_step}}},
        {"import", {{"min_points", import.min_points}, {"min_span_deg", import.min_span_deg},
                    {"grid_points", import.grid_points}, {"extend_to_bound", import.extend_to_bound},
                    {"strict_lines", import.strict_lines}}},
        {"cluster", {{"n_init", cluster.n_init},
                     {"max_iter", cluster.max_iter}, {"tol", cluster.tol},
                     {"min_cluster_samples", cluster.min_cluster_samples},
                     {"cluster_cv_folds", cluster.cluster_cv_folds},
                     {"estimate_cluster_error", cluster.estimate_cluster_error},
                     {"seed", cluster.seed},
                     {"som_learning_rate", cluster.som.learning_rate},
                     {"som_sigma", cluster.som.sigma}, {"som_sigma_decay", cluster.som.sigma_decay},
                     {"som_lr_decay", cluster.som.lr_decay},
                     {"som_neighborhood", cluster.som.neighborhood},
                     {"som_max_iter", cluster.som.max_iter}}},
        {"svr", {{"kernel", to_string(svr.kernel)}, {"C", svr.C}, {"epsilon", svr.epsilon},
                 {"gamma_scale", svr.gamma_scale}, {"tol", svr.tol}, {"cache_mb", svr.cache_mb}}},
        {"confidence", {{"distance_weight", confidence.distance_weight},
                        {"min_target_spread", confidence.min_target_spread}}},
        {"tune", {{"n_trials", tune.n_trials}, {"timeout_s", tune.timeout_s},
                  {"cv_folds", tune.cv_folds}, {"validation_ratio", tune.validation_ratio},
                  {"algorithms", algos}, {"kernels", kernels},
                  {"k_min", tune.k_min}, {"k_max", tune.k_max},
                  {"c_min", tune.c_min}, {"c_max", tune.c_max},
                  {"eps_min", tune.eps_min}, {"eps_max", tune.eps_max},
                  {"gamma_min", tune.gamma_min}, {"gamma_max", tune.gamma_max},
                  {"n_startup", tune.n_startup}, {"n_candidates", tune.n_candidates},
                  {"gamma_quantile", tune.gamma_quantile}, {"seed", tune.seed}}},
        {"train", {{"test_ratio", train.test_ratio}, {"seed", train.seed}}},
        {"storage", {{"images_dir", storage.images_dir}, {"models_dir", storage.models_dir},
                     {"predictions_dir", storage.predictions_dir},
                     {"backbone_path", storage.backbone_path}}},
        {"log", {{"level", log.level}, {"file", log.file}}},
    };
}

RefraxConfig RefraxConfig::from_file(const std::string& path)
{
    if (!file_exists(path)) throw InvalidRangeError("config file not found: " + path);
    json j = json::parse(read_text_file(path), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw InvalidRangeError("config file is not valid JSON: " + path);
    RefraxConfig cfg;
    cfg.apply_json(j);
    return cfg;
}

}  // namespace refrax
