/* -----------------------------------------------------------
 *  main.cpp – driver for the refrax prism pipeline
 * ----------------------------------------------------------- */
#include "common.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "exit_codes.hpp"
#include "features/backbone.hpp"
#include "features/dataset.hpp"
#include "inference/predictor.hpp"
#include "simulation/importer.hpp"
#include "simulation/prism_simulator.hpp"
#include "storage.hpp"
#include "store/model_comparator.hpp"
#include "store/model_store.hpp"
#include "training/trainer.hpp"

using namespace refrax;

static void usage()
{
    std::cerr <<
        "usage: refrax <command> [--config=file.json] [--section.key=value ...] [options]\n"
        "  simulate       --lo=1.40 --hi=1.60 --step=0.01   write Rn_<n>.pgm templates\n"
        "  init-backbone  [--seed=N]                         write fresh backbone weights\n"
        "  train                                             fit on the template images\n"
        "  predict        [--model=<id>|latest] file...      one file, or a batch + CSV report\n"
        "  compare        [--export=ranking.csv] [id...]     rank stored models\n";
}

static std::string flag(const std::vector<std::string>& args, const std::string& key,
                        const std::string& def = "")
{
    const std::string pre = "--" + key + "=";
    for (const auto& a : args)
        if (a.rfind(pre, 0) == 0) return a.substr(pre.size());
    return def;
}

static std::vector<std::string> positional(const std::vector<std::string>& args)
{
    std::vector<std::string> out;
    for (std::size_t i = 1; i < args.size(); ++i)
        if (args[i].rfind("--", 0) != 0) out.push_back(args[i]);
    return out;
}

/* ---------- commands ------------------------------------------------ */
static int cmd_simulate(const RefraxConfig& cfg, const std::vector<std::string>& args)
{
    const double lo   = std::stod(flag(args, "lo", "1.40"));
    const double hi   = std::stod(flag(args, "hi", "1.60"));
    const double step = std::stod(flag(args, "step", "0.01"));

    PrismSimulator sim(cfg.sim, StorageLayout::from_opt(cfg.storage));
    sim.set_progress_sink(console_sink());
    const SimulationResult res = sim.generate(lo, hi, step);
    for (const auto& s : res.skipped)
        std::cout << "skipped n=" << format_fixed(s.refractive_index, 4) << " ("
                  << s.reason << " at " << format_fixed(s.incidence_deg, 2) << "°)\n";
    std::cout << res.curves.size() << " templates in " << cfg.storage.images_dir << '\n';
    return 0;
}

static int cmd_init_backbone(const RefraxConfig& cfg, const std::vector<std::string>& args)
{
    const auto seed = static_cast<std::uint32_t>(std::stoul(flag(args, "seed", "42")));
    write_backbone_weights(cfg.storage.backbone_path, BackboneSpec{}, seed);
    const BackboneHandle bb = load_backbone(cfg.storage.backbone_path);
    std::cout << "backbone " << bb->digest() << " (" << bb->feature_dim() << " features)\n";
    return 0;
}

static int cmd_train(const RefraxConfig& cfg)
{
    const BackboneHandle bb = load_backbone(cfg.storage.backbone_path);
    ModelStore store(cfg.storage.models_dir);
    FeatureExtractor fx(bb);

    const Dataset ds = load_template_dataset(cfg.storage.images_dir, fx, console_sink());
    Trainer trainer(cfg, bb->digest());
    trainer.attach_store(&store);
    trainer.set_progress_sink(console_sink());

    TrainingJob job(trainer);
    job.start(ds);
    const auto model = job.wait();

    std::cout << "model " << model->model_id << ": " << model->regressor.n_clusters() << " "
              << to_string(model->params.algo) << " clusters, validation MAE "
              << format_fixed(model->meta.validation_score, 6) << ", test MAE "
              << format_fixed(model->meta.test_metrics.mae, 6) << '\n';
    return 0;
}

static int cmd_predict(const RefraxConfig& cfg, const std::vector<std::string>& args)
{
    const auto files = positional(args);
    if (files.empty()) { usage(); return 2; }

    const BackboneHandle bb = load_backbone(cfg.storage.backbone_path);
    const ModelStore store(cfg.storage.models_dir);
    std::string id = flag(args, "model", "latest");
    if (id == "latest") {
        const auto ids = store.list();
        if (ids.empty()) throw NoModelLoadedError("no trained model in " + cfg.storage.models_dir);
        id = ids.back();
    }

    Predictor pred(bb, cfg.import, cfg.sim.apex_deg);
    pred.load(std::make_shared<const TrainedModel>(store.load(id)));

    if (files.size() == 1) {
        const RawParseResult raw = parse_raw_file(files[0], cfg.import.strict_lines);
        const PredictionResult r = pred.predict_one(raw.points);
        std::cout << "n = " << format_fixed(r.refractive_index, 5) << "  confidence "
                  << format_fixed(r.confidence, 3) << "  cluster " << r.cluster_id
                  << "  model " << r.model_id << '\n';
        return 0;
    }

    std::vector<BatchInput> inputs;
    for (const auto& f : files) inputs.push_back(BatchInput::file(f));
    const auto items = pred.predict_all(inputs, console_sink());
    for (const auto& it : items) {
        std::cout << '#' << it.index << ' ' << it.source << ": ";
        if (it.ok()) std::cout << format_fixed(it.result->refractive_index, 5) << " ("
                               << format_fixed(it.result->confidence, 3) << ")\n";
        else         std::cout << "FAILED " << it.error << '\n';
    }
    std::cout << "report " << write_batch_report(items, cfg.storage.predictions_dir) << '\n';
    return 0;
}

static int cmd_compare(const RefraxConfig& cfg, const std::vector<std::string>& args)
{
    const ModelStore store(cfg.storage.models_dir);
    ModelComparator cmp(store);
    const std::string cache = join_path(cfg.storage.models_dir, "comparison_cache.json");
    cmp.load_cache(cache);

    auto ids = positional(args);
    const auto ranking = ids.empty() ? cmp.compare_all() : cmp.compare(ids);
    for (const auto& r : ranking)
        std::cout << r.rank << ". " << r.model_id << "  score " << format_fixed(r.score, 6)
                  << "  " << timestamp_string(r.timestamp_ms, false) << '\n';
    cmp.save_cache(cache);

    const std::string out = flag(args, "export");
    if (!out.empty()) ModelComparator::export_csv(ranking, out);
    return 0;
}

/* ----------------------------------------------------------- */
int main(int argc, char* argv[])
{
    /* ========== 1. config: defaults → file → --section.key flags ===== */
    RefraxConfig cfg;
    std::vector<std::string> args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a.rfind("--config=", 0) == 0) cfg = RefraxConfig::from_file(a.substr(9));
        }
        for (auto& a : cfg.apply_cli(argc, argv))
            if (a.rfind("--config=", 0) != 0) args.push_back(a);
        cfg.validate();
        set_log_level(parse_log_level(cfg.log.level));
        set_log_file(cfg.log.file);
    } catch (const std::exception&) {
        return report_config_failure(std::current_exception());
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") { usage(); return args.empty() ? 2 : 0; }
    const std::string cmd = args[0];

    /* ========== 2. dispatch ========================================== */
    try {
        if      (cmd == "simulate")      return cmd_simulate(cfg, args);
        else if (cmd == "init-backbone") return cmd_init_backbone(cfg, args);
        else if (cmd == "train")         return cmd_train(cfg);
        else if (cmd == "predict")       return cmd_predict(cfg, args);
        else if (cmd == "compare")       return cmd_compare(cfg, args);
        usage();
        return 2;
    } catch (const std::exception&) {
        return report_command_failure(std::current_exception());
    }
}
