#include "features/dataset.hpp"

#include <algorithm>
#include <filesystem>

#include "errors.hpp"

namespace refrax {

namespace fs = std::filesystem;

Dataset Dataset::subset(const std::vector<int>& rows) const
{
    Dataset d;
    d.X.resize(Eigen::Index(rows.size()), X.cols());
    d.y.resize(Eigen::Index(rows.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        d.X.row(Eigen::Index(i)) = X.row(rows[i]);
        d.y(Eigen::Index(i))     = y(rows[i]);
        if (!sources.empty()) d.sources.push_back(sources[std::size_t(rows[i])]);
    }
    return d;
}

bool parse_template_name(const std::string& file_name, double& refractive_index)
{
    if (file_name.rfind("Rn_", 0) != 0 || !has_ext(file_name, ".pgm")) return false;
    const std::string num = strip_ext(file_name).substr(3);
    if (num.empty()) return false;
    try {
        std::size_t used = 0;
        refractive_index = std::stod(num, &used);
        return used == num.size() && refractive_index > 1.0;
    } catch (const std::logic_error&) {
        return false;
    }
}

Dataset load_template_dataset(const std::string& images_dir, const FeatureExtractor& fx,
                              const ProgressSink& sink)
{
    if (!is_directory(images_dir))
        throw StorageUnavailableError("images directory missing: " + images_dir);

    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(images_dir, ec))
        if (e.is_regular_file()) names.push_back(e.path().filename().string());
    if (ec) throw StorageUnavailableError("cannot list " + images_dir + ": " + ec.message());
    std::sort(names.begin(), names.end());

    const int N = int(names.size());
    std::vector<FeatureVector> feats(names.size());
    std::vector<double>        target(names.size(), 0.0);
    std::vector<std::string>   failure(names.size());

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < N; ++i) {
        const std::string& nm = names[std::size_t(i)];
        double n = 0.0;
        if (!parse_template_name(nm, n)) {
            failure[std::size_t(i)] = "name is not Rn_<index>.pgm";
            continue;
        }
        try {
            feats[std::size_t(i)]  = fx.extract(read_pgm(join_path(images_dir, nm)));
            target[std::size_t(i)] = n;
        } catch (const RefraxError& e) {
            failure[std::size_t(i)] = e.what();
        }
    }

    Dataset ds;
    std::vector<std::size_t> ok;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (failure[i].empty()) ok.push_back(i);
        else logW("template " + names[i] + " skipped: " + failure[i]);
        emit_progress(sink, "load", i + 1, names.size(), names[i]);
    }
    if (ok.size() < kMinTemplateSamples)
        throw InsufficientValidSamplesError("only " + std::to_string(ok.size()) +
                                            " usable templates in " + images_dir + ", need " +
                                            std::to_string(kMinTemplateSamples));

    ds.X.resize(Eigen::Index(ok.size()), fx.feature_dim());
    ds.y.resize(Eigen::Index(ok.size()));
    for (std::size_t r = 0; r < ok.size(); ++r) {
        ds.X.row(Eigen::Index(r)) = feats[ok[r]].transpose();
        ds.y(Eigen::Index(r))     = target[ok[r]];
        ds.sources.push_back(names[ok[r]]);
    }
    logI("loaded " + std::to_string(ok.size()) + " templates from " + images_dir);
    return ds;
}

Dataset dataset_from_curves(const std::vector<SimulatedCurve>& curves, const FeatureExtractor& fx)
{
    Dataset ds;
    ds.X.resize(Eigen::Index(curves.size()), fx.feature_dim());
    ds.y.resize(Eigen::Index(curves.size()));
    const int N = int(curves.size());
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < N; ++i)
        ds.X.row(i) = fx.extract(render(curves[std::size_t(i)].curve)).transpose();
    for (std::size_t i = 0; i < curves.size(); ++i) {
        ds.y(Eigen::Index(i)) = curves[i].refractive_index;
        ds.sources.push_back("sim:" + format_fixed(curves[i].refractive_index, 3));
    }
    return ds;
}

}  // namespace refrax
