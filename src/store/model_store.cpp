#include "store/model_store.hpp"

#include <sys/stat.h>   // ::mkdir
#include <algorithm>
#include <cerrno>
#include <filesystem>

#include "errors.hpp"
#include "storage.hpp"

namespace refrax {

namespace fs = std::filesystem;

namespace {

void check_id(const std::string& id)
{
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..")
        throw InvalidRangeError("invalid model id '" + id + "'");
}

}  // namespace

ModelStore::ModelStore(std::string models_dir) : dir_(std::move(models_dir))
{
    require_writable(dir_, "models");
}

std::string ModelStore::model_path(const std::string& model_id) const
{
    check_id(model_id);
    return join_path(join_path(dir_, model_id), kModelFile);
}

std::string ModelStore::save(const TrainedModel& model)
{
    std::lock_guard<std::mutex> lk(save_mtx_);
    const std::string base = "model_" + timestamp_string(now_ms(), true);

    /* claim a fresh directory; mkdir is the atomic test-and-set */
    std::string id;
    for (int n = 1;; ++n) {
        id = n == 1 ? base : base + "_" + std::to_string(n);
        const std::string d = join_path(dir_, id);
        if (::mkdir(d.c_str(), 0755) == 0) break;
        if (errno != EEXIST) throw StorageUnavailableError("cannot create " + d);
        if (n > 1000) throw StorageUnavailableError("no free model id under " + base);
    }

    json j = model.to_json();
    j["model_id"] = id;
    write_file_atomic(model_path(id), j.dump());
    logI("saved model " + id + " to " + join_path(dir_, id));
    return id;
}

bool ModelStore::exists(const std::string& model_id) const
{
    return file_exists(model_path(model_id));
}

std::vector<std::string> ModelStore::list() const
{
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(dir_, ec)) {
        if (!e.is_directory()) continue;
        const std::string id = e.path().filename().string();
        if (file_exists(join_path(e.path().string(), kModelFile))) ids.push_back(id);
    }
    if (ec) throw StorageUnavailableError("cannot list " + dir_ + ": " + ec.message());
    std::sort(ids.begin(), ids.end());
    return ids;
}

json ModelStore::read_document(const std::string& model_id) const
{
    const std::string path = model_path(model_id);
    if (!file_exists(path)) throw ModelFormatError("no published model " + model_id);
    std::string text;
    try {
        text = read_text_file(path);
    } catch (const std::runtime_error& e) {
        throw ModelFormatError(e.what());
    }
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw ModelFormatError("model " + model_id + " is not valid JSON");
    return j;
}

TrainedModel ModelStore::load(const std::string& model_id) const
{
    TrainedModel m = TrainedModel::from_json(read_document(model_id));
    m.model_id = model_id;
    return m;
}

ModelMeta ModelStore::read_meta(const std::string& model_id) const
{
    const json j = read_document(model_id);
    try {
        const int v = j.at("format_version").get<int>();
        if (v != kModelFormatVersion)
            throw ModelFormatError("model " + model_id + " has format_version " + std::to_string(v));
        return j.at("meta").get<ModelMeta>();
    } catch (const json::exception& e) {
        throw ModelFormatError("model " + model_id + " metadata: " + e.what());
    }
}

}  // namespace refrax
