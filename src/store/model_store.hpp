/* ──────────────────────────────────────────────────────────────
   model_store.hpp  –  versioned model directories under models_dir
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "store/model_artifact.hpp"

namespace refrax {

/*  <models_dir>/<model_id>/model.json, published by renaming a fully
    written model.json.tmp, so a reader sees either the whole artifact
    or no artifact.                                                   */
class ModelStore {
public:
    /* StorageUnavailableError unless models_dir exists and is writable */
    explicit ModelStore(std::string models_dir);

    /* model_YYYYmmdd_HHMMSS_mmm, "_2", "_3" … when taken */
    std::string save(const TrainedModel& model);

    TrainedModel             load(const std::string& model_id) const;
    ModelMeta                read_meta(const std::string& model_id) const;
    bool                     exists(const std::string& model_id) const;
    std::vector<std::string> list() const;        // sorted ids with a published model.json

    std::string model_path(const std::string& model_id) const;
    const std::string& dir() const { return dir_; }

    static constexpr const char* kModelFile = "model.json";

private:
    json read_document(const std::string& model_id) const;

    std::string dir_;
    std::mutex  save_mtx_;
};

}  // namespace refrax
