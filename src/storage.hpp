/* ──────────────────────────────────────────────────────────────
   storage.hpp   –  root directories handed in by the bootstrap layer
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <string>

#include "config.hpp"

namespace refrax {

struct StorageLayout {
    std::string images_dir;
    std::string models_dir;
    std::string predictions_dir;

    static StorageLayout from_opt(const StorageOpt& o)
    {
        return {o.images_dir, o.models_dir, o.predictions_dir};
    }
};

/* throws StorageUnavailableError if dir is missing or not writable */
void require_writable(const std::string& dir, const std::string& role);

}  // namespace refrax
