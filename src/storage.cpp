#include "storage.hpp"

#include "errors.hpp"

namespace refrax {

void require_writable(const std::string& dir, const std::string& role)
{
    if (dir.empty())
        throw StorageUnavailableError(role + " directory not configured");
    if (!is_directory(dir))
        throw StorageUnavailableError(role + " directory missing: " + dir);
    if (!is_writable_dir(dir))
        throw StorageUnavailableError(role + " directory not writable: " + dir);
}

}  // namespace refrax
