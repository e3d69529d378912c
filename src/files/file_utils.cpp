#include "files/file_utils.hpp"
#include "crypto/hasher.hpp"
#include "common/logger.hpp"

namespace FileUtils {

void ensure_directory(const fs::path& dir) {
    if (dir.empty()) return;
    fs::create_directories(dir);
}

bool delete_if_exists(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Failed to remove ", path.string(), ": ", ec.message());
        return false;
    }
    return true;
}

fs::path temp_path(const fs::path& isos_dir, const Job& job) {
    return isos_dir / ".tmp" / (job.id + "_" + job.filename);
}

fs::path final_path(const fs::path& isos_dir, const Job& job) {
    return isos_dir / fs::path(job.file_path);
}

fs::path sidecar_path(const fs::path& final, const std::string& checksum_type) {
    fs::path out = final;
    out += "." + checksum_type;
    return out;
}

std::vector<fs::path> sidecar_candidates(const fs::path& final) {
    std::vector<fs::path> out;
    for (const auto& algo : Hasher::supported_algorithms()) {
        out.push_back(sidecar_path(final, algo));
    }
    return out;
}

} // namespace FileUtils
