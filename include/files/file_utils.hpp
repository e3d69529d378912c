#ifndef ISOFETCH_FILE_UTILS_HPP
#define ISOFETCH_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "job.hpp"

namespace fs = std::filesystem;

namespace FileUtils {

// Creates `dir` and any missing parents. Throws std::filesystem::filesystem_error.
void ensure_directory(const fs::path& dir);

// Removes a regular file if present. Returns false only when removal failed.
bool delete_if_exists(const fs::path& path);

// Scratch location for an in-flight download: <isos>/.tmp/<id>_<filename>
fs::path temp_path(const fs::path& isos_dir, const Job& job);

// Public location: <isos>/<file_path>
fs::path final_path(const fs::path& isos_dir, const Job& job);

// <final>.<checksum_type>
fs::path sidecar_path(const fs::path& final, const std::string& checksum_type);

// Every sidecar name that remove() should clean up next to `final`.
std::vector<fs::path> sidecar_candidates(const fs::path& final);

} // namespace FileUtils

#endif // ISOFETCH_FILE_UTILS_HPP
