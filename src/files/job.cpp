#include "files/job.hpp"
#include "common/errors.hpp"
#include "crypto/hasher.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Downloading: return "downloading";
        case JobStatus::Verifying: return "verifying";
        case JobStatus::Complete: return "complete";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<JobStatus> parse_job_status(const std::string& name) {
    if (name == "pending") return JobStatus::Pending;
    if (name == "downloading") return JobStatus::Downloading;
    if (name == "verifying") return JobStatus::Verifying;
    if (name == "complete") return JobStatus::Complete;
    if (name == "failed") return JobStatus::Failed;
    return std::nullopt;
}

bool is_cancellable(JobStatus status) {
    return status == JobStatus::Downloading || status == JobStatus::Verifying;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Complete || status == JobStatus::Failed;
}

bool is_valid_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Downloading || to == JobStatus::Failed;
        case JobStatus::Downloading:
            return to == JobStatus::Downloading || to == JobStatus::Verifying ||
                   to == JobStatus::Complete || to == JobStatus::Failed;
        case JobStatus::Verifying:
            return to == JobStatus::Complete || to == JobStatus::Failed;
        case JobStatus::Complete:
            return false;
        case JobStatus::Failed:
            return to == JobStatus::Pending;
    }
    return false;
}

std::string Job::original_filename() const {
    return JobNaming::extract_filename_from_url(download_url);
}

void Job::compute_fields() {
    name = JobNaming::normalize_name(name);
    filename = JobNaming::generate_filename(name, version, edition, arch, file_type);
    file_path = JobNaming::generate_file_path(name, version, arch, filename);
    download_link = JobNaming::generate_download_link(file_path);
}

namespace JobNaming {

const std::vector<std::string>& supported_file_types() {
    static const std::vector<std::string> types = {
        "iso", "qcow2", "vmdk", "vdi", "img", "raw", "vhd", "vhdx"
    };
    return types;
}

bool is_supported_file_type(const std::string& type) {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto& types = supported_file_types();
    return std::find(types.begin(), types.end(), lower) != types.end();
}

std::string normalize_name(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        char lower = static_cast<char>(std::tolower(c));
        if (lower == ' ' || lower == '.' || lower == '/') lower = '-';
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') || lower == '-') {
            if (lower == '-' && !out.empty() && out.back() == '-') continue;
            out.push_back(lower);
        }
    }
    size_t begin = out.find_first_not_of('-');
    if (begin == std::string::npos) return "";
    size_t end = out.find_last_not_of('-');
    return out.substr(begin, end - begin + 1);
}

std::string detect_file_type(const std::string& url) {
    std::string name = extract_filename_from_url(url);
    size_t cut = name.find_first_of("?#");
    if (cut != std::string::npos) name.erase(cut);

    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        throw ValidationError("could not detect file type from URL");
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!is_supported_file_type(ext)) {
        std::ostringstream supported;
        for (size_t i = 0; i < supported_file_types().size(); ++i) {
            if (i) supported << " ";
            supported << supported_file_types()[i];
        }
        throw ValidationError("unsupported file type: " + ext + " (supported: " + supported.str() + ")");
    }
    return ext;
}

std::string generate_filename(const std::string& name, const std::string& version,
                              const std::string& edition, const std::string& arch,
                              const std::string& file_type) {
    std::string filename = name + "-" + version;
    if (!edition.empty()) {
        filename += "-" + edition;
    }
    filename += "-" + arch;
    return filename + "." + file_type;
}

std::string generate_file_path(const std::string& name, const std::string& version,
                               const std::string& arch, const std::string& filename) {
    return name + "/" + version + "/" + arch + "/" + filename;
}

std::string generate_download_link(const std::string& file_path) {
    std::string normalized = file_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    return "/images/" + normalized;
}

std::string extract_filename_from_url(const std::string& url) {
    size_t slash = url.rfind('/');
    if (slash == std::string::npos) return url;
    return url.substr(slash + 1);
}

std::string generate_id() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    std::string hex = Hasher::to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace JobNaming
