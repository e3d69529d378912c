#ifndef ISOFETCH_JOB_HPP
#define ISOFETCH_JOB_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus {
    Pending,
    Downloading,
    Verifying,
    Complete,
    Failed
};

std::string to_string(JobStatus status);

// Accepts the lowercase names produced by to_string.
std::optional<JobStatus> parse_job_status(const std::string& name);

// Downloading and Verifying are the only states a cancel can interrupt.
bool is_cancellable(JobStatus status);
bool is_terminal(JobStatus status);

/**
 * @brief Whether the worker state machine allows `from -> to`.
 *
 * Pending -> Downloading -> (Verifying) -> Complete | Failed. Failed -> Pending
 * is reserved for an explicit retry. Nothing leaves Complete.
 */
bool is_valid_transition(JobStatus from, JobStatus to);

using Timestamp = std::chrono::system_clock::time_point;

// One disk image download, as persisted in the job store.
struct Job {
    std::string id;
    std::string name;           // normalized, e.g. "ubuntu-server"
    std::string version;
    std::string arch;
    std::string edition;        // optional
    std::string file_type;      // "iso", "qcow2", ...

    // Storage key, derived by compute_fields()
    std::string filename;       // "alpine-3.19.1-x86_64.iso"
    std::string file_path;      // "alpine/3.19.1/x86_64/alpine-3.19.1-x86_64.iso"
    std::string download_link;  // "/images/alpine/3.19.1/x86_64/alpine-3.19.1-x86_64.iso"

    int64_t size_bytes = 0;
    std::string checksum;       // verified digest, set on success
    std::string checksum_type;  // "sha256", "sha512", "md5" or empty
    std::string download_url;
    std::string checksum_url;   // optional

    JobStatus status = JobStatus::Pending;
    int progress = 0;
    std::string error_message;
    Timestamp created_at{};
    std::optional<Timestamp> completed_at;

    // Name the remote side uses for the file; checksum listings refer to this.
    std::string original_filename() const;

    void compute_fields();
};

namespace JobNaming {

const std::vector<std::string>& supported_file_types();
bool is_supported_file_type(const std::string& type);

// "Ubuntu Server 24.04" -> "ubuntu-server-24-04"
std::string normalize_name(const std::string& name);

/**
 * @brief Lowercased extension of the URL's last path segment.
 * @throws ValidationError if there is none or it is not a supported image type.
 */
std::string detect_file_type(const std::string& url);

std::string generate_filename(const std::string& name, const std::string& version,
                              const std::string& edition, const std::string& arch,
                              const std::string& file_type);
std::string generate_file_path(const std::string& name, const std::string& version,
                               const std::string& arch, const std::string& filename);
std::string generate_download_link(const std::string& file_path);
std::string extract_filename_from_url(const std::string& url);

// Random RFC 4122 version 4 identifier.
std::string generate_id();

} // namespace JobNaming

#endif // ISOFETCH_JOB_HPP
