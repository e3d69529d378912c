#ifndef ISOFETCH_JOB_SERVICE_HPP
#define ISOFETCH_JOB_SERVICE_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../files/download_manager.hpp"
#include "../files/job.hpp"
#include "../storage/job_store.hpp"

struct CreateJobRequest {
    std::string name;
    std::string version;
    std::string arch;
    std::string edition;
    std::string download_url;
    std::string checksum_url;
    std::string checksum_type;  // defaults to sha256 when checksum_url is set
};

/**
 * Operations offered to callers (the CLI today). Owns the record lifecycle
 * outside a worker: creation, retry of failed jobs, deletion, and the
 * startup sweep for jobs a crash left mid-flight.
 */
class JobService {
public:
    JobService(JobStore& store, DownloadManager& manager, std::filesystem::path isos_dir);

    /**
     * @brief Records a new Pending job and queues it.
     * @throws ValidationError for malformed input or an unsupported file type.
     * @throws AlreadyExistsError if the same name/version/arch/edition/type exists.
     * @throws IsofetchError if the record cannot be stored.
     */
    Job create(const CreateJobRequest& request);

    /**
     * @brief Resets a Failed job to Pending and queues it again.
     * @throws NotFoundError, InvalidStateError
     */
    Job retry(const std::string& id);

    bool cancel(const std::string& id);

    /**
     * @brief Cancels the job if it is running, then deletes its files and record.
     * @throws NotFoundError
     */
    void remove(const std::string& id);

    std::optional<Job> get(const std::string& id);
    std::vector<Job> list();

    // Downloading/Verifying records left by a previous process become Failed.
    size_t recover_interrupted();

    // How long remove() waits for a cancelled worker to record its final state.
    void set_cancel_settle_timeout(std::chrono::milliseconds timeout) { settle_timeout_ = timeout; }

private:
    void wait_until_settled(const std::string& id);

    JobStore& store_;
    DownloadManager& manager_;
    std::filesystem::path isos_dir_;
    std::chrono::milliseconds settle_timeout_{5000};
};

#endif // ISOFETCH_JOB_SERVICE_HPP
