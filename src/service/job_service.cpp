#include "service/job_service.hpp"
#include "files/file_utils.hpp"
#include "files/job_validator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <thread>

namespace {
const char* kInterruptedMessage = "interrupted by restart";
constexpr auto kSettlePoll = std::chrono::milliseconds(50);
} // namespace

JobService::JobService(JobStore& store, DownloadManager& manager, std::filesystem::path isos_dir)
    : store_(store), manager_(manager), isos_dir_(std::move(isos_dir)) {}

Job JobService::create(const CreateJobRequest& request) {
    std::string file_type;
    try {
        file_type = JobNaming::detect_file_type(request.download_url);
    } catch (const ValidationError& e) {
        throw ValidationError(std::string("invalid file type: ") + e.what());
    }

    Job job;
    job.id = JobNaming::generate_id();
    job.name = request.name;
    job.version = request.version;
    job.arch = request.arch;
    job.edition = request.edition;
    job.file_type = file_type;
    job.download_url = request.download_url;
    job.checksum_url = request.checksum_url;
    job.checksum_type = request.checksum_type;
    if (!job.checksum_url.empty() && job.checksum_type.empty()) {
        job.checksum_type = "sha256";
    }
    job.status = JobStatus::Pending;
    job.progress = 0;
    job.created_at = std::chrono::system_clock::now();

    JobValidator::validate(job);
    job.compute_fields();
    if (job.name.empty()) {
        throw ValidationError("name: name must contain at least one letter or digit");
    }

    if (auto existing = store_.find_existing(job.name, job.version, job.arch, job.edition,
                                             job.file_type)) {
        throw AlreadyExistsError("image already exists", *existing);
    }

    if (!store_.create_job(job)) {
        throw IsofetchError("failed to create job record");
    }
    LOG_INFO("Created job ", job.id, " for ", job.filename);

    if (!manager_.submit(job)) {
        LOG_WARN("Job ", job.id, " not queued, download manager is shutting down");
    }
    return job;
}

Job JobService::retry(const std::string& id) {
    auto job = store_.get_job(id);
    if (!job) {
        throw NotFoundError("job not found: " + id);
    }
    if (job->status != JobStatus::Failed) {
        throw InvalidStateError("only failed downloads can be retried", to_string(job->status));
    }

    job->status = JobStatus::Pending;
    job->progress = 0;
    job->error_message.clear();
    job->completed_at.reset();
    if (!store_.update_job(*job)) {
        throw IsofetchError("failed to update job " + id);
    }

    LOG_INFO("Retrying job ", id);
    if (!manager_.submit(*job)) {
        LOG_WARN("Job ", id, " not queued, download manager is shutting down");
    }
    return *job;
}

bool JobService::cancel(const std::string& id) {
    return manager_.cancel(id);
}

void JobService::remove(const std::string& id) {
    auto job = store_.get_job(id);
    if (!job) {
        throw NotFoundError("job not found: " + id);
    }

    if (manager_.drop(id)) {
        wait_until_settled(id);
    }

    const auto final_file = FileUtils::final_path(isos_dir_, *job);
    FileUtils::delete_if_exists(final_file);
    for (const auto& sidecar : FileUtils::sidecar_candidates(final_file)) {
        FileUtils::delete_if_exists(sidecar);
    }
    FileUtils::delete_if_exists(FileUtils::temp_path(isos_dir_, *job));

    if (!store_.delete_job(id)) {
        throw IsofetchError("failed to delete job record " + id);
    }
    LOG_INFO("Deleted job ", id, " (", job->filename, ")");
}

std::optional<Job> JobService::get(const std::string& id) {
    return store_.get_job(id);
}

std::vector<Job> JobService::list() {
    return store_.list_jobs();
}

size_t JobService::recover_interrupted() {
    size_t count = store_.fail_interrupted(kInterruptedMessage);
    if (count > 0) {
        LOG_WARN("Marked ", count, " interrupted downloads as failed");
    }
    return count;
}

void JobService::wait_until_settled(const std::string& id) {
    auto deadline = std::chrono::steady_clock::now() + settle_timeout_;
    while (std::chrono::steady_clock::now() < deadline) {
        auto job = store_.get_job(id);
        if (!job || is_terminal(job->status)) return;
        std::this_thread::sleep_for(kSettlePoll);
    }
    LOG_WARN("Job ", id, " did not stop within ", settle_timeout_.count(), "ms of cancellation");
}
