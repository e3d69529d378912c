#ifndef ISOFETCH_JOB_STORE_HPP
#define ISOFETCH_JOB_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../files/job.hpp"

/**
 * Persistent record store for jobs.
 *
 * Write methods return false on failure and log the cause; they never throw.
 * Implementations must be safe to call from several worker threads at once.
 */
class JobStore {
public:
    virtual ~JobStore() = default;

    virtual bool create_job(const Job& job) = 0;
    virtual std::optional<Job> get_job(const std::string& id) = 0;
    // Newest first.
    virtual std::vector<Job> list_jobs() = 0;

    // Overwrites every mutable column of an existing record.
    virtual bool update_job(const Job& job) = 0;
    virtual bool update_status(const std::string& id, JobStatus status,
                               const std::string& error_message) = 0;
    virtual bool update_progress(const std::string& id, int progress, JobStatus status) = 0;
    virtual bool update_size(const std::string& id, int64_t size_bytes) = 0;
    virtual bool update_checksum(const std::string& id, const std::string& checksum) = 0;
    virtual bool delete_job(const std::string& id) = 0;

    // Id of a record with the same storage identity, if one exists.
    virtual std::optional<std::string> find_existing(const std::string& name,
                                                     const std::string& version,
                                                     const std::string& arch,
                                                     const std::string& edition,
                                                     const std::string& file_type) = 0;

    // Marks every Downloading/Verifying record Failed. Returns how many changed.
    virtual size_t fail_interrupted(const std::string& error_message) = 0;
};

#endif // ISOFETCH_JOB_STORE_HPP
