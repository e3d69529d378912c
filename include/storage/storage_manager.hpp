#ifndef ISOFETCH_STORAGE_MANAGER_HPP
#define ISOFETCH_STORAGE_MANAGER_HPP

#include <mutex>
#include <string>
#include <vector>
#include <optional>

#include "job_store.hpp"
#include "../common/config.hpp"

// Forward declarations for SQLite types
struct sqlite3;
struct sqlite3_stmt;

// SQLite-backed JobStore. One connection, serialized by an internal mutex.
class StorageManager : public JobStore {
public:
    explicit StorageManager(const std::string& db_path, DatabaseConfig config = DatabaseConfig());
    ~StorageManager() override;

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    bool open();
    void close();
    bool is_open() const;
    bool create_tables();

    bool create_job(const Job& job) override;
    std::optional<Job> get_job(const std::string& id) override;
    std::vector<Job> list_jobs() override;
    bool update_job(const Job& job) override;
    bool update_status(const std::string& id, JobStatus status,
                       const std::string& error_message) override;
    bool update_progress(const std::string& id, int progress, JobStatus status) override;
    bool update_size(const std::string& id, int64_t size_bytes) override;
    bool update_checksum(const std::string& id, const std::string& checksum) override;
    bool delete_job(const std::string& id) override;
    std::optional<std::string> find_existing(const std::string& name, const std::string& version,
                                             const std::string& arch, const std::string& edition,
                                             const std::string& file_type) override;
    size_t fail_interrupted(const std::string& error_message) override;

private:
    std::string db_path_;
    DatabaseConfig config_;
    sqlite3* db_;
    mutable std::mutex mutex_;

    // Helper for executing SQL statements
    bool execute_sql(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    // Steps a write statement, finalizes it and reports whether a row changed.
    bool run_write(sqlite3_stmt* stmt, const char* what, const std::string& id);
};

#endif // ISOFETCH_STORAGE_MANAGER_HPP
