#include "storage/storage_manager.hpp"
#include "common/logger.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>

namespace {

const char* kJobColumns =
    "id, name, version, arch, edition, file_type, filename, file_path, download_link, "
    "size_bytes, checksum, checksum_type, download_url, checksum_url, status, progress, "
    "error_message, created_at, completed_at";

int64_t to_millis(const Timestamp& t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp from_millis(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Binds every column after id, starting at parameter `first`. Returns the next free index.
int bind_job_fields(sqlite3_stmt* stmt, int first, const Job& job) {
    int i = first;
    bind_text(stmt, i++, job.name);
    bind_text(stmt, i++, job.version);
    bind_text(stmt, i++, job.arch);
    bind_text(stmt, i++, job.edition);
    bind_text(stmt, i++, job.file_type);
    bind_text(stmt, i++, job.filename);
    bind_text(stmt, i++, job.file_path);
    bind_text(stmt, i++, job.download_link);
    sqlite3_bind_int64(stmt, i++, job.size_bytes);
    bind_text(stmt, i++, job.checksum);
    bind_text(stmt, i++, job.checksum_type);
    bind_text(stmt, i++, job.download_url);
    bind_text(stmt, i++, job.checksum_url);
    bind_text(stmt, i++, to_string(job.status));
    sqlite3_bind_int(stmt, i++, job.progress);
    bind_text(stmt, i++, job.error_message);
    sqlite3_bind_int64(stmt, i++, to_millis(job.created_at));
    if (job.completed_at) {
        sqlite3_bind_int64(stmt, i++, to_millis(*job.completed_at));
    } else {
        sqlite3_bind_null(stmt, i++);
    }
    return i;
}

Job read_job(sqlite3_stmt* stmt) {
    Job job;
    job.id = column_text(stmt, 0);
    job.name = column_text(stmt, 1);
    job.version = column_text(stmt, 2);
    job.arch = column_text(stmt, 3);
    job.edition = column_text(stmt, 4);
    job.file_type = column_text(stmt, 5);
    job.filename = column_text(stmt, 6);
    job.file_path = column_text(stmt, 7);
    job.download_link = column_text(stmt, 8);
    job.size_bytes = sqlite3_column_int64(stmt, 9);
    job.checksum = column_text(stmt, 10);
    job.checksum_type = column_text(stmt, 11);
    job.download_url = column_text(stmt, 12);
    job.checksum_url = column_text(stmt, 13);

    std::string status = column_text(stmt, 14);
    auto parsed = parse_job_status(status);
    if (!parsed) {
        LOG_WARN("Job ", job.id, " has unknown status '", status, "', treating as failed");
    }
    job.status = parsed.value_or(JobStatus::Failed);

    job.progress = sqlite3_column_int(stmt, 15);
    job.error_message = column_text(stmt, 16);
    job.created_at = from_millis(sqlite3_column_int64(stmt, 17));
    if (sqlite3_column_type(stmt, 18) != SQLITE_NULL) {
        job.completed_at = from_millis(sqlite3_column_int64(stmt, 18));
    }
    return job;
}

} // namespace

StorageManager::StorageManager(const std::string& db_path, DatabaseConfig config)
    : db_path_(db_path), config_(std::move(config)), db_(nullptr) {
    // Open the database immediately
    if (!open()) {
        LOG_ERR("Failed to open database: ", db_path_);
        return;
    }
    if (!create_tables()) {
        LOG_ERR("Failed to create tables in database: ", db_path_);
    }
}

StorageManager::~StorageManager() {
    close();
}

bool StorageManager::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    std::filesystem::path parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERR("Can't create database directory ", parent.string(), ": ", ec.message());
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERR("Can't open database: ", db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));
    if (!config_.journal_mode.empty()) {
        execute_sql("PRAGMA journal_mode=" + config_.journal_mode + ";");
    }
    execute_sql("PRAGMA foreign_keys=ON;");

    LOG_INFO("Opened database successfully: ", db_path_);
    return true;
}

void StorageManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database ", db_path_);
    }
}

bool StorageManager::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool StorageManager::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERR("SQL error: ", err_msg ? err_msg : sqlite3_errmsg(db_));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

sqlite3_stmt* StorageManager::prepare(const std::string& sql) {
    if (!db_) {
        LOG_ERR("Database is not open: ", db_path_);
        return nullptr;
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return nullptr;
    }
    return stmt;
}

bool StorageManager::run_write(sqlite3_stmt* stmt, const char* what, const std::string& id) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to ", what, " for job ", id, ": ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    if (sqlite3_changes(db_) == 0) {
        LOG_WARN("Failed to ", what, ": job ", id, " not found");
        return false;
    }
    return true;
}

bool StorageManager::create_tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    std::string create_jobs_sql = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            id TEXT PRIMARY KEY NOT NULL,
            name TEXT NOT NULL,
            version TEXT NOT NULL,
            arch TEXT NOT NULL,
            edition TEXT NOT NULL DEFAULT '',
            file_type TEXT NOT NULL,
            filename TEXT NOT NULL,
            file_path TEXT NOT NULL,
            download_link TEXT NOT NULL,
            size_bytes INTEGER NOT NULL DEFAULT 0,
            checksum TEXT NOT NULL DEFAULT '',
            checksum_type TEXT NOT NULL DEFAULT '',
            download_url TEXT NOT NULL,
            checksum_url TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL,
            progress INTEGER NOT NULL DEFAULT 0,
            error_message TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            completed_at INTEGER
        );
    )";

    std::string create_identity_index_sql = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_jobs_identity
            ON jobs (name, version, arch, edition, file_type);
    )";

    std::string create_status_index_sql =
        "CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs (status);";

    bool success = execute_sql(create_jobs_sql);
    success &= execute_sql(create_identity_index_sql);
    success &= execute_sql(create_status_index_sql);
    return success;
}

bool StorageManager::create_job(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(std::string("INSERT INTO jobs (") + kJobColumns +
                                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) return false;

    bind_text(stmt, 1, job.id);
    bind_job_fields(stmt, 2, job);
    return run_write(stmt, "insert record", job.id);
}

std::optional<Job> StorageManager::get_job(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?;");
    if (!stmt) return std::nullopt;

    bind_text(stmt, 1, id);
    std::optional<Job> job;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        job = read_job(stmt);
    } else if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return job;
}

std::vector<Job> StorageManager::list_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs;
    sqlite3_stmt* stmt = prepare(std::string("SELECT ") + kJobColumns +
                                 " FROM jobs ORDER BY created_at DESC, rowid DESC;");
    if (!stmt) return jobs;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        jobs.push_back(read_job(stmt));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return jobs;
}

bool StorageManager::update_job(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(R"(
        UPDATE jobs SET name = ?, version = ?, arch = ?, edition = ?, file_type = ?,
            filename = ?, file_path = ?, download_link = ?, size_bytes = ?, checksum = ?,
            checksum_type = ?, download_url = ?, checksum_url = ?, status = ?, progress = ?,
            error_message = ?, created_at = ?, completed_at = ?
        WHERE id = ?;
    )");
    if (!stmt) return false;

    int next = bind_job_fields(stmt, 1, job);
    bind_text(stmt, next, job.id);
    return run_write(stmt, "update record", job.id);
}

bool StorageManager::update_status(const std::string& id, JobStatus status,
                                   const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("UPDATE jobs SET status = ?, error_message = ? WHERE id = ?;");
    if (!stmt) return false;

    bind_text(stmt, 1, to_string(status));
    bind_text(stmt, 2, error_message);
    bind_text(stmt, 3, id);
    return run_write(stmt, "update status", id);
}

bool StorageManager::update_progress(const std::string& id, int progress, JobStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("UPDATE jobs SET progress = ?, status = ? WHERE id = ?;");
    if (!stmt) return false;

    sqlite3_bind_int(stmt, 1, progress);
    bind_text(stmt, 2, to_string(status));
    bind_text(stmt, 3, id);
    return run_write(stmt, "update progress", id);
}

bool StorageManager::update_size(const std::string& id, int64_t size_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("UPDATE jobs SET size_bytes = ? WHERE id = ?;");
    if (!stmt) return false;

    sqlite3_bind_int64(stmt, 1, size_bytes);
    bind_text(stmt, 2, id);
    return run_write(stmt, "update size", id);
}

bool StorageManager::update_checksum(const std::string& id, const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("UPDATE jobs SET checksum = ? WHERE id = ?;");
    if (!stmt) return false;

    bind_text(stmt, 1, checksum);
    bind_text(stmt, 2, id);
    return run_write(stmt, "update checksum", id);
}

bool StorageManager::delete_job(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("DELETE FROM jobs WHERE id = ?;");
    if (!stmt) return false;

    bind_text(stmt, 1, id);
    return run_write(stmt, "delete record", id);
}

std::optional<std::string> StorageManager::find_existing(const std::string& name,
                                                         const std::string& version,
                                                         const std::string& arch,
                                                         const std::string& edition,
                                                         const std::string& file_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(R"(
        SELECT id FROM jobs
        WHERE name = ? AND version = ? AND arch = ? AND edition = ? AND file_type = ?
        LIMIT 1;
    )");
    if (!stmt) return std::nullopt;

    bind_text(stmt, 1, name);
    bind_text(stmt, 2, version);
    bind_text(stmt, 3, arch);
    bind_text(stmt, 4, edition);
    bind_text(stmt, 5, file_type);

    std::optional<std::string> id;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        id = column_text(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return id;
}

size_t StorageManager::fail_interrupted(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(R"(
        UPDATE jobs SET status = 'failed', error_message = ?
        WHERE status IN ('downloading', 'verifying');
    )");
    if (!stmt) return 0;

    bind_text(stmt, 1, error_message);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to mark interrupted jobs: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return 0;
    }
    sqlite3_finalize(stmt);
    return static_cast<size_t>(sqlite3_changes(db_));
}
