#ifndef ISOFETCH_DOWNLOAD_MANAGER_HPP
#define ISOFETCH_DOWNLOAD_MANAGER_HPP

#include "job.hpp"
#include "progress_sink.hpp"
#include "../common/bounded_queue.hpp"
#include "../common/cancellation.hpp"
#include "../common/config.hpp"
#include "../network/http_client.hpp"
#include "../storage/job_store.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * Dispatcher: a bounded job queue drained by a fixed pool of worker threads.
 *
 * Each running job owns a CancellationSource derived from the manager's root
 * source. The registry of those sources is what cancel() and is_active()
 * consult; shutdown() cancels the root and so every running job at once.
 */
class DownloadManager {
public:
    DownloadManager(JobStore& store, std::shared_ptr<HttpTransport> transport, Config config);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Both must be called before start(); workers capture the sink when they launch.
    void set_progress_callback(ProgressCallback callback);
    void set_progress_sink(std::shared_ptr<ProgressSink> sink);

    // Launches download.worker_count threads. Later calls do nothing.
    void start();

    /**
     * @brief Queues a job, waiting while the queue is full.
     * @return false once shutdown() has been called.
     * @throws ValidationError if the job is malformed; it is never queued.
     */
    bool submit(const Job& job);

    // Like submit() but returns false instead of waiting when the queue is full.
    bool try_submit(const Job& job);

    // Cancels running jobs, drops queued ones and joins the pool. Idempotent.
    void shutdown();

    // Cancels a running job. False if it is not running, was already cancelled,
    // or is already publishing its file.
    bool cancel(const std::string& job_id);
    /**
     * @brief Retires a job id for good, as when its record is deleted.
     *
     * Cancels the job if it is running and makes workers skip any copy still
     * in the queue. Returns true if the job was running; the caller should
     * then wait for the worker to record its final state.
     */
    bool drop(const std::string& job_id);

    bool is_active(const std::string& job_id) const;

    size_t active_count() const;
    size_t queued_count() const { return queue_.size(); }
    bool is_shut_down() const { return shut_down_.load(); }

private:
    void worker_loop(size_t index);

    // Returns nullptr if the id already has a live handle or was dropped.
    std::shared_ptr<CancellationSource> register_job(const std::string& job_id);
    // Removes the entry only if it still holds `handle`.
    void unregister_job(const std::string& job_id, const std::shared_ptr<CancellationSource>& handle);

    JobStore& store_;
    std::shared_ptr<HttpTransport> transport_;
    Config config_;
    std::shared_ptr<ProgressSink> sink_;

    BoundedQueue<Job> queue_;
    CancellationSource root_;

    std::vector<std::thread> workers_;
    std::once_flag start_once_;
    std::once_flag shutdown_once_;
    std::atomic<bool> shut_down_{false};

    std::mutex running_mutex_;
    std::condition_variable running_cv_;
    size_t running_workers_ = 0;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CancellationSource>> active_;
    std::unordered_set<std::string> dropped_;
};

#endif // ISOFETCH_DOWNLOAD_MANAGER_HPP
