#include "files/download_manager.hpp"
#include "files/download_worker.hpp"
#include "files/job_validator.hpp"
#include "common/logger.hpp"
#include <algorithm>

DownloadManager::DownloadManager(JobStore& store, std::shared_ptr<HttpTransport> transport,
                                 Config config)
    : store_(store),
      transport_(std::move(transport)),
      config_(std::move(config)),
      queue_(config_.download.queue_buffer) {
    LOG_DEBUG("DownloadManager created: ", config_.download.worker_count, " workers, queue of ",
              queue_.capacity());
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::set_progress_callback(ProgressCallback callback) {
    sink_ = std::make_shared<CallbackProgressSink>(std::move(callback));
}

void DownloadManager::set_progress_sink(std::shared_ptr<ProgressSink> sink) {
    sink_ = std::move(sink);
}

void DownloadManager::start() {
    std::call_once(start_once_, [this] {
        if (shut_down_) {
            LOG_WARN("DownloadManager::start called after shutdown, ignoring");
            return;
        }
        size_t count = std::max<size_t>(config_.download.worker_count, 1);
        {
            std::lock_guard<std::mutex> lock(running_mutex_);
            running_workers_ = count;
        }
        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
        LOG_INFO("Download manager started with ", count, " workers");
    });
}

bool DownloadManager::submit(const Job& job) {
    JobValidator::validate(job);
    if (shut_down_) return false;
    if (!queue_.push(job)) return false;
    LOG_DEBUG("Queued job ", job.id, " (", queue_.size(), " waiting)");
    return true;
}

bool DownloadManager::try_submit(const Job& job) {
    JobValidator::validate(job);
    if (shut_down_) return false;
    return queue_.try_push(job);
}

void DownloadManager::shutdown() {
    std::call_once(shutdown_once_, [this] {
        shut_down_ = true;
        LOG_INFO("Shutting down download manager...");

        root_.cancel(CancelReason::kShutdown);
        size_t dropped = queue_.close();
        if (dropped > 0) {
            LOG_WARN("Dropped ", dropped, " queued downloads, they remain pending");
        }

        {
            std::unique_lock<std::mutex> lock(running_mutex_);
            bool drained = running_cv_.wait_for(lock, config_.download.shutdown_grace,
                                                [this] { return running_workers_ == 0; });
            if (!drained) {
                LOG_WARN("Workers still busy after ", config_.download.shutdown_grace.count(),
                         "ms, waiting for them to stop");
            }
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        LOG_INFO("Download manager stopped");
    });
}

bool DownloadManager::cancel(const std::string& job_id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = active_.find(job_id);
    if (it == active_.end()) {
        return false;
    }
    if (!it->second->cancel(CancelReason::kCancelled)) {
        LOG_INFO("Download ", job_id, " is already being published, not cancelled");
        return false;
    }
    active_.erase(it);
    LOG_INFO("Cancelled download ", job_id);
    return true;
}

bool DownloadManager::drop(const std::string& job_id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    dropped_.insert(job_id);
    auto it = active_.find(job_id);
    if (it == active_.end()) {
        return false;
    }
    // A committed job keeps its entry until the worker unregisters it.
    if (it->second->cancel(CancelReason::kCancelled)) {
        active_.erase(it);
    }
    LOG_INFO("Dropped running download ", job_id);
    return true;
}

bool DownloadManager::is_active(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return active_.find(job_id) != active_.end();
}

size_t DownloadManager::active_count() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return active_.size();
}

std::shared_ptr<CancellationSource> DownloadManager::register_job(const std::string& job_id) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    if (dropped_.count(job_id) > 0) {
        LOG_WARN("Job ", job_id, " was deleted, skipping queued submission");
        return nullptr;
    }
    if (active_.count(job_id) > 0) {
        LOG_WARN("Job ", job_id, " is already running, skipping duplicate submission");
        return nullptr;
    }
    auto handle = std::make_shared<CancellationSource>(root_.token());
    active_.emplace(job_id, handle);
    return handle;
}

void DownloadManager::unregister_job(const std::string& job_id,
                                     const std::shared_ptr<CancellationSource>& handle) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = active_.find(job_id);
    if (it != active_.end() && it->second == handle) {
        active_.erase(it);
    }
}

void DownloadManager::worker_loop(size_t index) {
    DownloadWorker worker(store_, *transport_, config_.isos_dir(), config_.download, config_.http,
                          sink_);
    LOG_DEBUG("Worker ", index, " started");

    while (auto job = queue_.pop()) {
        if (root_.is_cancelled()) break;

        auto handle = register_job(job->id);
        if (!handle) continue;

        // The queued copy may be stale: the record can have been deleted or
        // already run by an earlier copy.
        auto current = store_.get_job(job->id);
        if (!current || current->status != JobStatus::Pending) {
            LOG_WARN("Job ", job->id, " is ", current ? to_string(current->status) : "gone",
                     ", skipping queued submission");
            unregister_job(job->id, handle);
            continue;
        }

        LOG_INFO("Worker ", index, " processing ", job->filename, " [", job->id, "]");
        bool ok = false;
        try {
            ok = worker.process(*job, handle->token());
        } catch (const std::exception& e) {
            LOG_ERR("Worker ", index, " aborted job ", job->id, ": ", e.what());
        }
        unregister_job(job->id, handle);

        if (ok) {
            LOG_INFO("Worker ", index, " completed ", job->id);
        } else {
            LOG_WARN("Worker ", index, " finished ", job->id, " with error: ", job->error_message);
        }
    }

    LOG_DEBUG("Worker ", index, " stopped");
    {
        std::lock_guard<std::mutex> lock(running_mutex_);
        if (running_workers_ > 0) --running_workers_;
    }
    running_cv_.notify_all();
}
