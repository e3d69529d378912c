#ifndef ISOFETCH_PROGRESS_SINK_HPP
#define ISOFETCH_PROGRESS_SINK_HPP

#include <functional>
#include <string>

#include "job.hpp"

// Receives progress and status transitions from workers. notify() is called
// from worker threads and must not block for long.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void notify(const std::string& job_id, int progress, JobStatus status) = 0;
};

using ProgressCallback = std::function<void(const std::string& job_id, int progress, JobStatus status)>;

class CallbackProgressSink : public ProgressSink {
public:
    explicit CallbackProgressSink(ProgressCallback callback) : callback_(std::move(callback)) {}

    void notify(const std::string& job_id, int progress, JobStatus status) override {
        if (callback_) callback_(job_id, progress, status);
    }

private:
    ProgressCallback callback_;
};

#endif // ISOFETCH_PROGRESS_SINK_HPP
