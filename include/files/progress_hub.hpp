#ifndef ISOFETCH_PROGRESS_HUB_HPP
#define ISOFETCH_PROGRESS_HUB_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "progress_sink.hpp"
#include "../common/bounded_queue.hpp"

struct ProgressEvent {
    std::string job_id;
    int progress = 0;
    JobStatus status = JobStatus::Pending;
};

/**
 * Fan-out point between workers and any number of listeners.
 *
 * notify() only enqueues; a dedicated thread serializes each event to JSON
 * and hands the text to every subscriber. When the buffer is full the event
 * is dropped, so a slow listener can never stall a download.
 */
class ProgressHub : public ProgressSink {
public:
    using Subscriber = std::function<void(const std::string& message)>;
    using SubscriptionId = uint64_t;

    explicit ProgressHub(size_t buffer_size = 256);
    ~ProgressHub() override;

    ProgressHub(const ProgressHub&) = delete;
    ProgressHub& operator=(const ProgressHub&) = delete;

    void notify(const std::string& job_id, int progress, JobStatus status) override;

    SubscriptionId subscribe(Subscriber subscriber);
    bool unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    // Events discarded because the buffer was full.
    size_t dropped_count() const { return dropped_.load(); }

    // Stops the delivery thread. Undelivered events are discarded.
    void stop();

    // {"type":"progress","payload":{"id":...,"progress":...,"status":...}}
    static std::string to_json(const ProgressEvent& event);

private:
    void run();

    BoundedQueue<ProgressEvent> queue_;
    std::thread thread_;
    std::once_flag stop_once_;

    mutable std::mutex subscribers_mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_id_ = 1;

    std::atomic<size_t> dropped_{0};
};

#endif // ISOFETCH_PROGRESS_HUB_HPP
