#include "files/progress_hub.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <vector>

using json = nlohmann::json;

ProgressHub::ProgressHub(size_t buffer_size) : queue_(buffer_size) {
    thread_ = std::thread([this] { run(); });
}

ProgressHub::~ProgressHub() {
    stop();
}

void ProgressHub::stop() {
    std::call_once(stop_once_, [this] {
        size_t discarded = queue_.close();
        if (discarded > 0) {
            LOG_DEBUG("Progress hub stopped with ", discarded, " undelivered events");
        }
        if (thread_.joinable()) thread_.join();
    });
}

void ProgressHub::notify(const std::string& job_id, int progress, JobStatus status) {
    if (!queue_.try_push(ProgressEvent{job_id, progress, status})) {
        dropped_.fetch_add(1);
        if (!queue_.closed()) {
            LOG_WARN("Progress buffer full, dropping update for job ", job_id,
                     " (", to_string(status), " ", progress, "%)");
        }
    }
}

ProgressHub::SubscriptionId ProgressHub::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    LOG_DEBUG("Progress subscriber ", id, " added, total: ", subscribers_.size());
    return id;
}

bool ProgressHub::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    bool removed = subscribers_.erase(id) > 0;
    if (removed) {
        LOG_DEBUG("Progress subscriber ", id, " removed, total: ", subscribers_.size());
    }
    return removed;
}

size_t ProgressHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

std::string ProgressHub::to_json(const ProgressEvent& event) {
    json j;
    j["type"] = "progress";
    j["payload"] = {
        {"id", event.job_id},
        {"progress", event.progress},
        {"status", to_string(event.status)}
    };
    return j.dump();
}

void ProgressHub::run() {
    while (auto event = queue_.pop()) {
        std::string message = to_json(*event);

        // Copy so a subscriber may unsubscribe from inside its own callback.
        std::vector<std::pair<SubscriptionId, Subscriber>> targets;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            targets.assign(subscribers_.begin(), subscribers_.end());
        }
        for (auto& target : targets) {
            try {
                target.second(message);
            } catch (const std::exception& e) {
                LOG_WARN("Progress subscriber ", target.first, " failed: ", e.what());
            }
        }
    }
}
