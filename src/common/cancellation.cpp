#include "common/cancellation.hpp"
#include "common/errors.hpp"

namespace {

bool own_deadline_passed(const detail::CancelState& state) {
    return state.deadline && std::chrono::steady_clock::now() >= *state.deadline;
}

std::string own_reason(const detail::CancelState& state) {
    std::lock_guard<std::mutex> lock(state.reason_mutex);
    return state.reason;
}

} // namespace

bool CancellationToken::is_cancelled() const {
    for (const detail::CancelState* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire) || own_deadline_passed(*s)) {
            return true;
        }
    }
    return false;
}

bool CancellationToken::deadline_exceeded() const {
    for (const detail::CancelState* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) return false;
        if (own_deadline_passed(*s)) return true;
    }
    return false;
}

std::string CancellationToken::reason() const {
    for (const detail::CancelState* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) return own_reason(*s);
        if (own_deadline_passed(*s)) return "deadline exceeded";
    }
    return {};
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError(reason());
    }
}

bool CancellationToken::try_commit() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lock(state_->reason_mutex);
    if (is_cancelled()) return false;
    state_->committed = true;
    return true;
}

CancellationToken CancellationToken::with_timeout(std::chrono::milliseconds timeout) const {
    auto child = std::make_shared<detail::CancelState>();
    child->parent = state_;
    child->deadline = std::chrono::steady_clock::now() + timeout;
    return CancellationToken(std::move(child));
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancelState>()) {
    state_->parent = parent.state_;
}

bool CancellationSource::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_->reason_mutex);
    if (state_->committed || state_->cancelled.load(std::memory_order_acquire)) return false;
    state_->reason = reason;
    state_->cancelled.store(true, std::memory_order_release);
    return true;
}

bool CancellationSource::is_cancelled() const {
    return token().is_cancelled();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}
