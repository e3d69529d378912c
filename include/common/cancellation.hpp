#ifndef ISOFETCH_CANCELLATION_HPP
#define ISOFETCH_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace detail {
struct CancelState {
    std::shared_ptr<const CancelState> parent;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::atomic<bool> cancelled{false};
    // Set by try_commit(); a committed scope refuses later cancel() calls.
    mutable bool committed = false;
    mutable std::mutex reason_mutex;
    std::string reason;
};
} // namespace detail

/**
 * @brief Read-only view of a cancellation scope.
 *
 * A token is cancelled once its own source, or any source it was derived
 * from, has been cancelled, or once its deadline has passed. Tokens are
 * cheap to copy and safe to share across threads.
 */
class CancellationToken {
public:
    // A token that is never cancelled.
    CancellationToken() = default;

    bool is_cancelled() const;
    bool deadline_exceeded() const;

    // Reason given by the nearest cancelled source, or "deadline exceeded".
    // Empty while the token is live.
    std::string reason() const;

    // Throws CancelledError if the token is cancelled.
    void throw_if_cancelled() const;

    /**
     * @brief Marks the point past which this scope can no longer be cancelled.
     *
     * Returns false if the token is already cancelled. Once it returns true,
     * cancel() on this token's own source returns false and has no effect.
     */
    bool try_commit() const;

    // Child token that additionally expires after `timeout`.
    CancellationToken with_timeout(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const detail::CancelState> state_;
};

// Owner side of a cancellation scope.
class CancellationSource {
public:
    CancellationSource();
    // Derived scope: cancelling the parent also cancels this one.
    explicit CancellationSource(const CancellationToken& parent);

    // Returns true on the first call only, and false once the scope is committed.
    bool cancel(const std::string& reason = "cancelled");
    bool is_cancelled() const;

    CancellationToken token() const;

private:
    std::shared_ptr<detail::CancelState> state_;
};

#endif // ISOFETCH_CANCELLATION_HPP
