#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace slimetrack::tracker {

enum class SessionStatus : std::uint8_t {
    Initializing,
    Idle,
    ConnectedToServer
};

/// "initializing", "idle", "connected-to-server"
const char* toString(SessionStatus status);

/**
 * @brief Single-slot, latest-value-wins status channel.
 *
 * Every publish() overwrites the slot and bumps a version counter. Readers
 * that fall behind see only the newest value; the version tells them how
 * many publications they missed.
 */
class StatusBroadcast {
public:
    explicit StatusBroadcast(SessionStatus initial = SessionStatus::Initializing);

    StatusBroadcast(const StatusBroadcast&) = delete;
    StatusBroadcast& operator=(const StatusBroadcast&) = delete;

    void publish(SessionStatus status);

    SessionStatus latest() const;
    std::uint64_t version() const;

    /// Block until the version differs from @p seen. Returns the new version.
    std::uint64_t waitPast(std::uint64_t seen) const;

    /// As waitPast(), giving up after @p timeout. Returns nullopt on timeout.
    std::optional<std::uint64_t> waitPastFor(std::uint64_t seen,
                                             std::chrono::milliseconds timeout) const;

    /// Block until @p pred holds for the current value or @p timeout elapses.
    /// Values overwritten before this thread wakes are never offered to pred.
    template<typename Pred>
    std::optional<SessionStatus> waitUntil(Pred pred, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return pred(value_); })) {
            return std::nullopt;
        }
        return value_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SessionStatus value_;
    std::uint64_t version_ = 0;
};

/**
 * @brief Read handle on a StatusBroadcast, remembering what it has seen.
 *
 * A fresh subscription has seen the value current at subscription time.
 */
class StatusSubscription {
public:
    explicit StatusSubscription(std::shared_ptr<const StatusBroadcast> source);

    SessionStatus latest() const;
    bool hasChanged() const;

    /// Mark the current value as seen and return it.
    SessionStatus markSeen();

    /// Wait for a publication newer than the last one seen.
    SessionStatus changed();
    std::optional<SessionStatus> changedWithin(std::chrono::milliseconds timeout);

    template<typename Pred>
    std::optional<SessionStatus> waitFor(Pred pred, std::chrono::milliseconds timeout) {
        auto value = source_->waitUntil(pred, timeout);
        if (value) {
            seen_ = source_->version();
        }
        return value;
    }

private:
    std::shared_ptr<const StatusBroadcast> source_;
    std::uint64_t seen_ = 0;
};

} // namespace slimetrack::tracker
