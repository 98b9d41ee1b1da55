#pragma once

#include "slimetrack/schema/Schema.hpp"
#include "slimetrack/tracker/StatusBroadcast.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>

namespace slimetrack::tracker {

/// Snapshot returned by EmulatedTracker::getState().
struct TrackerState {
    SessionStatus status = SessionStatus::Initializing;
    std::uint64_t packetNumber = 0;
    std::uint16_t lastReceivedPacketTime = 0;
};

enum class EndReason : std::uint8_t {
    None,
    Deinit,
    ServerTimeout,
    Shutdown
};

const char* toString(EndReason reason);

/**
 * @brief The live half of a session: one socket and the tasks bound to it.
 *
 * SessionState only needs to install, release and shut down a link; the
 * socket details stay behind this interface.
 */
class SessionHandle {
public:
    virtual ~SessionHandle() = default;

    /// Cancel every task bound to the link and release the socket. Must not
    /// block; may be called from any thread, more than once.
    virtual void shutdown() = 0;

    /// Send one encoded datagram to the server, blocking for at most the
    /// configured send deadline.
    virtual std::error_code send(const schema::Bytes& datagram) = 0;

    EndReason endReason() const { return endReason_.load(); }

private:
    friend class SessionState;
    std::atomic<EndReason> endReason_{EndReason::None};
};

/**
 * @brief Single source of truth for one tracker's session.
 *
 * Every mutation happens under one mutex, and status changes are published
 * to the broadcast while that mutex is held, so publication order matches
 * transition order. The mutex is never held across I/O.
 *
 * Invariant: a link is installed exactly while status != Initializing.
 */
class SessionState {
public:
    explicit SessionState(std::shared_ptr<StatusBroadcast> broadcast);

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    TrackerState snapshot() const;
    SessionStatus status() const;
    std::shared_ptr<StatusBroadcast> broadcast() const { return broadcast_; }

    /// Increment the outbound counter and return the new value. Never reset.
    std::uint64_t nextPacketNumber();

    std::shared_ptr<SessionHandle> link() const;

    /// Initializing -> Idle with @p link installed. False (and nothing
    /// changed) when the session is not Initializing.
    bool beginSession(std::shared_ptr<SessionHandle> link);

    /// Any -> Initializing. Records @p reason on the released link, publishes
    /// and shuts the link down after unlocking. With @p onlyIf set, only
    /// that link may be torn down. False when there was nothing to end.
    bool endSession(EndReason reason, const SessionHandle* onlyIf = nullptr);

    /// Record a datagram received on @p link; Idle -> ConnectedToServer on
    /// the first one. True only for the call that made the transition.
    bool markConnected(const SessionHandle& link, std::uint16_t receivedAt);

    /// ConnectedToServer with @p link as the installed link.
    bool isConnectedVia(const SessionHandle& link) const;

    /// Low 16 bits of the wall-clock time in milliseconds.
    static std::uint16_t wallClockStamp();

private:
    void setStatusLocked(SessionStatus status);

    mutable std::mutex mutex_;
    std::shared_ptr<StatusBroadcast> broadcast_;
    SessionStatus status_ = SessionStatus::Initializing;
    std::uint64_t packetNumber_ = 0;
    std::uint16_t lastReceivedPacketTime_ = 0;
    std::shared_ptr<SessionHandle> link_;
};

} // namespace slimetrack::tracker
