#include "slimetrack/tracker/SessionState.hpp"

#include <utility>

namespace slimetrack::tracker {

const char* toString(EndReason reason) {
    switch (reason) {
        case EndReason::None:          return "none";
        case EndReason::Deinit:        return "deinit";
        case EndReason::ServerTimeout: return "server-timeout";
        case EndReason::Shutdown:      return "shutdown";
    }
    return "unknown";
}

SessionState::SessionState(std::shared_ptr<StatusBroadcast> broadcast)
: broadcast_(std::move(broadcast))
{}

TrackerState SessionState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return TrackerState{status_, packetNumber_, lastReceivedPacketTime_};
}

SessionStatus SessionState::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::uint64_t SessionState::nextPacketNumber() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++packetNumber_;
}

std::shared_ptr<SessionHandle> SessionState::link() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_;
}

bool SessionState::beginSession(std::shared_ptr<SessionHandle> link) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != SessionStatus::Initializing || !link) {
        return false;
    }
    link_ = std::move(link);
    setStatusLocked(SessionStatus::Idle);
    return true;
}

bool SessionState::endSession(EndReason reason, const SessionHandle* onlyIf) {
    std::shared_ptr<SessionHandle> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == SessionStatus::Initializing) {
            return false;
        }
        if (onlyIf && link_.get() != onlyIf) {
            return false;
        }
        released = std::move(link_);
        link_.reset();
        if (released) {
            released->endReason_.store(reason);
        }
        setStatusLocked(SessionStatus::Initializing);
    }
    if (released) {
        released->shutdown();
    }
    return true;
}

bool SessionState::markConnected(const SessionHandle& link, std::uint16_t receivedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (link_.get() != &link) {
        return false;
    }
    lastReceivedPacketTime_ = receivedAt;
    if (status_ == SessionStatus::ConnectedToServer) {
        return false;
    }
    setStatusLocked(SessionStatus::ConnectedToServer);
    return true;
}

bool SessionState::isConnectedVia(const SessionHandle& link) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == SessionStatus::ConnectedToServer && link_.get() == &link;
}

std::uint16_t SessionState::wallClockStamp() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return static_cast<std::uint16_t>(static_cast<std::uint64_t>(ms) & 0xFFFFu);
}

void SessionState::setStatusLocked(SessionStatus status) {
    status_ = status;
    broadcast_->publish(status);
}

} // namespace slimetrack::tracker
