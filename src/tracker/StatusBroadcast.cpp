#include "slimetrack/tracker/StatusBroadcast.hpp"

#include <utility>

namespace slimetrack::tracker {

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Initializing:      return "initializing";
        case SessionStatus::Idle:              return "idle";
        case SessionStatus::ConnectedToServer: return "connected-to-server";
    }
    return "unknown";
}

StatusBroadcast::StatusBroadcast(SessionStatus initial)
: value_(initial)
{}

void StatusBroadcast::publish(SessionStatus status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = status;
        ++version_;
    }
    cv_.notify_all();
}

SessionStatus StatusBroadcast::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

std::uint64_t StatusBroadcast::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::uint64_t StatusBroadcast::waitPast(std::uint64_t seen) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return version_ != seen; });
    return version_;
}

std::optional<std::uint64_t> StatusBroadcast::waitPastFor(std::uint64_t seen,
                                                          std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return version_ != seen; })) {
        return std::nullopt;
    }
    return version_;
}

StatusSubscription::StatusSubscription(std::shared_ptr<const StatusBroadcast> source)
: source_(std::move(source))
, seen_(source_->version())
{}

SessionStatus StatusSubscription::latest() const {
    return source_->latest();
}

bool StatusSubscription::hasChanged() const {
    return source_->version() != seen_;
}

SessionStatus StatusSubscription::markSeen() {
    seen_ = source_->version();
    return source_->latest();
}

SessionStatus StatusSubscription::changed() {
    seen_ = source_->waitPast(seen_);
    return source_->latest();
}

std::optional<SessionStatus> StatusSubscription::changedWithin(std::chrono::milliseconds timeout) {
    auto version = source_->waitPastFor(seen_, timeout);
    if (!version) {
        return std::nullopt;
    }
    seen_ = *version;
    return source_->latest();
}

} // namespace slimetrack::tracker
