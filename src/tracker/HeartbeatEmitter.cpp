#include "slimetrack/tracker/HeartbeatEmitter.hpp"

#include <utility>

namespace slimetrack::tracker {

HeartbeatEmitter::HeartbeatEmitter(net::asio::any_io_executor executor,
                                   std::shared_ptr<const StatusBroadcast> status,
                                   net::milliseconds interval,
                                   Beat beat)
: timer_(std::move(executor))
, status_(std::move(status))
, interval_(interval)
, beat_(std::move(beat))
{}

void HeartbeatEmitter::start() {
    if (running_) {
        return;
    }
    running_ = true;
    tick();
}

void HeartbeatEmitter::stop() {
    running_ = false;
    timer_.cancel();
}

void HeartbeatEmitter::tick() {
    if (!running_) {
        return;
    }
    if (status_->latest() == SessionStatus::Initializing) {
        running_ = false;
        return;
    }

    beat_();

    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const net::error_code& ec) {
        if (ec == net::asio::error::operation_aborted) {
            return;
        }
        self->tick();
    });
}

} // namespace slimetrack::tracker
