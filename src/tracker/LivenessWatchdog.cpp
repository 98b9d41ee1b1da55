#include "slimetrack/tracker/LivenessWatchdog.hpp"

#include <utility>

namespace slimetrack::tracker {

LivenessWatchdog::LivenessWatchdog(net::asio::any_io_executor executor,
                                   net::milliseconds timeout,
                                   Expired onExpired)
: timer_(std::move(executor))
, timeout_(timeout)
, onExpired_(std::move(onExpired))
{}

void LivenessWatchdog::start() {
    if (running_) {
        return;
    }
    running_ = true;
    lastFeed_ = Clock::now();
    arm();
}

void LivenessWatchdog::feed() {
    lastFeed_ = Clock::now();
}

void LivenessWatchdog::stop() {
    running_ = false;
    timer_.cancel();
}

void LivenessWatchdog::arm() {
    timer_.expires_after(timeout_);
    timer_.async_wait([self = shared_from_this()](const net::error_code& ec) {
        if (ec == net::asio::error::operation_aborted) {
            return;
        }
        self->check();
    });
}

void LivenessWatchdog::check() {
    if (!running_) {
        return;
    }
    const auto elapsed = Clock::now() - lastFeed_;
    if (elapsed > timeout_) {
        running_ = false;
        onExpired_(std::chrono::duration_cast<net::milliseconds>(elapsed));
        return;
    }
    arm();
}

} // namespace slimetrack::tracker
