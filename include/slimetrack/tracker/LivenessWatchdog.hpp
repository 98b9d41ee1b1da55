#pragma once

#include "slimetrack/net/NetConfig.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace slimetrack::tracker {

/**
 * @brief Forces a session down when the server goes quiet.
 *
 * Wakes every `timeout`; if more than `timeout` has passed since the last
 * feed() (or since start()), calls onExpired once and stops. Elapsed time is
 * measured on the steady clock. Runs on the link's strand like the emitter,
 * and is stopped together with it.
 */
class LivenessWatchdog : public std::enable_shared_from_this<LivenessWatchdog> {
public:
    using Clock = std::chrono::steady_clock;
    using Expired = std::function<void(net::milliseconds silence)>;

    LivenessWatchdog(net::asio::any_io_executor executor,
                     net::milliseconds timeout,
                     Expired onExpired);

    void start();
    void feed();
    void stop();

    bool running() const { return running_; }

private:
    void arm();
    void check();

    net::asio::steady_timer timer_;
    net::milliseconds timeout_;
    Expired onExpired_;
    Clock::time_point lastFeed_{};
    bool running_ = false;
};

} // namespace slimetrack::tracker
