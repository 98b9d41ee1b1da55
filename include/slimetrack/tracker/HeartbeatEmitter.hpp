#pragma once

#include "slimetrack/net/NetConfig.hpp"
#include "slimetrack/tracker/StatusBroadcast.hpp"

#include <functional>
#include <memory>

namespace slimetrack::tracker {

/**
 * @brief Periodic liveness signal for one link.
 *
 * Beats once immediately, then every interval, for as long as the latest
 * broadcast status is not Initializing. Observing Initializing ends the task;
 * stop() ends it too. All members run on the executor given at construction,
 * which must be the link's strand.
 */
class HeartbeatEmitter : public std::enable_shared_from_this<HeartbeatEmitter> {
public:
    using Beat = std::function<void()>;

    HeartbeatEmitter(net::asio::any_io_executor executor,
                     std::shared_ptr<const StatusBroadcast> status,
                     net::milliseconds interval,
                     Beat beat);

    void start();
    void stop();

    bool running() const { return running_; }

private:
    void tick();

    net::asio::steady_timer timer_;
    std::shared_ptr<const StatusBroadcast> status_;
    net::milliseconds interval_;
    Beat beat_;
    bool running_ = false;
};

} // namespace slimetrack::tracker
