#pragma once
#include "slimetrack/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace slimetrack::net {

/**
 * @brief RAII owner of the reactor that runs every tracker background task.
 *
 * One `asio::io_context` is driven by one dedicated thread. Sockets and timers
 * created by trackers attach to it, so the receive loop, heartbeat emitter and
 * liveness watchdog are lightweight tasks multiplexed on that thread rather
 * than threads of their own.
 *
 * Lifetime notes:
 * - Destroy trackers before the service so pending handlers can still run.
 * - The destructor releases the work guard, stops the context and joins.
 * - `shared_io_context()` returns the process-wide instance.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

std::shared_ptr<asio::io_context> shared_io_context();

/// True when the caller is executing a handler of @p io on this thread.
bool onIoThread(asio::io_context& io);

} // namespace slimetrack::net
