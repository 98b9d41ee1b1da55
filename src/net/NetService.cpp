#include "slimetrack/net/NetService.hpp"
#include "slimetrack/log/Log.hpp"

namespace slimetrack::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, workGuard_(asio::make_work_guard(*io_))
{
    thread_ = std::thread([io = io_] {
        for (;;) {
            try {
                io->run();
                return;
            } catch (const std::exception& e) {
                // A throwing handler must not take the reactor down with it.
                logError("[NetService] handler threw: ", e.what(), "\n");
            }
        }
    });
    logDebug("[NetService] reactor thread started\n");
}

NetService::~NetService() {
    workGuard_.reset();
    io_->stop();
    if (thread_.joinable()) thread_.join();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

bool onIoThread(asio::io_context& io) {
    return io.get_executor().running_in_this_thread();
}

} // namespace slimetrack::net
