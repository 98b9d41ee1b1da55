#pragma once
#include "slimetrack/net/NetConfig.hpp"
#include "slimetrack/net/Deadline.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace slimetrack::net {

/**
 * UdpSocket
 *
 * Datagram socket for the tracker link: ephemeral bind, broadcast, blocking
 * sends with a deadline for caller threads, and asynchronous send/receive for
 * tasks already running on the reactor.
 *
 * Every operation is initiated on the socket's strand, so a caller thread
 * sending telemetry never races the receive loop inside Asio. Completion
 * handlers also run on the strand.
 *
 * Ownership: handlers passed to the async functions must keep the owner of
 * this socket alive (capture a shared_ptr), since initiation may be deferred
 * to the strand.
 */
class UdpSocket {
public:
    using Payload = std::shared_ptr<const std::vector<std::byte>>;
    using SendHandler = std::function<void(const error_code&, std::size_t)>;

    explicit UdpSocket(asio::io_context& io)
    : strand_(asio::make_strand(io))
    , sock_(strand_)
    {}

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port = 0) {
        error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    udp::endpoint local_endpoint() const {
        error_code ec;
        auto ep = sock_.local_endpoint(ec);
        return ec ? udp::endpoint{} : ep;
    }

    // Send one datagram, fail if it is not handed to the OS within timeout.
    // Never call this from a handler running on the same io_context.
    //
    // A send that times out is abandoned rather than cancelled: cancelling the
    // socket would also abort the receive loop. If the send has not started
    // by then it is skipped. @p owner keeps this socket alive until the queued
    // initiation has run.
    error_code send_to(Payload payload, const udp::endpoint& ep, milliseconds timeout,
                       std::shared_ptr<const void> owner) {
        auto abandoned = std::make_shared<std::atomic<bool>>(false);
        return with_deadline(strand_, timeout, "datagram send",
            [&](auto cb) {
                asio::dispatch(strand_, [this, owner, abandoned, payload, ep, cb]() {
                    if (abandoned->load()) {
                        return;
                    }
                    sock_.async_send_to(asio::buffer(*payload), ep,
                        [owner, payload, cb](const error_code& ec, std::size_t) { cb(ec); });
                });
            },
            [abandoned] { abandoned->store(true); });
    }

    void async_send_to(Payload payload, const udp::endpoint& ep, SendHandler handler) {
        asio::dispatch(strand_, [this, payload, ep, handler = std::move(handler)]() mutable {
            sock_.async_send_to(asio::buffer(*payload), ep,
                [payload, handler = std::move(handler)](const error_code& ec, std::size_t n) {
                    handler(ec, n);
                });
        });
    }

    template<typename Handler>
    void async_receive_from(asio::mutable_buffer buffer, udp::endpoint& from, Handler handler) {
        asio::dispatch(strand_, [this, buffer, &from, handler = std::move(handler)]() mutable {
            sock_.async_receive_from(buffer, from, std::move(handler));
        });
    }

    // Must run on strand(); cancels pending operations before closing.
    void close() {
        error_code ignore;
        sock_.cancel(ignore);
        sock_.close(ignore);
    }

    asio::strand<asio::io_context::executor_type>& strand() { return strand_; }

private:
    asio::strand<asio::io_context::executor_type> strand_;
    udp::socket sock_;
};

} // namespace slimetrack::net
