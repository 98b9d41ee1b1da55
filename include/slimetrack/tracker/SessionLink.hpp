#pragma once

#include "slimetrack/core/Error.hpp"
#include "slimetrack/core/Expected.hpp"
#include "slimetrack/net/NetConfig.hpp"
#include "slimetrack/net/UdpSocket.hpp"
#include "slimetrack/protocol/Packets.hpp"
#include "slimetrack/tracker/HeartbeatEmitter.hpp"
#include "slimetrack/tracker/LivenessWatchdog.hpp"
#include "slimetrack/tracker/SessionState.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace slimetrack::tracker {

/**
 * @brief One bound socket and everything that runs on it.
 *
 * A link is created by init() when the session leaves Initializing and is
 * shut down on every transition back. While alive it:
 *
 * - sends a Handshake (sequence 0) every discovery interval until the
 *   session is connected,
 * - receives and dispatches server datagrams (marking the session connected,
 *   feeding the watchdog, echoing heartbeats and pings),
 * - owns the HeartbeatEmitter and LivenessWatchdog bound to this socket.
 *
 * All of that runs on the socket's strand on the shared I/O thread. Callers
 * on other threads only use send() and shutdown(). The io_context must
 * outlive the link.
 */
class SessionLink : public SessionHandle,
                    public std::enable_shared_from_this<SessionLink> {
    struct Token {};

public:
    struct Settings {
        net::udp::endpoint server;
        protocol::Handshake handshake;
        net::milliseconds serverTimeout = config::DEFAULT_SERVER_TIMEOUT;
        net::milliseconds sendTimeout = config::DEFAULT_SEND_TIMEOUT;
        bool debug = false;
    };

    /// Open, bind to 0.0.0.0:0 and enable broadcast. Nothing runs until
    /// start().
    static expected<std::shared_ptr<SessionLink>> open(
        net::asio::io_context& io,
        std::shared_ptr<SessionState> session,
        Settings settings);

    /// Use open(); the token keeps construction private to it.
    SessionLink(Token,
                net::asio::io_context& io,
                std::shared_ptr<SessionState> session,
                Settings settings);
    ~SessionLink() override;

    /// Spawn the heartbeat emitter, the watchdog, the discovery timer and the
    /// receive loop. Call after the link is installed in the session.
    void start();

    void shutdown() override;
    std::error_code send(const schema::Bytes& datagram) override;

    bool isOpen() const { return open_.load(); }
    net::udp::endpoint localEndpoint() const { return socket_.local_endpoint(); }
    const net::udp::endpoint& server() const { return settings_.server; }

private:
    void discoveryTick();
    void armReceive();
    void onReceive(const net::error_code& ec, std::size_t size);
    void dispatch(const protocol::InboundPacket& packet);
    void onWatchdogExpired(net::milliseconds silence);

    // Fire-and-forget send with a fresh sequence number.
    void reply(protocol::OutboundPayload payload);
    void sendAsync(schema::Bytes datagram, const char* what);

    std::shared_ptr<SessionState> session_;
    Settings settings_;

    net::UdpSocket socket_;
    net::asio::steady_timer discoveryTimer_;
    schema::Bytes handshakeFrame_;

    std::array<std::uint8_t, config::RECEIVE_BUFFER_SIZE> rxBuffer_{};
    net::udp::endpoint rxFrom_;

    std::shared_ptr<HeartbeatEmitter> heartbeat_;
    std::shared_ptr<LivenessWatchdog> watchdog_;

    std::atomic<bool> open_{true};
};

} // namespace slimetrack::tracker
