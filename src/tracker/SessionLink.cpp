#include "slimetrack/tracker/SessionLink.hpp"

#include "slimetrack/log/Log.hpp"
#include "slimetrack/protocol/PacketCodec.hpp"
#include "slimetrack/protocol/PacketFormat.hpp"

#include <utility>
#include <variant>

namespace slimetrack::tracker {

namespace asio = net::asio;

expected<std::shared_ptr<SessionLink>> SessionLink::open(
    asio::io_context& io,
    std::shared_ptr<SessionState> session,
    Settings settings)
{
    auto frame = protocol::encode(protocol::OutboundPacket{config::HANDSHAKE_SEQUENCE, settings.handshake});
    if (!frame) {
        logError("[SessionLink] handshake does not encode: ", frame.error().describe(), "\n");
        return unexpected(Errc::EncodeFailed);
    }

    auto link = std::make_shared<SessionLink>(Token{}, io, std::move(session), std::move(settings));
    link->handshakeFrame_ = std::move(*frame);

    if (auto ec = link->socket_.open_v4()) {
        logError("[SessionLink] socket open failed: ", ec.message(), "\n");
        return unexpected(Errc::BindFailed);
    }
    if (auto ec = link->socket_.bind_any(0)) {
        logError("[SessionLink] bind to 0.0.0.0:0 failed: ", ec.message(), "\n");
        return unexpected(Errc::BindFailed);
    }
    if (auto ec = link->socket_.enable_broadcast(true)) {
        logError("[SessionLink] enabling broadcast failed: ", ec.message(), "\n");
        return unexpected(Errc::SocketOptionFailed);
    }
    return link;
}

SessionLink::SessionLink(Token,
                         asio::io_context& io,
                         std::shared_ptr<SessionState> session,
                         Settings settings)
: session_(std::move(session))
, settings_(std::move(settings))
, socket_(io)
, discoveryTimer_(socket_.strand())
{}

SessionLink::~SessionLink() = default;

void SessionLink::start() {
    asio::dispatch(socket_.strand(), [self = shared_from_this()] {
        if (!self->isOpen()) {
            return;
        }
        std::weak_ptr<SessionLink> weak = self;

        self->heartbeat_ = std::make_shared<HeartbeatEmitter>(
            self->socket_.strand(), self->session_->broadcast(), config::HEARTBEAT_INTERVAL,
            [weak] {
                if (auto link = weak.lock()) {
                    link->reply(protocol::Heartbeat{});
                }
            });
        self->watchdog_ = std::make_shared<LivenessWatchdog>(
            self->socket_.strand(), self->settings_.serverTimeout,
            [weak](net::milliseconds silence) {
                if (auto link = weak.lock()) {
                    link->onWatchdogExpired(silence);
                }
            });

        self->heartbeat_->start();
        self->watchdog_->start();
        self->discoveryTick();
        self->armReceive();
    });
}

void SessionLink::shutdown() {
    if (!open_.exchange(false)) {
        return;
    }
    asio::post(socket_.strand(), [self = shared_from_this()] {
        self->discoveryTimer_.cancel();
        if (self->heartbeat_) self->heartbeat_->stop();
        if (self->watchdog_) self->watchdog_->stop();
        self->socket_.close();
        if (self->settings_.debug) {
            logDebug("[SessionLink] socket released (", toString(self->endReason()), ")\n");
        }
    });
}

std::error_code SessionLink::send(const schema::Bytes& datagram) {
    if (!isOpen()) {
        return asio::error::bad_descriptor;
    }
    auto payload = std::make_shared<const schema::Bytes>(datagram);
    return socket_.send_to(std::move(payload), settings_.server, settings_.sendTimeout, shared_from_this());
}

void SessionLink::discoveryTick() {
    if (!isOpen() || session_->isConnectedVia(*this)) {
        return;
    }

    if (settings_.debug) {
        logDebug("[SessionLink] handshake -> ", settings_.server, "\n");
    }
    sendAsync(handshakeFrame_, "handshake");

    discoveryTimer_.expires_after(config::DISCOVERY_INTERVAL);
    discoveryTimer_.async_wait([self = shared_from_this()](const net::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        self->discoveryTick();
    });
}

void SessionLink::armReceive() {
    if (!isOpen()) {
        return;
    }
    socket_.async_receive_from(asio::buffer(rxBuffer_), rxFrom_,
        [self = shared_from_this()](const net::error_code& ec, std::size_t size) {
            self->onReceive(ec, size);
        });
}

void SessionLink::onReceive(const net::error_code& ec, std::size_t size) {
    if (!isOpen()) {
        return;
    }
    if (ec == asio::error::operation_aborted) {
        // Only shutdown may end the loop.
        armReceive();
        return;
    }
    if (ec) {
        logError("[SessionLink] receive failed: ", ec.message(), "\n");
        armReceive();
        return;
    }

    const schema::ByteView bytes(rxBuffer_.data(), size);
    auto packet = protocol::decodeInbound(bytes);
    if (!packet) {
        logError("[SessionLink] dropped malformed datagram from ", rxFrom_,
                 " (", size, " bytes): ", packet.error().describe(), "\n");
        if (settings_.debug) {
            logDebug("[SessionLink]   ", protocol::toHexLine(bytes), "\n");
        }
        armReceive();
        return;
    }

    if (settings_.debug) {
        logDebug("[SessionLink] received ", protocol::describe(*packet), " from ", rxFrom_, "\n");
    }

    if (session_->markConnected(*this, SessionState::wallClockStamp())) {
        logInfo("[SessionLink] connected to server ", rxFrom_, "\n");
    }
    if (std::holds_alternative<protocol::Heartbeat>(packet->payload) && watchdog_) {
        watchdog_->feed();
    }

    dispatch(*packet);
    armReceive();
}

void SessionLink::dispatch(const protocol::InboundPacket& packet) {
    const auto& payload = packet.payload;

    if (std::holds_alternative<protocol::Heartbeat>(payload)) {
        reply(protocol::Heartbeat{});
    } else if (const auto* ping = std::get_if<protocol::Ping>(&payload)) {
        reply(protocol::Ping{ping->challenge});
    } else if (std::holds_alternative<protocol::Discovery>(payload)) {
        // Nothing to answer; the handshake timer is already running.
    } else if (const auto* response = std::get_if<protocol::HandshakeResponse>(&payload)) {
        if (settings_.debug) {
            logDebug("[SessionLink] handshake accepted, server protocol version ",
                     response->serverVersion, "\n");
        }
    } else if (const auto* unknown = std::get_if<protocol::Unknown>(&payload)) {
        logInfo("[SessionLink] ignoring unrecognized packet type ", unknown->packetType, "\n");
    }
}

void SessionLink::onWatchdogExpired(net::milliseconds silence) {
    logError("[SessionLink] no heartbeat from ", settings_.server, " within ",
             settings_.serverTimeout.count(), "ms (silent for ", silence.count(), "ms)\n");
    session_->endSession(EndReason::ServerTimeout, this);
}

void SessionLink::reply(protocol::OutboundPayload payload) {
    if (!isOpen()) {
        return;
    }
    protocol::OutboundPacket packet{0, std::move(payload)};
    auto frame = protocol::encode(packet);
    if (!frame) {
        logError("[SessionLink] could not encode ", protocol::packetName(packet.payload), ": ",
                 frame.error().describe(), "\n");
        return;
    }
    packet.sequence = session_->nextPacketNumber();
    if (!protocol::stampSequence(*frame, packet.sequence)) {
        logError("[SessionLink] encoded ", protocol::packetName(packet.payload), " has no frame header\n");
        return;
    }
    if (settings_.debug) {
        logDebug("[SessionLink] sending ", protocol::describe(packet), "\n");
    }
    sendAsync(std::move(*frame), protocol::packetName(packet.payload));
}

void SessionLink::sendAsync(schema::Bytes datagram, const char* what) {
    auto payload = std::make_shared<const schema::Bytes>(std::move(datagram));
    socket_.async_send_to(std::move(payload), settings_.server,
        [self = shared_from_this(), what](const net::error_code& ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                logError("[SessionLink] failed to send ", what, " to ", self->settings_.server,
                         ": ", ec.message(), "\n");
            }
        });
}

} // namespace slimetrack::tracker
