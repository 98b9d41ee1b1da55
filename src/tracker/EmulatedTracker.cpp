#include "slimetrack/tracker/EmulatedTracker.hpp"

#include "slimetrack/log/Log.hpp"
#include "slimetrack/net/NetService.hpp"
#include "slimetrack/net/Resolve.hpp"
#include "slimetrack/protocol/PacketCodec.hpp"
#include "slimetrack/protocol/PacketFormat.hpp"
#include "slimetrack/tracker/SessionLink.hpp"

#include <utility>

namespace slimetrack::tracker {

EmulatedTracker::EmulatedTracker(Identity identity, ConnectionConfig config)
: identity_(std::move(identity))
, config_(std::move(config))
, io_(net::shared_io_context())
, broadcast_(std::make_shared<StatusBroadcast>(SessionStatus::Initializing))
, session_(std::make_shared<SessionState>(broadcast_))
{}

EmulatedTracker::~EmulatedTracker() {
    session_->endSession(EndReason::Shutdown);
}

expected<void> EmulatedTracker::init() {
    if (session_->status() != SessionStatus::Initializing) {
        return {};
    }

    if (auto ok = identity_.validate(); !ok) {
        logError("[EmulatedTracker] invalid identity: ", ok.error(), "\n");
        return unexpected(Errc::InvalidIdentity);
    }
    if (auto ok = config_.validate(); !ok) {
        logError("[EmulatedTracker] invalid config: ", ok.error(), "\n");
        return unexpected(Errc::InvalidConfig);
    }
    if (net::onIoThread(*io_)) {
        logError("[EmulatedTracker] init() called from the I/O thread\n");
        return unexpected(Errc::CalledFromIoThread);
    }

    for (;;) {
        SessionLink::Settings settings;
        if (auto ec = net::resolve_udp(*io_, config_.serverAddress, config_.serverPort, settings.server)) {
            logError("[EmulatedTracker] cannot resolve ", config_.serverAddress, ":",
                     config_.serverPort, ": ", ec.message(), "\n");
            return unexpected(Errc::ResolveFailed);
        }
        settings.handshake = identity_.handshake();
        settings.serverTimeout = config_.serverTimeout;
        settings.sendTimeout = config_.sendTimeout;
        settings.debug = config_.debug;

        auto link = SessionLink::open(*io_, session_, std::move(settings));
        if (!link) {
            return unexpected(link.error());
        }

        StatusSubscription status(broadcast_);
        if (!session_->beginSession(*link)) {
            // Another caller brought the session up first.
            (*link)->shutdown();
            return {};
        }
        (*link)->start();
        logInfo("[EmulatedTracker] ", protocol::formatMac(identity_.mac), " looking for server at ",
                (*link)->server(), " from ", (*link)->localEndpoint(), "\n");

        const auto reason = waitForConnection(**link, status);
        switch (reason) {
            case EndReason::None:
                return {};
            case EndReason::ServerTimeout:
                logInfo("[EmulatedTracker] server never answered, rebinding\n");
                continue;
            case EndReason::Deinit:
            case EndReason::Shutdown:
                break;
        }
        logInfo("[EmulatedTracker] init() interrupted by ", toString(reason), "\n");
        return unexpected(Errc::Cancelled);
    }
}

EndReason EmulatedTracker::waitForConnection(const SessionLink& link, StatusSubscription& status) {
    for (;;) {
        const auto reason = link.endReason();
        if (reason != EndReason::None) {
            return reason;
        }
        if (session_->isConnectedVia(link)) {
            return EndReason::None;
        }
        status.changed();
    }
}

expected<void> EmulatedTracker::deinit() {
    if (session_->status() == SessionStatus::Initializing) {
        return {};
    }
    if (session_->endSession(EndReason::Deinit)) {
        logInfo("[EmulatedTracker] session closed\n");
    }
    return {};
}

TrackerState EmulatedTracker::getState() const {
    return session_->snapshot();
}

StatusSubscription EmulatedTracker::subscribeStatus() const {
    return StatusSubscription(broadcast_);
}

bool EmulatedTracker::isSocketOpen() const {
    return session_->link() != nullptr;
}

expected<void> EmulatedTracker::addSensor(protocol::ImuType type, protocol::SensorStatus status) {
    return sensors_.add(type, status, [this](const Sensor& sensor) {
        return sendPacket(protocol::SensorInfo{sensor.sensorId, sensor.sensorStatus, sensor.sensorType});
    });
}

expected<void> EmulatedTracker::sendRotation(std::uint8_t sensorId,
                                             protocol::SensorDataType dataType,
                                             const protocol::Quaternion& rotation,
                                             std::uint8_t accuracy) {
    return sendPacket(protocol::RotationData{sensorId, dataType, rotation, accuracy});
}

expected<void> EmulatedTracker::sendAcceleration(std::uint8_t sensorId, const protocol::Vector3& acceleration) {
    return sendPacket(protocol::Acceleration{acceleration, sensorId});
}

expected<void> EmulatedTracker::sendBatteryLevel(float percentage, float voltage) {
    return sendPacket(protocol::Battery{voltage, percentage});
}

expected<void> EmulatedTracker::sendTemperature(std::uint8_t sensorId, float temperature) {
    return sendPacket(protocol::Temperature{sensorId, temperature});
}

expected<void> EmulatedTracker::sendSignalStrength(std::uint8_t sensorId, std::int8_t strength) {
    return sendPacket(protocol::SignalStrength{sensorId, strength});
}

expected<void> EmulatedTracker::sendMagnetometerAccuracy(std::uint8_t sensorId, float accuracy) {
    return sendPacket(protocol::MagAccuracy{sensorId, accuracy});
}

expected<void> EmulatedTracker::sendUserAction(protocol::ActionType action) {
    return sendPacket(protocol::UserAction{action});
}

expected<void> EmulatedTracker::sendPacket(protocol::OutboundPayload payload) {
    auto link = session_->link();
    if (!link) {
        return unexpected(Errc::NotInitialized);
    }
    if (net::onIoThread(*io_)) {
        logError("[EmulatedTracker] blocking send issued from the I/O thread\n");
        return unexpected(Errc::CalledFromIoThread);
    }

    protocol::OutboundPacket packet{0, std::move(payload)};
    auto frame = protocol::encode(packet);
    if (!frame) {
        logError("[EmulatedTracker] could not encode ", protocol::packetName(packet.payload), ": ",
                 frame.error().describe(), "\n");
        return unexpected(Errc::EncodeFailed);
    }
    packet.sequence = session_->nextPacketNumber();
    if (!protocol::stampSequence(*frame, packet.sequence)) {
        logError("[EmulatedTracker] encoded ", protocol::packetName(packet.payload), " has no frame header\n");
        return unexpected(Errc::EncodeFailed);
    }

    if (config_.debug) {
        logDebug("[EmulatedTracker] sending ", protocol::describe(packet), "\n");
    }
    if (auto ec = link->send(*frame)) {
        logError("[EmulatedTracker] failed to send ", protocol::packetName(packet.payload), ": ",
                 ec.message(), "\n");
        return unexpected(Errc::SendFailed);
    }
    return {};
}

} // namespace slimetrack::tracker
