#pragma once

#include "slimetrack/core/Error.hpp"
#include "slimetrack/core/Expected.hpp"
#include "slimetrack/net/NetConfig.hpp"
#include "slimetrack/protocol/Packets.hpp"
#include "slimetrack/tracker/Identity.hpp"
#include "slimetrack/tracker/SensorRegistry.hpp"
#include "slimetrack/tracker/SessionState.hpp"
#include "slimetrack/tracker/StatusBroadcast.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace slimetrack::tracker {

class SessionLink;

/**
 * @brief A software stand-in for one tracker device.
 *
 * Typical use:
 *
 *     EmulatedTracker tracker(identity, config);
 *     if (auto ok = tracker.init(); !ok) { ... }   // blocks until connected
 *     tracker.addSensor(ImuType::Bno085, SensorStatus::Ok);
 *     tracker.sendRotation(0, SensorDataType::Normal, quat, 0);
 *     tracker.deinit();
 *
 * Threading:
 * - Public methods may be called from any thread except the shared I/O
 *   thread (blocking calls from there fail with Errc::CalledFromIoThread).
 * - deinit() may be called while another thread is blocked in init(); that
 *   init() then returns Errc::Cancelled.
 * - Heartbeats, watchdog checks and server replies run on the I/O thread for
 *   as long as the session is up, including after init() returned.
 *
 * Destroying the tracker ends the session. The shared I/O service must
 * outlive it.
 */
class EmulatedTracker {
public:
    explicit EmulatedTracker(Identity identity, ConnectionConfig config = {});
    ~EmulatedTracker();

    EmulatedTracker(const EmulatedTracker&) = delete;
    EmulatedTracker& operator=(const EmulatedTracker&) = delete;

    /**
     * @brief Bind a socket and run discovery until the server answers.
     *
     * Returns immediately with success when the session is already up. If
     * the watchdog ends the session before the server answered, a fresh
     * socket is bound and discovery starts over.
     */
    expected<void> init();

    /// End the session and release the socket. No-op when not initialized.
    expected<void> deinit();

    TrackerState getState() const;
    StatusSubscription subscribeStatus() const;

    /// Register the next sensor (id = number already registered) and
    /// announce it with a SensorInfo packet.
    expected<void> addSensor(protocol::ImuType type,
                             protocol::SensorStatus status = protocol::SensorStatus::Ok);

    expected<void> sendRotation(std::uint8_t sensorId,
                                protocol::SensorDataType dataType,
                                const protocol::Quaternion& rotation,
                                std::uint8_t accuracy);
    expected<void> sendAcceleration(std::uint8_t sensorId, const protocol::Vector3& acceleration);
    expected<void> sendBatteryLevel(float percentage, float voltage);
    expected<void> sendTemperature(std::uint8_t sensorId, float temperature);
    expected<void> sendSignalStrength(std::uint8_t sensorId, std::int8_t strength);
    expected<void> sendMagnetometerAccuracy(std::uint8_t sensorId, float accuracy);
    expected<void> sendUserAction(protocol::ActionType action);

    std::vector<Sensor> sensors() const { return sensors_.snapshot(); }
    bool isSocketOpen() const;
    const Identity& identity() const { return identity_; }
    const ConnectionConfig& config() const { return config_; }

private:
    // Number, encode and send one packet on the live link.
    expected<void> sendPacket(protocol::OutboundPayload payload);

    // Block until @p link is connected or torn down.
    EndReason waitForConnection(const SessionLink& link, StatusSubscription& status);

    Identity identity_;
    ConnectionConfig config_;

    std::shared_ptr<net::asio::io_context> io_;
    std::shared_ptr<StatusBroadcast> broadcast_;
    std::shared_ptr<SessionState> session_;
    SensorRegistry sensors_;
};

} // namespace slimetrack::tracker
