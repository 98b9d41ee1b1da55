#pragma once

#include "slimetrack/core/Expected.hpp"
#include "slimetrack/protocol/ProtocolTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace slimetrack::tracker {

struct Sensor {
    std::uint8_t sensorId = 0;
    protocol::ImuType sensorType = protocol::ImuType::Unknown;
    protocol::SensorStatus sensorStatus = protocol::SensorStatus::Ok;
};

/**
 * @brief Append-only list of virtual sensors.
 *
 * Ids are assigned in registration order starting at 0 and are never reused.
 * The registry outlives sessions: ids keep counting across deinit()/init().
 */
class SensorRegistry {
public:
    using Announce = std::function<expected<void>(const Sensor&)>;

    /// Assign the next id, announce the sensor, then append it whether or not
    /// the announce succeeded. Returns the announce result, or
    /// Errc::SensorLimitReached (nothing appended) once every id is taken.
    /// Registrations are serialized, announce included.
    expected<void> add(protocol::ImuType type, protocol::SensorStatus status, const Announce& announce);

    std::vector<Sensor> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Sensor> sensors_;
};

} // namespace slimetrack::tracker
