#include "slimetrack/tracker/SensorRegistry.hpp"

#include "slimetrack/core/Error.hpp"
#include "slimetrack/log/Log.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"

namespace slimetrack::tracker {

expected<void> SensorRegistry::add(protocol::ImuType type,
                                   protocol::SensorStatus status,
                                   const Announce& announce) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sensors_.size() >= config::MAX_SENSORS) {
        logError("[SensorRegistry] cannot add more than ", config::MAX_SENSORS, " sensors\n");
        return unexpected(Errc::SensorLimitReached);
    }

    const Sensor sensor{static_cast<std::uint8_t>(sensors_.size()), type, status};
    auto announced = announce ? announce(sensor) : expected<void>{};
    sensors_.push_back(sensor);
    return announced;
}

std::vector<Sensor> SensorRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sensors_;
}

std::size_t SensorRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sensors_.size();
}

} // namespace slimetrack::tracker
