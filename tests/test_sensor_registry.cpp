#include "slimetrack/core/Error.hpp"
#include "slimetrack/tracker/SensorRegistry.hpp"
#include "slimetrack/tracker/TrackerConfig.hpp"
#include "support/TestMacros.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace slimetrack;
using namespace slimetrack::tracker;

static void testIdsInOrder() {
    SensorRegistry registry;
    std::vector<std::uint8_t> announced;
    auto announce = [&announced](const Sensor& s) -> expected<void> {
        announced.push_back(s.sensorId);
        return {};
    };

    ASSERT_TRUE(registry.add(protocol::ImuType::Bno085, protocol::SensorStatus::Ok, announce).has_value(), "first");
    ASSERT_TRUE(registry.add(protocol::ImuType::Bmi160, protocol::SensorStatus::Ok, announce).has_value(), "second");
    ASSERT_EQ(registry.size(), std::size_t(2), "two sensors");
    ASSERT_EQ(announced.size(), std::size_t(2), "both announced");
    ASSERT_TRUE(announced.size() == 2 && announced[0] == 0 && announced[1] == 1, "ids count up from 0");

    const auto sensors = registry.snapshot();
    ASSERT_TRUE(sensors.size() == 2 && sensors[1].sensorType == protocol::ImuType::Bmi160, "type kept");
}

static void testFailedAnnounceStillRegisters() {
    SensorRegistry registry;
    auto ok = registry.add(protocol::ImuType::Bno085, protocol::SensorStatus::Ok,
        [](const Sensor&) -> expected<void> { return unexpected(Errc::SendFailed); });
    ASSERT_TRUE(!ok.has_value() && ok.error() == Errc::SendFailed, "announce error returned");
    ASSERT_EQ(registry.size(), std::size_t(1), "sensor appended anyway");

    ASSERT_TRUE(registry.add(protocol::ImuType::Bno085, protocol::SensorStatus::Ok, {}).has_value(),
                "no announcer is fine");
    const auto sensors = registry.snapshot();
    ASSERT_TRUE(sensors.size() == 2 && sensors[1].sensorId == 1, "failed announce still used its id");
}

static void testLimitReached() {
    SensorRegistry registry;
    int announces = 0;
    auto announce = [&announces](const Sensor&) -> expected<void> {
        ++announces;
        return {};
    };

    for (std::size_t i = 0; i < config::MAX_SENSORS; ++i) {
        if (!registry.add(protocol::ImuType::Icm20948, protocol::SensorStatus::Ok, announce)) {
            ASSERT_TRUE(false, "sensor under the limit accepted");
            break;
        }
    }
    ASSERT_EQ(registry.size(), config::MAX_SENSORS, "every id taken");
    ASSERT_EQ(registry.snapshot().back().sensorId, std::uint8_t(255), "last id is 255");

    auto full = registry.add(protocol::ImuType::Icm20948, protocol::SensorStatus::Ok, announce);
    ASSERT_TRUE(!full.has_value(), "one sensor too many");
    if (!full) {
        ASSERT_TRUE(full.error() == Errc::SensorLimitReached, "limit error code");
        ASSERT_TRUE(full.error() == ErrorKind::Precondition, "limit is a precondition failure");
    }
    ASSERT_EQ(announces, 256, "nothing announced past the limit");
    ASSERT_EQ(registry.size(), config::MAX_SENSORS, "nothing appended past the limit");
}

int main() {
    testIdsInOrder();
    testFailedAnnounceStillRegisters();
    testLimitReached();
    return reportAndExit("Sensor registry");
}
