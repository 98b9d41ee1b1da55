#include "slimetrack/protocol/ProtocolTypes.hpp"

namespace slimetrack::protocol {

const char* toString(BoardType type) {
    switch (type) {
        case BoardType::Unknown:            return "unknown";
        case BoardType::SlimeVRLegacy:      return "slimevr-legacy";
        case BoardType::SlimeVRDev:         return "slimevr-dev";
        case BoardType::NodeMCU:            return "nodemcu";
        case BoardType::Custom:             return "custom";
        case BoardType::WRoom32:            return "wroom32";
        case BoardType::WemosD1Mini:        return "wemos-d1-mini";
        case BoardType::TTGOTBase:          return "ttgo-tbase";
        case BoardType::ESP01:              return "esp01";
        case BoardType::SlimeVR:            return "slimevr";
        case BoardType::LolinC3Mini:        return "lolin-c3-mini";
        case BoardType::Beetle32C3:         return "beetle32c3";
        case BoardType::ESP32C3DevKitM1:    return "esp32c3-devkitm1";
        case BoardType::OwoTrack:           return "owotrack";
        case BoardType::Wrangler:           return "wrangler";
        case BoardType::Mocopi:             return "mocopi";
        case BoardType::WemosWroom02:       return "wemos-wroom02";
        case BoardType::XiaoEsp32C3:        return "xiao-esp32c3";
        case BoardType::Haritora:           return "haritora";
        case BoardType::ESP32C6DevKitC1:    return "esp32c6-devkitc1";
        case BoardType::GloveImuSlimeVRDev: return "glove-imu-slimevr-dev";
        case BoardType::Gestures:           return "gestures";
        case BoardType::DevReserved:        return "dev-reserved";
    }
    return "unknown";
}

const char* toString(McuType type) {
    switch (type) {
        case McuType::Unknown:         return "unknown";
        case McuType::Esp8266:         return "esp8266";
        case McuType::Esp32:           return "esp32";
        case McuType::OwoTrackAndroid: return "owotrack-android";
        case McuType::Wrangler:        return "wrangler";
        case McuType::OwoTrackIos:     return "owotrack-ios";
        case McuType::Esp32C3:         return "esp32c3";
        case McuType::Mocopi:          return "mocopi";
        case McuType::Haritora:        return "haritora";
        case McuType::DevReserved:     return "dev-reserved";
    }
    return "unknown";
}

const char* toString(ImuType type) {
    switch (type) {
        case ImuType::Unknown:       return "unknown";
        case ImuType::Mpu9250:       return "mpu9250";
        case ImuType::Mpu6500:       return "mpu6500";
        case ImuType::Bno080:        return "bno080";
        case ImuType::Bno085:        return "bno085";
        case ImuType::Bno055:        return "bno055";
        case ImuType::Mpu6050:       return "mpu6050";
        case ImuType::Bno086:        return "bno086";
        case ImuType::Bmi160:        return "bmi160";
        case ImuType::Icm20948:      return "icm20948";
        case ImuType::Icm42688:      return "icm42688";
        case ImuType::Bmi270:        return "bmi270";
        case ImuType::Lsm6ds3trc:    return "lsm6ds3trc";
        case ImuType::Lsm6dsv:       return "lsm6dsv";
        case ImuType::Lsm6dso:       return "lsm6dso";
        case ImuType::Lsm6dsr:       return "lsm6dsr";
        case ImuType::Icm45686:      return "icm45686";
        case ImuType::Icm45605:      return "icm45605";
        case ImuType::AdcResistance: return "adc-resistance";
        case ImuType::DevReserved:   return "dev-reserved";
    }
    return "unknown";
}

const char* toString(SensorStatus status) {
    switch (status) {
        case SensorStatus::Offline: return "offline";
        case SensorStatus::Ok:      return "ok";
    }
    return "unknown";
}

const char* toString(SensorDataType type) {
    switch (type) {
        case SensorDataType::Normal:     return "normal";
        case SensorDataType::Correction: return "correction";
    }
    return "unknown";
}

const char* toString(ActionType action) {
    switch (action) {
        case ActionType::Reset:         return "reset";
        case ActionType::ResetYaw:      return "reset-yaw";
        case ActionType::ResetMounting: return "reset-mounting";
        case ActionType::PauseTracking: return "pause-tracking";
    }
    return "unknown";
}

} // namespace slimetrack::protocol
