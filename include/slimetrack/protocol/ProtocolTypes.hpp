#pragma once

#include <cstdint>

namespace slimetrack::protocol {

/**
 * @brief Hardware tags announced in the handshake and sensor-info packets.
 *
 * The enumerations are open: any raw value received or configured is carried
 * through unchanged, and only the named values have a readable name.
 */
enum class BoardType : std::int32_t {
    Unknown = 0,
    SlimeVRLegacy = 1,
    SlimeVRDev = 2,
    NodeMCU = 3,
    Custom = 4,
    WRoom32 = 5,
    WemosD1Mini = 6,
    TTGOTBase = 7,
    ESP01 = 8,
    SlimeVR = 9,
    LolinC3Mini = 10,
    Beetle32C3 = 11,
    ESP32C3DevKitM1 = 12,
    OwoTrack = 13,
    Wrangler = 14,
    Mocopi = 15,
    WemosWroom02 = 16,
    XiaoEsp32C3 = 17,
    Haritora = 18,
    ESP32C6DevKitC1 = 19,
    GloveImuSlimeVRDev = 20,
    Gestures = 21,
    DevReserved = 250
};

enum class McuType : std::int32_t {
    Unknown = 0,
    Esp8266 = 1,
    Esp32 = 2,
    OwoTrackAndroid = 3,
    Wrangler = 4,
    OwoTrackIos = 5,
    Esp32C3 = 6,
    Mocopi = 7,
    Haritora = 8,
    DevReserved = 250
};

enum class ImuType : std::int32_t {
    Unknown = 0,
    Mpu9250 = 1,
    Mpu6500 = 2,
    Bno080 = 3,
    Bno085 = 4,
    Bno055 = 5,
    Mpu6050 = 6,
    Bno086 = 7,
    Bmi160 = 8,
    Icm20948 = 9,
    Icm42688 = 10,
    Bmi270 = 11,
    Lsm6ds3trc = 12,
    Lsm6dsv = 13,
    Lsm6dso = 14,
    Lsm6dsr = 15,
    Icm45686 = 16,
    Icm45605 = 17,
    AdcResistance = 18,
    DevReserved = 250
};

enum class SensorStatus : std::uint8_t {
    Offline = 0,
    Ok = 1
};

enum class SensorDataType : std::uint8_t {
    Normal = 1,
    Correction = 2
};

enum class ActionType : std::uint8_t {
    Reset = 2,
    ResetYaw = 3,
    ResetMounting = 4,
    PauseTracking = 5
};

const char* toString(BoardType type);
const char* toString(McuType type);
const char* toString(ImuType type);
const char* toString(SensorStatus status);
const char* toString(SensorDataType type);
const char* toString(ActionType action);

struct Quaternion {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 1.0f;
};

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

} // namespace slimetrack::protocol
