#pragma once

#include "slimetrack/protocol/ProtocolTypes.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <variant>

namespace slimetrack::protocol {

using Challenge = std::array<std::uint8_t, 4>;
using MacAddress = std::array<std::uint8_t, 6>;

/**
 * Packet type identifiers, first field of every framed datagram.
 * The two directions number their packets independently.
 */
enum class ServerBoundType : std::uint32_t {
    Heartbeat = 0,
    Handshake = 3,
    Acceleration = 4,
    Ping = 10,
    Battery = 12,
    SensorInfo = 15,
    RotationData = 17,
    MagAccuracy = 18,
    SignalStrength = 19,
    Temperature = 20,
    UserAction = 21
};

enum class ClientBoundType : std::uint32_t {
    Discovery = 0,
    Heartbeat = 1,
    HandshakeResponse = 3,
    Ping = 10
};

// --- Payloads sent in both directions ---------------------------------------
struct Heartbeat {};

struct Ping {
    Challenge challenge{};
};

// --- Tracker -> server --------------------------------------------------------
struct Handshake {
    BoardType board = BoardType::Unknown;
    ImuType imu = ImuType::Unknown;
    McuType mcu = McuType::Unknown;
    std::array<std::int32_t, 3> imuInfo{};
    std::int32_t build = 0;
    std::string firmware;
    MacAddress mac{};
};

struct Acceleration {
    Vector3 vector{};
    std::uint8_t sensorId = 0;
};

struct Battery {
    float voltage = 0.0f;
    float percentage = 0.0f;
};

struct SensorInfo {
    std::uint8_t sensorId = 0;
    SensorStatus sensorStatus = SensorStatus::Ok;
    ImuType sensorType = ImuType::Unknown;
};

struct RotationData {
    std::uint8_t sensorId = 0;
    SensorDataType dataType = SensorDataType::Normal;
    Quaternion quat{};
    std::uint8_t calibrationInfo = 0;
};

struct MagAccuracy {
    std::uint8_t sensorId = 0;
    float accuracy = 0.0f;
};

struct SignalStrength {
    std::uint8_t sensorId = 0;
    std::int8_t strength = 0;
};

struct Temperature {
    std::uint8_t sensorId = 0;
    float temperature = 0.0f;
};

struct UserAction {
    ActionType action = ActionType::Reset;
};

// --- Server -> tracker --------------------------------------------------------
struct Discovery {};

struct HandshakeResponse {
    std::uint32_t serverVersion = 0;
};

// Any well-formed framed packet whose type the tracker does not handle.
struct Unknown {
    std::uint32_t packetType = 0;
};

using OutboundPayload = std::variant<
    Heartbeat,
    Handshake,
    Acceleration,
    Ping,
    Battery,
    SensorInfo,
    RotationData,
    MagAccuracy,
    SignalStrength,
    Temperature,
    UserAction>;

using InboundPayload = std::variant<
    Discovery,
    Heartbeat,
    Ping,
    HandshakeResponse,
    Unknown>;

struct OutboundPacket {
    std::uint64_t sequence = 0;
    OutboundPayload payload;
};

// The handshake response frame carries no sequence number; it decodes as 0.
struct InboundPacket {
    std::uint64_t sequence = 0;
    InboundPayload payload;
};

} // namespace slimetrack::protocol
