#pragma once
// Field schemas for every packet payload (wire order, big-endian).
// Framing (packet type + sequence number) lives in PacketCodec.

#include <array>
#include <cstdint>

#include "slimetrack/protocol/Packets.hpp"
#include "slimetrack/schema/Schema.hpp"

namespace slimetrack::protocol::wire {

namespace lsch = ::slimetrack::schema;

// --- Frame header ---
struct FrameHeader {
    std::uint32_t packetType = 0;
    std::uint64_t sequence = 0;
};

inline const auto frameHeaderSchema = lsch::makeSchema<FrameHeader>(std::make_tuple(
    lsch::field<&FrameHeader::packetType>("packetType", lsch::BeU32{}),
    lsch::field<&FrameHeader::sequence  >("sequence"  , lsch::BeU64{})
));

constexpr std::size_t FRAME_HEADER_SIZE = sizeof(std::uint32_t) + sizeof(std::uint64_t);

// --- Compound codecs ---
struct Vec3F32 {
    using value_type = Vector3;

    lsch::expected<value_type, lsch::CodecError>
    read(lsch::ByteView& s, const char* where) const {
        value_type v;
        for (float* c : {&v.x, &v.y, &v.z}) {
            auto f = lsch::BeF32{}.read(s, where);
            if (!f) return lsch::unexpected<lsch::CodecError>(f.error());
            *c = *f;
        }
        return v;
    }
    void write(const value_type& v, lsch::Bytes& out) const {
        for (float c : {v.x, v.y, v.z}) lsch::BeF32{}.write(c, out);
    }
};

// Quaternion on the wire is x, y, z, w.
struct QuatF32 {
    using value_type = Quaternion;

    lsch::expected<value_type, lsch::CodecError>
    read(lsch::ByteView& s, const char* where) const {
        value_type q;
        for (float* c : {&q.x, &q.y, &q.z, &q.w}) {
            auto f = lsch::BeF32{}.read(s, where);
            if (!f) return lsch::unexpected<lsch::CodecError>(f.error());
            *c = *f;
        }
        return q;
    }
    void write(const value_type& q, lsch::Bytes& out) const {
        for (float c : {q.x, q.y, q.z, q.w}) lsch::BeF32{}.write(c, out);
    }
};

struct I32Triple {
    using value_type = std::array<std::int32_t, 3>;

    lsch::expected<value_type, lsch::CodecError>
    read(lsch::ByteView& s, const char* where) const {
        value_type out{};
        for (auto& c : out) {
            auto v = lsch::BeI32{}.read(s, where);
            if (!v) return lsch::unexpected<lsch::CodecError>(v.error());
            c = *v;
        }
        return out;
    }
    void write(const value_type& v, lsch::Bytes& out) const {
        for (auto c : v) lsch::BeI32{}.write(c, out);
    }
};

// --- Validators for closed enum ranges ---
using SensorStatusRange = lsch::EnumRange<SensorStatus  , 0, 1>;
using DataTypeRange     = lsch::EnumRange<SensorDataType, 1, 2>;
using FirmwareLength    = lsch::AsciiLength<1, 255>;

// --- Payloads shared by both directions ---
inline const auto heartbeatSchema = lsch::makeEmptySchema<Heartbeat>();
inline const auto discoverySchema = lsch::makeEmptySchema<Discovery>();

inline const auto pingSchema = lsch::makeSchema<Ping>(std::make_tuple(
    lsch::field<&Ping::challenge>("challenge", lsch::FixedBytes<4>{})
));

// --- Tracker -> server ---
inline const auto handshakeSchema = lsch::makeSchema<Handshake>(std::make_tuple(
    lsch::field<&Handshake::board   >("board"   , lsch::BeI32{}),
    lsch::field<&Handshake::imu     >("imu"     , lsch::BeI32{}),
    lsch::field<&Handshake::mcu     >("mcu"     , lsch::BeI32{}),
    lsch::field<&Handshake::imuInfo >("imuInfo" , I32Triple{}),
    lsch::field<&Handshake::build   >("build"   , lsch::BeI32{}),
    lsch::field<&Handshake::firmware>("firmware", lsch::ShortAscii{}, FirmwareLength{}),
    lsch::field<&Handshake::mac     >("mac"     , lsch::FixedBytes<6>{})
));

inline const auto accelerationSchema = lsch::makeSchema<Acceleration>(std::make_tuple(
    lsch::field<&Acceleration::vector  >("vector"  , Vec3F32{}),
    lsch::field<&Acceleration::sensorId>("sensorId", lsch::BeU8{})
));

inline const auto batterySchema = lsch::makeSchema<Battery>(std::make_tuple(
    lsch::field<&Battery::voltage   >("voltage"   , lsch::BeF32{}),
    lsch::field<&Battery::percentage>("percentage", lsch::BeF32{})
));

// Sensor type is one byte here, unlike the 32-bit IMU tag in the handshake.
inline const auto sensorInfoSchema = lsch::makeSchema<SensorInfo>(std::make_tuple(
    lsch::field<&SensorInfo::sensorId    >("sensorId"    , lsch::BeU8{}),
    lsch::field<&SensorInfo::sensorStatus>("sensorStatus", lsch::BeU8{}, SensorStatusRange{}),
    lsch::field<&SensorInfo::sensorType  >("sensorType"  , lsch::BeU8{})
));

inline const auto rotationDataSchema = lsch::makeSchema<RotationData>(std::make_tuple(
    lsch::field<&RotationData::sensorId       >("sensorId"       , lsch::BeU8{}),
    lsch::field<&RotationData::dataType       >("dataType"       , lsch::BeU8{}, DataTypeRange{}),
    lsch::field<&RotationData::quat           >("quat"           , QuatF32{}),
    lsch::field<&RotationData::calibrationInfo>("calibrationInfo", lsch::BeU8{})
));

inline const auto magAccuracySchema = lsch::makeSchema<MagAccuracy>(std::make_tuple(
    lsch::field<&MagAccuracy::sensorId>("sensorId", lsch::BeU8{}),
    lsch::field<&MagAccuracy::accuracy>("accuracy", lsch::BeF32{})
));

inline const auto signalStrengthSchema = lsch::makeSchema<SignalStrength>(std::make_tuple(
    lsch::field<&SignalStrength::sensorId>("sensorId", lsch::BeU8{}),
    lsch::field<&SignalStrength::strength>("strength", lsch::BeI8{})
));

inline const auto temperatureSchema = lsch::makeSchema<Temperature>(std::make_tuple(
    lsch::field<&Temperature::sensorId   >("sensorId"   , lsch::BeU8{}),
    lsch::field<&Temperature::temperature>("temperature", lsch::BeF32{})
));

inline const auto userActionSchema = lsch::makeSchema<UserAction>(std::make_tuple(
    lsch::field<&UserAction::action>("action", lsch::BeU8{})
));

// --- Legacy handshake response frame ---
constexpr std::uint8_t HANDSHAKE_RESPONSE_LEAD = 0x03;
constexpr char HANDSHAKE_RESPONSE_TEXT[] = "Hey OVR =D";

} // namespace slimetrack::protocol::wire
