#include "slimetrack/protocol/PacketFormat.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <variant>

namespace slimetrack::protocol {
namespace {

const char* nameOf(const Heartbeat&)         { return "heartbeat"; }
const char* nameOf(const Handshake&)         { return "handshake"; }
const char* nameOf(const Acceleration&)      { return "acceleration"; }
const char* nameOf(const Ping&)              { return "ping"; }
const char* nameOf(const Battery&)           { return "battery"; }
const char* nameOf(const SensorInfo&)        { return "sensor-info"; }
const char* nameOf(const RotationData&)      { return "rotation-data"; }
const char* nameOf(const MagAccuracy&)       { return "mag-accuracy"; }
const char* nameOf(const SignalStrength&)    { return "signal-strength"; }
const char* nameOf(const Temperature&)       { return "temperature"; }
const char* nameOf(const UserAction&)        { return "user-action"; }
const char* nameOf(const Discovery&)         { return "discovery"; }
const char* nameOf(const HandshakeResponse&) { return "handshake-response"; }
const char* nameOf(const Unknown&)           { return "unknown"; }

template<std::size_t N>
std::string hexOf(const std::array<std::uint8_t, N>& bytes) {
    return toHexLine(bytes.data(), bytes.size());
}

// Fields only; the caller prints the sequence and name.
void body(std::ostream&, const Heartbeat&) {}
void body(std::ostream&, const Discovery&) {}

void body(std::ostream& os, const Ping& p) {
    os << " challenge=" << hexOf(p.challenge);
}

void body(std::ostream& os, const Handshake& h) {
    os << " board=" << toString(h.board)
       << " mcu=" << toString(h.mcu)
       << " imu=" << toString(h.imu)
       << " build=" << h.build
       << " firmware=\"" << h.firmware << "\""
       << " mac=" << formatMac(h.mac);
}

void body(std::ostream& os, const Acceleration& a) {
    os << " sensor=" << +a.sensorId
       << " vector=(" << a.vector.x << ", " << a.vector.y << ", " << a.vector.z << ")";
}

void body(std::ostream& os, const Battery& b) {
    os << " voltage=" << b.voltage << " percentage=" << b.percentage;
}

void body(std::ostream& os, const SensorInfo& s) {
    os << " sensor=" << +s.sensorId
       << " status=" << toString(s.sensorStatus)
       << " type=" << toString(s.sensorType);
}

void body(std::ostream& os, const RotationData& r) {
    os << " sensor=" << +r.sensorId
       << " data=" << toString(r.dataType)
       << " quat=(" << r.quat.x << ", " << r.quat.y << ", " << r.quat.z << ", " << r.quat.w << ")"
       << " accuracy=" << +r.calibrationInfo;
}

void body(std::ostream& os, const MagAccuracy& m) {
    os << " sensor=" << +m.sensorId << " accuracy=" << m.accuracy;
}

void body(std::ostream& os, const SignalStrength& s) {
    os << " sensor=" << +s.sensorId << " strength=" << +s.strength;
}

void body(std::ostream& os, const Temperature& t) {
    os << " sensor=" << +t.sensorId << " temperature=" << t.temperature;
}

void body(std::ostream& os, const UserAction& u) {
    os << " action=" << toString(u.action);
}

void body(std::ostream& os, const HandshakeResponse& r) {
    os << " version=" << r.serverVersion;
}

void body(std::ostream& os, const Unknown& u) {
    os << " type=" << u.packetType;
}

template<class Packet>
std::string describePacket(const Packet& packet) {
    std::ostringstream os;
    os << '#' << packet.sequence << ' ';
    std::visit([&](const auto& p) {
        os << nameOf(p);
        body(os, p);
    }, packet.payload);
    return os.str();
}

} // namespace

const char* packetName(const OutboundPayload& payload) {
    return std::visit([](const auto& p) { return nameOf(p); }, payload);
}

const char* packetName(const InboundPayload& payload) {
    return std::visit([](const auto& p) { return nameOf(p); }, payload);
}

std::string describe(const OutboundPacket& packet) {
    return describePacket(packet);
}

std::string describe(const InboundPacket& packet) {
    return describePacket(packet);
}

std::string formatMac(const MacAddress& mac) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < mac.size(); ++i) {
        if (i) os << ':';
        os << std::setw(2) << static_cast<int>(mac[i]);
    }
    return os.str();
}

std::string toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

std::string toHexLine(::slimetrack::schema::ByteView bytes) {
    return toHexLine(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

} // namespace slimetrack::protocol
