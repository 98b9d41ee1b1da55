#include "slimetrack/protocol/PacketCodec.hpp"
#include "slimetrack/protocol/PacketFormat.hpp"
#include "support/TestMacros.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

using namespace slimetrack::protocol;

static std::vector<std::uint8_t> toU8(const Bytes& bytes) {
    std::vector<std::uint8_t> out;
    for (auto b : bytes) out.push_back(static_cast<std::uint8_t>(b));
    return out;
}

static Bytes frame(std::initializer_list<int> raw) {
    Bytes out;
    for (int v : raw) out.push_back(static_cast<std::byte>(v));
    return out;
}

static void appendText(Bytes& out, const std::string& text) {
    for (char c : text) out.push_back(static_cast<std::byte>(c));
}

static void testHeartbeatFrame() {
    auto bytes = encode(OutboundPacket{7, Heartbeat{}});
    ASSERT_TRUE(bytes.has_value(), "heartbeat encodes");
    const auto raw = toU8(*bytes);
    ASSERT_EQ(raw.size(), std::size_t(12), "heartbeat is header only");
    ASSERT_EQ(raw[3], 0, "heartbeat type 0");
    ASSERT_EQ(raw[11], 7, "sequence low byte");
    ASSERT_EQ(raw[4], 0, "sequence high byte");
}

static void testHandshakeLayout() {
    Handshake h;
    h.board = BoardType::Custom;
    h.imu = ImuType::Unknown;
    h.mcu = McuType::Esp32;
    h.build = 13;
    h.firmware = "emu-1";
    h.mac = {0x11, 0x22, 0x33, 0x44, 0x55, 0x66};

    auto bytes = encode(OutboundPacket{0, h});
    ASSERT_TRUE(bytes.has_value(), "handshake encodes");
    const auto raw = toU8(*bytes);
    ASSERT_EQ(raw.size(), std::size_t(12 + 12 + 12 + 4 + 1 + 5 + 6), "handshake size");
    ASSERT_EQ(raw[3], 3, "handshake type 3");
    ASSERT_EQ(raw[15], 4, "board tag");
    ASSERT_EQ(raw[19], 0, "imu tag");
    ASSERT_EQ(raw[23], 2, "mcu tag");
    ASSERT_EQ(raw[39], 13, "build number");
    ASSERT_EQ(raw[40], 5, "firmware length prefix");
    ASSERT_EQ(raw[41], 'e', "firmware text");
    ASSERT_EQ(raw[46], 0x11, "mac first byte");
    ASSERT_EQ(raw[51], 0x66, "mac last byte");

    auto back = decodeOutbound(ByteView(*bytes));
    ASSERT_TRUE(back.has_value(), "handshake decodes on the server side");
    if (back) {
        const auto* hs = std::get_if<Handshake>(&back->payload);
        ASSERT_TRUE(hs != nullptr, "decoded payload is a handshake");
        if (hs) {
            ASSERT_TRUE(hs->firmware == "emu-1", "firmware survives");
            ASSERT_TRUE(hs->board == BoardType::Custom, "board survives");
            ASSERT_TRUE(hs->mac == h.mac, "mac survives");
        }
    }
}

static void testRotationLayout() {
    RotationData r;
    r.sensorId = 2;
    r.dataType = SensorDataType::Correction;
    r.quat = Quaternion{0.0f, 0.0f, 0.0f, 1.0f};
    r.calibrationInfo = 3;

    auto bytes = encode(OutboundPacket{1, r});
    ASSERT_TRUE(bytes.has_value(), "rotation encodes");
    const auto raw = toU8(*bytes);
    ASSERT_EQ(raw.size(), std::size_t(31), "rotation size");
    ASSERT_EQ(raw[3], 17, "rotation type 17");
    ASSERT_EQ(raw[12], 2, "sensor id");
    ASSERT_EQ(raw[13], 2, "data type correction");
    ASSERT_EQ(raw[26], 0x3F, "w = 1.0f, byte 0");
    ASSERT_EQ(raw[27], 0x80, "w = 1.0f, byte 1");
    ASSERT_EQ(raw[30], 3, "calibration info");
}

static void testSmallPayloads() {
    auto signal = encode(OutboundPacket{2, SignalStrength{1, -55}});
    ASSERT_TRUE(signal.has_value(), "signal strength encodes");
    if (signal) {
        const auto raw = toU8(*signal);
        ASSERT_EQ(raw[3], 19, "signal strength type");
        ASSERT_EQ(raw[13], 0xC9, "negative strength as two's complement");
    }

    auto info = encode(OutboundPacket{3, SensorInfo{4, SensorStatus::Ok, ImuType::Bno085}});
    ASSERT_TRUE(info.has_value(), "sensor info encodes");
    if (info) {
        const auto raw = toU8(*info);
        ASSERT_EQ(raw.size(), std::size_t(15), "sensor info size");
        ASSERT_EQ(raw[3], 15, "sensor info type");
        ASSERT_EQ(raw[14], 4, "imu tag as one byte");
    }

    auto battery = encode(OutboundPacket{4, Battery{3.7f, 0.5f}});
    ASSERT_TRUE(battery.has_value(), "battery encodes");
    if (battery) {
        const auto raw = toU8(*battery);
        ASSERT_EQ(raw[3], 12, "battery type");
        ASSERT_EQ(raw[16], 0x3F, "percentage 0.5f after voltage");
        ASSERT_EQ(raw[17], 0x00, "percentage 0.5f byte 1");
    }

    auto action = encode(OutboundPacket{5, UserAction{ActionType::ResetYaw}});
    ASSERT_TRUE(action.has_value(), "user action encodes");
    if (action) {
        const auto raw = toU8(*action);
        ASSERT_EQ(raw.size(), std::size_t(13), "user action size");
        ASSERT_EQ(raw[12], 3, "reset-yaw value");
    }
}

static void testEncodeRejectsBadFields() {
    Handshake h;
    h.firmware = "";
    auto empty = encode(OutboundPacket{0, h});
    ASSERT_TRUE(!empty.has_value(), "empty firmware rejected");
    if (!empty) ASSERT_TRUE(empty.error().where == "firmware", "error names the firmware field");

    h.firmware = std::string(256, 'x');
    ASSERT_TRUE(!encode(OutboundPacket{0, h}).has_value(), "256 char firmware rejected");

    SensorInfo bad{0, static_cast<SensorStatus>(7), ImuType::Unknown};
    auto status = encode(OutboundPacket{1, bad});
    ASSERT_TRUE(!status.has_value(), "out of range sensor status rejected");
}

static void testDecodeServerPackets() {
    auto ping = decodeInbound(ByteView(frame({0, 0, 0, 10, 0, 0, 0, 0, 0, 0, 0, 9, 1, 2, 3, 4})));
    ASSERT_TRUE(ping.has_value(), "ping decodes");
    if (ping) {
        ASSERT_EQ(ping->sequence, std::uint64_t(9), "ping sequence");
        const auto* p = std::get_if<Ping>(&ping->payload);
        ASSERT_TRUE(p && p->challenge == (Challenge{1, 2, 3, 4}), "ping challenge");
    }

    auto heartbeat = decodeInbound(ByteView(frame({0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 1})));
    ASSERT_TRUE(heartbeat && std::holds_alternative<Heartbeat>(heartbeat->payload), "server heartbeat is type 1");

    auto discovery = decodeInbound(ByteView(frame({0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})));
    ASSERT_TRUE(discovery && std::holds_alternative<Discovery>(discovery->payload), "type 0 is discovery");

    auto unknown = decodeInbound(ByteView(frame({0, 0, 0, 42, 0, 0, 0, 0, 0, 0, 0, 3, 0xAA})));
    ASSERT_TRUE(unknown.has_value(), "unknown type is not an error");
    if (unknown) {
        const auto* u = std::get_if<Unknown>(&unknown->payload);
        ASSERT_TRUE(u && u->packetType == 42, "unknown keeps its type");
    }
}

static void testHandshakeResponseFrame() {
    Bytes raw = frame({0x03});
    appendText(raw, "Hey OVR =D 5");
    auto response = decodeInbound(ByteView(raw));
    ASSERT_TRUE(response.has_value(), "handshake response decodes");
    if (response) {
        ASSERT_EQ(response->sequence, std::uint64_t(0), "no sequence in handshake response");
        const auto* r = std::get_if<HandshakeResponse>(&response->payload);
        ASSERT_TRUE(r && r->serverVersion == 5, "server version parsed");
    }

    auto encoded = encode(InboundPacket{0, HandshakeResponse{17}});
    ASSERT_TRUE(encoded.has_value(), "handshake response encodes");
    if (encoded) {
        const auto bytes = toU8(*encoded);
        ASSERT_EQ(bytes[0], 0x03, "leading byte");
        ASSERT_TRUE(std::string(bytes.begin() + 1, bytes.end()) == "Hey OVR =D 17", "greeting text");
    }

    Bytes wrong = frame({0x03});
    appendText(wrong, "Hello there!");
    ASSERT_TRUE(!decodeInbound(ByteView(wrong)).has_value(), "wrong greeting rejected");
}

static void testDecodeRejectsTruncation() {
    auto shortHeader = decodeInbound(ByteView(frame({0, 0, 0, 10, 0})));
    ASSERT_TRUE(!shortHeader.has_value(), "truncated header rejected");
    if (!shortHeader) ASSERT_TRUE(shortHeader.error().where == "sequence", "error names the sequence field");

    auto shortPing = decodeInbound(ByteView(frame({0, 0, 0, 10, 0, 0, 0, 0, 0, 0, 0, 1, 1, 2})));
    ASSERT_TRUE(!shortPing.has_value(), "truncated ping rejected");
    if (!shortPing) ASSERT_TRUE(shortPing.error().where == "challenge", "error names the challenge field");

    ASSERT_TRUE(!decodeInbound(ByteView()).has_value(), "empty datagram rejected");
    ASSERT_TRUE(!decodeOutbound(ByteView(frame({0, 0, 0, 99, 0, 0, 0, 0, 0, 0, 0, 1}))).has_value(),
                "unknown server-bound type rejected");
}

static void testStampAndDescribe() {
    auto bytes = encode(OutboundPacket{0, Ping{{1, 2, 3, 4}}});
    ASSERT_TRUE(bytes.has_value(), "ping encodes");
    if (!bytes) return;
    ASSERT_TRUE(stampSequence(*bytes, 0x0102), "stamp succeeds");
    const auto raw = toU8(*bytes);
    ASSERT_EQ(raw[10], 0x01, "stamped sequence byte 10");
    ASSERT_EQ(raw[11], 0x02, "stamped sequence byte 11");
    ASSERT_EQ(raw[12], 0x01, "payload untouched");

    Bytes tiny = frame({0, 1});
    ASSERT_TRUE(!stampSequence(tiny, 1), "stamp refuses short buffers");

    const auto text = describe(OutboundPacket{12, Ping{{1, 2, 3, 4}}});
    ASSERT_TRUE(text == "#12 ping challenge=01 02 03 04", "describe ping");
    ASSERT_TRUE(toHexLine(ByteView(frame({0xAB, 0x01}))) == "ab 01", "hex line");
    ASSERT_EQ(packetType(OutboundPayload{Battery{}}), std::uint32_t(12), "battery type id");
    ASSERT_EQ(packetType(InboundPayload{Heartbeat{}}), std::uint32_t(1), "client heartbeat type id");
}

int main() {
    testHeartbeatFrame();
    testHandshakeLayout();
    testRotationLayout();
    testSmallPayloads();
    testEncodeRejectsBadFields();
    testDecodeServerPackets();
    testHandshakeResponseFrame();
    testDecodeRejectsTruncation();
    testStampAndDescribe();
    return reportAndExit("Packet codec");
}
