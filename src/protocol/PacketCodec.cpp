#include "slimetrack/protocol/PacketCodec.hpp"
#include "slimetrack/protocol/packet_schema.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace slimetrack::protocol {
namespace {

namespace lsch = ::slimetrack::schema;

// Payload -> schema, one overload per payload struct.
const auto& schemaOf(const Heartbeat&)      { return wire::heartbeatSchema; }
const auto& schemaOf(const Discovery&)      { return wire::discoverySchema; }
const auto& schemaOf(const Ping&)           { return wire::pingSchema; }
const auto& schemaOf(const Handshake&)      { return wire::handshakeSchema; }
const auto& schemaOf(const Acceleration&)   { return wire::accelerationSchema; }
const auto& schemaOf(const Battery&)        { return wire::batterySchema; }
const auto& schemaOf(const SensorInfo&)     { return wire::sensorInfoSchema; }
const auto& schemaOf(const RotationData&)   { return wire::rotationDataSchema; }
const auto& schemaOf(const MagAccuracy&)    { return wire::magAccuracySchema; }
const auto& schemaOf(const SignalStrength&) { return wire::signalStrengthSchema; }
const auto& schemaOf(const Temperature&)    { return wire::temperatureSchema; }
const auto& schemaOf(const UserAction&)     { return wire::userActionSchema; }

constexpr std::uint32_t raw(ServerBoundType t) { return static_cast<std::uint32_t>(t); }
constexpr std::uint32_t raw(ClientBoundType t) { return static_cast<std::uint32_t>(t); }

std::uint32_t outboundType(const Heartbeat&)      { return raw(ServerBoundType::Heartbeat); }
std::uint32_t outboundType(const Handshake&)      { return raw(ServerBoundType::Handshake); }
std::uint32_t outboundType(const Acceleration&)   { return raw(ServerBoundType::Acceleration); }
std::uint32_t outboundType(const Ping&)           { return raw(ServerBoundType::Ping); }
std::uint32_t outboundType(const Battery&)        { return raw(ServerBoundType::Battery); }
std::uint32_t outboundType(const SensorInfo&)     { return raw(ServerBoundType::SensorInfo); }
std::uint32_t outboundType(const RotationData&)   { return raw(ServerBoundType::RotationData); }
std::uint32_t outboundType(const MagAccuracy&)    { return raw(ServerBoundType::MagAccuracy); }
std::uint32_t outboundType(const SignalStrength&) { return raw(ServerBoundType::SignalStrength); }
std::uint32_t outboundType(const Temperature&)    { return raw(ServerBoundType::Temperature); }
std::uint32_t outboundType(const UserAction&)     { return raw(ServerBoundType::UserAction); }

std::uint32_t inboundType(const Discovery&)         { return raw(ClientBoundType::Discovery); }
std::uint32_t inboundType(const Heartbeat&)         { return raw(ClientBoundType::Heartbeat); }
std::uint32_t inboundType(const Ping&)              { return raw(ClientBoundType::Ping); }
std::uint32_t inboundType(const HandshakeResponse&) { return raw(ClientBoundType::HandshakeResponse); }
std::uint32_t inboundType(const Unknown& u)         { return u.packetType; }

codec_expected<Bytes> writeHeader(std::uint32_t type, std::uint64_t sequence) {
    Bytes out;
    out.reserve(64);
    const wire::FrameHeader header{type, sequence};
    if (auto ok = lsch::encodeInto(wire::frameHeaderSchema, header, out); !ok) {
        return lsch::unexpected<CodecError>(ok.error());
    }
    return out;
}

template<class Payload>
codec_expected<Bytes> encodeFramed(std::uint32_t type, std::uint64_t sequence, const Payload& payload) {
    auto out = writeHeader(type, sequence);
    if (!out) return out;
    if (auto ok = lsch::encodeInto(schemaOf(payload), payload, *out); !ok) {
        return lsch::unexpected<CodecError>(ok.error());
    }
    return out;
}

template<class Payload, class Packet>
codec_expected<Packet> decodePayload(std::uint64_t sequence, ByteView& rest) {
    auto payload = lsch::decodeFrom(schemaOf(Payload{}), rest);
    if (!payload) return lsch::unexpected<CodecError>(payload.error());
    return Packet{sequence, std::move(*payload)};
}

constexpr std::size_t HANDSHAKE_TEXT_LEN = sizeof(wire::HANDSHAKE_RESPONSE_TEXT) - 1;

bool isHandshakeResponse(ByteView bytes) {
    return !bytes.empty() && bytes.at(0) == wire::HANDSHAKE_RESPONSE_LEAD;
}

// 0x03 "Hey OVR =D" [' '] [digits...]; anything after the digits is ignored.
codec_expected<InboundPacket> decodeHandshakeResponse(ByteView bytes) {
    if (bytes.size() < 1 + HANDSHAKE_TEXT_LEN) {
        return lsch::unexpected<CodecError>({"handshakeResponse", "frame truncated"});
    }
    for (std::size_t i = 0; i < HANDSHAKE_TEXT_LEN; ++i) {
        if (bytes.at(1 + i) != static_cast<std::uint8_t>(wire::HANDSHAKE_RESPONSE_TEXT[i])) {
            return lsch::unexpected<CodecError>({"handshakeResponse", "bad greeting text"});
        }
    }

    std::size_t pos = 1 + HANDSHAKE_TEXT_LEN;
    while (pos < bytes.size() && bytes.at(pos) == ' ') ++pos;

    std::uint64_t version = 0;
    for (int digits = 0; pos < bytes.size() && digits < 10; ++pos, ++digits) {
        const auto c = bytes.at(pos);
        if (c < '0' || c > '9') break;
        version = version * 10 + (c - '0');
    }
    if (version > 0xFFFFFFFFull) {
        return lsch::unexpected<CodecError>({"handshakeResponse", "server version out of range"});
    }

    return InboundPacket{0, HandshakeResponse{static_cast<std::uint32_t>(version)}};
}

codec_expected<wire::FrameHeader> readHeader(ByteView& rest) {
    return lsch::decodeFrom(wire::frameHeaderSchema, rest);
}

} // namespace

std::uint32_t packetType(const OutboundPayload& payload) {
    return std::visit([](const auto& p) { return outboundType(p); }, payload);
}

std::uint32_t packetType(const InboundPayload& payload) {
    return std::visit([](const auto& p) { return inboundType(p); }, payload);
}

bool stampSequence(Bytes& frame, std::uint64_t sequence) {
    if (frame.size() < wire::FRAME_HEADER_SIZE) {
        return false;
    }
    constexpr std::size_t offset = sizeof(std::uint32_t);
    for (std::size_t i = 0; i < sizeof(sequence); ++i) {
        const auto shift = 8 * (sizeof(sequence) - 1 - i);
        frame[offset + i] = static_cast<std::byte>((sequence >> shift) & 0xFFu);
    }
    return true;
}

codec_expected<Bytes> encode(const OutboundPacket& packet) {
    return std::visit([&](const auto& payload) {
        return encodeFramed(outboundType(payload), packet.sequence, payload);
    }, packet.payload);
}

codec_expected<Bytes> encode(const InboundPacket& packet) {
    return std::visit([&](const auto& payload) -> codec_expected<Bytes> {
        using P = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<P, HandshakeResponse>) {
            Bytes out;
            out.push_back(static_cast<std::byte>(wire::HANDSHAKE_RESPONSE_LEAD));
            const std::string text = std::string(wire::HANDSHAKE_RESPONSE_TEXT) + " "
                + std::to_string(payload.serverVersion);
            for (char c : text) out.push_back(static_cast<std::byte>(c));
            return out;
        } else if constexpr (std::is_same_v<P, Unknown>) {
            return writeHeader(payload.packetType, packet.sequence);
        } else {
            return encodeFramed(inboundType(payload), packet.sequence, payload);
        }
    }, packet.payload);
}

codec_expected<InboundPacket> decodeInbound(ByteView bytes) {
    if (isHandshakeResponse(bytes)) {
        return decodeHandshakeResponse(bytes);
    }

    ByteView rest = bytes;
    auto header = readHeader(rest);
    if (!header) return lsch::unexpected<CodecError>(header.error());

    switch (static_cast<ClientBoundType>(header->packetType)) {
        case ClientBoundType::Discovery:
            return decodePayload<Discovery, InboundPacket>(header->sequence, rest);
        case ClientBoundType::Heartbeat:
            return decodePayload<Heartbeat, InboundPacket>(header->sequence, rest);
        case ClientBoundType::Ping:
            return decodePayload<Ping, InboundPacket>(header->sequence, rest);
        case ClientBoundType::HandshakeResponse:
            // Framed form carries no version text.
            return InboundPacket{header->sequence, HandshakeResponse{}};
    }
    return InboundPacket{header->sequence, Unknown{header->packetType}};
}

codec_expected<OutboundPacket> decodeOutbound(ByteView bytes) {
    ByteView rest = bytes;
    auto header = readHeader(rest);
    if (!header) return lsch::unexpected<CodecError>(header.error());

    const auto seq = header->sequence;
    switch (static_cast<ServerBoundType>(header->packetType)) {
        case ServerBoundType::Heartbeat:      return decodePayload<Heartbeat, OutboundPacket>(seq, rest);
        case ServerBoundType::Handshake:      return decodePayload<Handshake, OutboundPacket>(seq, rest);
        case ServerBoundType::Acceleration:   return decodePayload<Acceleration, OutboundPacket>(seq, rest);
        case ServerBoundType::Ping:           return decodePayload<Ping, OutboundPacket>(seq, rest);
        case ServerBoundType::Battery:        return decodePayload<Battery, OutboundPacket>(seq, rest);
        case ServerBoundType::SensorInfo:     return decodePayload<SensorInfo, OutboundPacket>(seq, rest);
        case ServerBoundType::RotationData:   return decodePayload<RotationData, OutboundPacket>(seq, rest);
        case ServerBoundType::MagAccuracy:    return decodePayload<MagAccuracy, OutboundPacket>(seq, rest);
        case ServerBoundType::SignalStrength: return decodePayload<SignalStrength, OutboundPacket>(seq, rest);
        case ServerBoundType::Temperature:    return decodePayload<Temperature, OutboundPacket>(seq, rest);
        case ServerBoundType::UserAction:     return decodePayload<UserAction, OutboundPacket>(seq, rest);
    }
    return lsch::unexpected<CodecError>({"packetType",
        "unsupported server-bound type " + std::to_string(header->packetType)});
}

} // namespace slimetrack::protocol
