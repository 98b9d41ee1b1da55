#pragma once

#include "slimetrack/protocol/Packets.hpp"
#include "slimetrack/schema/Schema.hpp"

#include <cstdint>

namespace slimetrack::protocol {

using ::slimetrack::schema::ByteView;
using ::slimetrack::schema::Bytes;
using ::slimetrack::schema::CodecError;

template<class T>
using codec_expected = ::slimetrack::schema::expected<T, CodecError>;

/**
 * @brief Wire codec for the tracker protocol.
 *
 * Framed packets are `u32 type | u64 sequence | payload`, big-endian. The
 * server's handshake response is the one exception: a 0x03 byte followed by
 * the text "Hey OVR =D" and the server's protocol version, without sequence.
 *
 * Trailing bytes after a complete payload are ignored; a missing byte
 * anywhere is a CodecError naming the field that ran short.
 */

/// Tracker side: serialize a packet for the server.
codec_expected<Bytes> encode(const OutboundPacket& packet);

/// Tracker side: parse a datagram received from the server. Unhandled
/// packet types become `Unknown`, not errors.
codec_expected<InboundPacket> decodeInbound(ByteView bytes);

/// Server side (fake servers, capture tools): serialize a server packet.
codec_expected<Bytes> encode(const InboundPacket& packet);

/// Server side: parse a datagram sent by a tracker.
codec_expected<OutboundPacket> decodeOutbound(ByteView bytes);

/// Rewrite the sequence field of an already encoded framed packet, so a
/// payload can be validated before a sequence number is spent on it.
/// Returns false when @p frame is shorter than a frame header.
bool stampSequence(Bytes& frame, std::uint64_t sequence);

std::uint32_t packetType(const OutboundPayload& payload);
std::uint32_t packetType(const InboundPayload& payload);

} // namespace slimetrack::protocol
