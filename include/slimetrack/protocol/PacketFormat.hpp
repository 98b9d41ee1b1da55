#pragma once

#include "slimetrack/protocol/Packets.hpp"
#include "slimetrack/schema/Schema.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace slimetrack::protocol {

// Packet names as used in log lines ("heartbeat", "rotation-data", ...).
const char* packetName(const OutboundPayload& payload);
const char* packetName(const InboundPayload& payload);

/// One-line human readable summary, e.g. `#12 ping challenge=01 02 03 04`.
std::string describe(const OutboundPacket& packet);
std::string describe(const InboundPacket& packet);

/// `aa:bb:cc:dd:ee:ff`
std::string formatMac(const MacAddress& mac);

/// Space separated lowercase hex bytes, empty for empty input.
std::string toHexLine(const std::uint8_t* data, std::size_t size);
std::string toHexLine(::slimetrack::schema::ByteView bytes);

} // namespace slimetrack::protocol
