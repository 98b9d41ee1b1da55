#pragma once

#include "slimetrack/core/Expected.hpp"
#include "slimetrack/protocol/Packets.hpp"

#include <string>

namespace slimetrack::tracker {

/**
 * @brief What the tracker claims to be in every handshake.
 */
struct Identity {
    protocol::MacAddress mac{};
    std::string firmwareVersion;
    protocol::BoardType board = protocol::BoardType::Unknown;
    protocol::McuType mcu = protocol::McuType::Unknown;

    /// The firmware string travels with a one byte length prefix, so it must
    /// be 1-255 printable ASCII characters.
    expected<void, std::string> validate() const;

    /// Handshake announcing this identity (IMU unknown, build 13).
    protocol::Handshake handshake() const;
};

} // namespace slimetrack::tracker
