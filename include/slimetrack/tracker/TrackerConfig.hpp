#pragma once

#include "slimetrack/core/Expected.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace slimetrack::tracker {

namespace config {

/**
 * @brief Protocol and timing constants for the emulated tracker.
 *
 * Per-instance settings live in ConnectionConfig; the values below are either
 * its defaults or fixed by the firmware protocol.
 */

// Networking ------------------------------------------------------------------
constexpr const char* DEFAULT_SERVER_ADDRESS = "255.255.255.255";
constexpr std::uint16_t DEFAULT_SERVER_PORT = 6969;
constexpr std::size_t RECEIVE_BUFFER_SIZE = 1024;

// Session timing --------------------------------------------------------------
constexpr std::chrono::milliseconds DEFAULT_SERVER_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_SEND_TIMEOUT{1000};
constexpr std::chrono::milliseconds DISCOVERY_INTERVAL{1000};
constexpr std::chrono::milliseconds HEARTBEAT_INTERVAL{1000};

// Handshake -------------------------------------------------------------------
constexpr std::int32_t HANDSHAKE_BUILD = 13;
constexpr std::uint64_t HANDSHAKE_SEQUENCE = 0;

// Sensor ids are a single byte on the wire.
constexpr std::size_t MAX_SENSORS = 256;

} // namespace config

/**
 * @brief Where the tracker connects and how patient it is.
 *
 * Fixed at tracker construction. `serverAddress` may be a dotted quad
 * (including the broadcast default) or a host name resolved on every init().
 */
struct ConnectionConfig {
    std::string serverAddress = config::DEFAULT_SERVER_ADDRESS;
    std::uint16_t serverPort = config::DEFAULT_SERVER_PORT;
    std::chrono::milliseconds serverTimeout = config::DEFAULT_SERVER_TIMEOUT;
    bool debug = false;
    std::chrono::milliseconds sendTimeout = config::DEFAULT_SEND_TIMEOUT;

    /// Empty on success, otherwise the first problem found.
    expected<void, std::string> validate() const;
};

} // namespace slimetrack::tracker
