#pragma once

// Standalone Asio, no Boost.
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace slimetrack::net {

/**
 * @brief Networking aliases so higher-level code never spells out Asio types.
 *
 * Exposes:
 * - `slimetrack::net::asio` as the standalone Asio namespace.
 * - `slimetrack::net::udp` for the only protocol the tracker speaks.
 * - `error_code` and `milliseconds` used across the transport helpers.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace slimetrack::net
