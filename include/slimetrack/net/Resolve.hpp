#pragma once
#include "slimetrack/net/NetConfig.hpp"

#include <cstdint>
#include <string>

namespace slimetrack::net {

/**
 * resolve_udp
 *
 * Synchronous lookup of the server endpoint. Dotted quads (including the
 * 255.255.255.255 broadcast default) are parsed directly; anything else goes
 * through the resolver and the first IPv4 result wins, since the tracker
 * socket is IPv4-only.
 */
inline error_code resolve_udp(
    asio::io_context& io,
    const std::string& host,
    std::uint16_t port,
    udp::endpoint& out)
{
    error_code ec;
    auto address = asio::ip::make_address_v4(host, ec);
    if (!ec) {
        out = udp::endpoint(address, port);
        return {};
    }

    udp::resolver resolver(io);
    auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec) {
        return ec;
    }
    for (const auto& entry : results) {
        out = entry.endpoint();
        return {};
    }
    return asio::error::host_not_found;
}

} // namespace slimetrack::net
