#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "lumen/net/NetConfig.hpp"

namespace lumen::net {

/**
 * parseEndpoint
 *
 * Builds an endpoint from a literal address ("10.0.0.2", "239.255.0.1")
 * without touching DNS. Returns false when @p host is a name.
 */
inline bool parseEndpoint(const std::string& host, std::uint16_t port, udp::endpoint& out) {
    error_code ec;
    const auto address = asio::ip::make_address(host, ec);
    if (ec) {
        return false;
    }
    out = udp::endpoint(address, port);
    return true;
}

/**
 * resolveAsync
 *
 * IPv4 name lookup for a UDP destination. Must be called on the thread
 * running the resolver's io_context; @p handler receives
 * `(const error_code&, udp::resolver::results_type)` on that thread.
 */
template <typename Handler>
void resolveAsync(udp::resolver& resolver,
                  const std::string& host,
                  std::uint16_t port,
                  Handler&& handler)
{
    resolver.async_resolve(udp::v4(), host, std::to_string(port), std::forward<Handler>(handler));
}

} // namespace lumen::net
