#pragma once

#include <asio.hpp>       // standalone Asio (ASIO_STANDALONE)
#include <chrono>
#include <system_error>   // std::error_code

namespace lumen::net {

/**
 * @brief Networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `lumen::net::asio` as the standalone Asio namespace.
 * - `lumen::net::udp` for the datagram transport.
 * - `lumen::net::error_code` (Asio reports std::error_code in standalone mode).
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;

// Wait before a destination whose name lookup failed is looked up again.
constexpr std::chrono::milliseconds RESOLVE_RETRY_INTERVAL_DEFAULT{5000};

} // namespace lumen::net
