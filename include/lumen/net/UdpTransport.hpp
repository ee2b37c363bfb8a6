#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "lumen/net/NetConfig.hpp"
#include "lumen/net/NetService.hpp"
#include "lumen/output/OutputPacketSpec.hpp"

namespace lumen::net {

/**
 * @brief Fire-and-forget UDP packet sink.
 *
 * send() copies the datagram and posts an async_send_to to the NetService
 * thread, so the caller (the output loop) never blocks on the network.
 *
 * Destinations:
 * - Literal addresses are used directly.
 * - Names are looked up asynchronously on the service thread. Datagrams for a
 *   destination still being looked up are dropped; the next frame carries
 *   fresh colours anyway.
 * - A failed lookup is retried after the retry interval, so a controller that
 *   appears on the network later is picked up without a restart.
 *
 * Send failures are logged (throttled) and the datagram is dropped.
 */
class UdpTransport : public output::PacketSink {
public:
    /// Runs on @p service, or on a service of its own when none is given.
    explicit UdpTransport(std::shared_ptr<NetService> service = nullptr);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    void send(const std::uint8_t* data, std::size_t size, const output::Destination& destination) override;

    void setResolveRetryInterval(std::chrono::milliseconds interval);

    /// Datagrams whose send failed on the socket.
    std::size_t failedSends() const;
    /// Datagrams dropped because their destination had no address yet.
    std::size_t droppedSends() const;
    /// Name lookups started (literal addresses never count).
    std::size_t lookups() const;

private:
    struct State;

    bool routeFor(const output::Destination& destination, udp::endpoint& out);
    void startLookup(const std::string& key, const output::Destination& destination);

    std::shared_ptr<NetService> service_;
    // Shared with queued handlers; destroyed on the service thread when the last one finishes.
    std::shared_ptr<State> state_;
};

} // namespace lumen::net
