#pragma once

#include <memory>
#include <string>
#include <thread>

#include "lumen/net/NetConfig.hpp"

namespace lumen::net {

/**
 * @brief Owns an `asio::io_context` and the thread that runs it.
 *
 * Transports post all socket and resolver work here, so the output loop
 * hands a datagram over and returns without touching the network. One
 * service may be shared by several transports through `std::shared_ptr`;
 * a transport created without one makes its own.
 *
 * The destructor releases the work guard and joins, so handlers already
 * queued (final sends, socket close) still run before the context goes away.
 */
class NetService {
public:
    explicit NetService(std::string name = "net");
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    asio::io_context& context() { return io_; }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

} // namespace lumen::net
