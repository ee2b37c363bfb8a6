#include "lumen/net/NetService.hpp"

#include <exception>
#include <utility>

#include "lumen/log/Log.hpp"

namespace lumen::net {

NetService::NetService(std::string name)
: name_(std::move(name))
, workGuard_(asio::make_work_guard(io_))
{
    thread_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                return;
            } catch (const std::exception& e) {
                logError("[NetService] ", name_, ": handler threw: ", e.what(), "\n");
            }
        }
    });
}

NetService::~NetService() {
    workGuard_.reset();
    if (thread_.joinable()) thread_.join();
}

} // namespace lumen::net
