#include "lumen/net/UdpTransport.hpp"

#include <utility>
#include <vector>

#include "lumen/log/Log.hpp"
#include "lumen/net/Resolve.hpp"

namespace lumen::net {

namespace {
// Log the first failure and then every Nth, so a dead controller does not flood the log.
constexpr std::size_t FAILURE_LOG_INTERVAL = 1000;

using Clock = std::chrono::steady_clock;

enum class RouteStatus {
    Unknown,
    Pending,
    Ready,
    Failed
};

struct Route {
    RouteStatus status = RouteStatus::Unknown;
    udp::endpoint endpoint;
    Clock::time_point retryAt;
};
} // namespace

struct UdpTransport::State {
    explicit State(asio::io_context& io)
    : socket(io)
    , resolver(io) {}

    // Touched only on the service thread once the transport is constructed.
    udp::socket socket;
    udp::resolver resolver;

    std::mutex mutex;
    std::map<std::string, Route> routes;
    std::chrono::milliseconds retryInterval = RESOLVE_RETRY_INTERVAL_DEFAULT;

    std::atomic<std::size_t> failures{0};
    std::atomic<std::size_t> dropped{0};
    std::atomic<std::size_t> lookups{0};
};

UdpTransport::UdpTransport(std::shared_ptr<NetService> service)
: service_(service ? std::move(service) : std::make_shared<NetService>("udp"))
, state_(std::make_shared<State>(service_->context())) {
    error_code ec;
    state_->socket.open(udp::v4(), ec);
    if (ec) {
        logError("[UdpTransport] socket open failed: ", ec.message(), "\n");
        return;
    }
    state_->socket.set_option(asio::socket_base::broadcast(true), ec);
    if (ec) {
        logWarning("[UdpTransport] broadcast not enabled: ", ec.message(), "\n");
    }
}

UdpTransport::~UdpTransport() {
    auto state = state_;
    asio::post(service_->context(), [state] {
        error_code ignore;
        state->resolver.cancel();
        state->socket.close(ignore);
    });
}

void UdpTransport::setResolveRetryInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->retryInterval = interval;
}

std::size_t UdpTransport::failedSends() const {
    return state_->failures.load(std::memory_order_relaxed);
}

std::size_t UdpTransport::droppedSends() const {
    return state_->dropped.load(std::memory_order_relaxed);
}

std::size_t UdpTransport::lookups() const {
    return state_->lookups.load(std::memory_order_relaxed);
}

bool UdpTransport::routeFor(const output::Destination& destination, udp::endpoint& out) {
    const std::string key = destination.host + ":" + std::to_string(destination.port);

    std::lock_guard<std::mutex> lock(state_->mutex);
    Route& route = state_->routes[key];
    switch (route.status) {
        case RouteStatus::Ready:
            out = route.endpoint;
            return true;
        case RouteStatus::Pending:
            return false;
        case RouteStatus::Failed:
            if (Clock::now() < route.retryAt) return false;
            break;
        case RouteStatus::Unknown:
            break;
    }

    if (parseEndpoint(destination.host, destination.port, route.endpoint)) {
        route.status = RouteStatus::Ready;
        out = route.endpoint;
        return true;
    }

    route.status = RouteStatus::Pending;
    startLookup(key, destination);
    return false;
}

void UdpTransport::startLookup(const std::string& key, const output::Destination& destination) {
    state_->lookups.fetch_add(1, std::memory_order_relaxed);

    auto state = state_;
    asio::post(service_->context(), [state, key, destination] {
        resolveAsync(state->resolver, destination.host, destination.port,
            [state, key](const error_code& ec, udp::resolver::results_type results) {
                std::lock_guard<std::mutex> lock(state->mutex);
                Route& route = state->routes[key];
                if (ec || results.empty()) {
                    route.status = RouteStatus::Failed;
                    route.retryAt = Clock::now() + state->retryInterval;
                    if (ec != asio::error::operation_aborted) {
                        logError("[UdpTransport] cannot resolve ", key, ": ",
                                 ec ? ec.message() : std::string("no addresses"), "\n");
                    }
                    return;
                }
                route.status = RouteStatus::Ready;
                route.endpoint = results.begin()->endpoint();
                logInfo("[UdpTransport] ", key, " resolved to ",
                        route.endpoint.address().to_string(), "\n");
            });
    });
}

void UdpTransport::send(const std::uint8_t* data, std::size_t size, const output::Destination& destination) {
    udp::endpoint endpoint;
    if (!routeFor(destination, endpoint)) {
        state_->dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto payload = std::make_shared<std::vector<std::uint8_t>>(data, data + size);
    auto state = state_;

    asio::post(service_->context(), [state, payload, endpoint] {
        if (!state->socket.is_open()) {
            state->dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        state->socket.async_send_to(asio::buffer(*payload), endpoint,
            [state, payload, endpoint](const error_code& ec, std::size_t) {
                if (!ec) return;
                const auto count = state->failures.fetch_add(1, std::memory_order_relaxed);
                if (count % FAILURE_LOG_INTERVAL == 0) {
                    logWarning("[UdpTransport] send to ", endpoint.address().to_string(), ":",
                               endpoint.port(), " failed: ", ec.message(),
                               " (", count + 1, " failure(s))\n");
                }
            });
    });
}

} // namespace lumen::net
