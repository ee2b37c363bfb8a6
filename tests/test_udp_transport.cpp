#include "lumen/log/Log.hpp"
#include "lumen/net/NetService.hpp"
#include "lumen/net/UdpTransport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

using namespace lumen;
using namespace lumen::net;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lumen::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lumen::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

using Clock = std::chrono::steady_clock;

// Local receiver on 127.0.0.1, polled without blocking so a lost datagram
// fails the test instead of hanging it.
struct Receiver {
    asio::io_context io;
    udp::socket socket{io};

    Receiver() {
        socket.open(udp::v4());
        socket.bind(udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        socket.non_blocking(true);
    }

    unsigned short port() const { return socket.local_endpoint().port(); }

    bool receive(std::vector<std::uint8_t>& out, std::chrono::milliseconds timeout) {
        const auto deadline = Clock::now() + timeout;
        std::vector<std::uint8_t> buffer(2048);
        udp::endpoint from;
        while (Clock::now() < deadline) {
            error_code ec;
            const std::size_t n = socket.receive_from(asio::buffer(buffer), from, 0, ec);
            if (!ec) {
                out.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
                return true;
            }
            if (ec != asio::error::would_block && ec != asio::error::try_again) {
                lumen::logError("[test] receive failed: ", ec.message(), "\n");
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }
};

static void testLoopbackDelivery() {
    Receiver receiver;
    UdpTransport transport;
    const output::Destination destination{"127.0.0.1", receiver.port()};

    for (std::uint8_t frame = 1; frame <= 3; ++frame) {
        const std::vector<std::uint8_t> sent{0x41, 0x44, frame, 0xFF};
        transport.send(sent.data(), sent.size(), destination);

        std::vector<std::uint8_t> got;
        ASSERT_TRUE(receiver.receive(got, std::chrono::milliseconds(2000)), "datagram arrives");
        ASSERT_TRUE(got == sent, "payload bytes intact and in order");
    }

    ASSERT_EQ(transport.lookups(), static_cast<std::size_t>(0), "literal address needs no lookup");
    ASSERT_EQ(transport.droppedSends(), static_cast<std::size_t>(0), "nothing dropped");
    ASSERT_EQ(transport.failedSends(), static_cast<std::size_t>(0), "no send failures");
}

static void testSharedService() {
    auto service = std::make_shared<NetService>("shared");
    Receiver receiver;
    const output::Destination destination{"127.0.0.1", receiver.port()};

    {
        UdpTransport first(service);
        UdpTransport second(service);
        const std::vector<std::uint8_t> a{0x01, 0x02};
        const std::vector<std::uint8_t> b{0x03, 0x04, 0x05};
        first.send(a.data(), a.size(), destination);
        std::vector<std::uint8_t> got;
        ASSERT_TRUE(receiver.receive(got, std::chrono::milliseconds(2000)), "first transport delivers");
        ASSERT_TRUE(got == a, "first payload");

        second.send(b.data(), b.size(), destination);
        ASSERT_TRUE(receiver.receive(got, std::chrono::milliseconds(2000)), "second transport delivers");
        ASSERT_TRUE(got == b, "second payload");
    }

    // The service outlives both transports and still runs work.
    UdpTransport third(service);
    const std::vector<std::uint8_t> c{0x06};
    third.send(c.data(), c.size(), destination);
    std::vector<std::uint8_t> got;
    ASSERT_TRUE(receiver.receive(got, std::chrono::milliseconds(2000)), "service reused after transports close");
    ASSERT_TRUE(got == c, "third payload");
}

static void testFailedLookupIsRetried() {
    UdpTransport transport;
    transport.setResolveRetryInterval(std::chrono::milliseconds(0));
    const output::Destination destination{"lumen-host.invalid", 6454};
    const std::vector<std::uint8_t> payload{0x00};

    // Never blocks the caller: the first datagram is dropped while the name is looked up.
    const auto before = Clock::now();
    transport.send(payload.data(), payload.size(), destination);
    ASSERT_TRUE(Clock::now() - before < std::chrono::milliseconds(500), "send returns without waiting on DNS");
    ASSERT_EQ(transport.droppedSends(), static_cast<std::size_t>(1), "unresolved datagram dropped");
    ASSERT_EQ(transport.lookups(), static_cast<std::size_t>(1), "one lookup started");

    const auto deadline = Clock::now() + std::chrono::seconds(15);
    while (transport.lookups() < 2 && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        transport.send(payload.data(), payload.size(), destination);
    }
    ASSERT_TRUE(transport.lookups() >= 2, "failed name is looked up again");
    ASSERT_TRUE(transport.droppedSends() >= 2, "datagrams keep dropping while unresolved");
    ASSERT_EQ(transport.failedSends(), static_cast<std::size_t>(0), "nothing reached the socket");
}

int main() {
    testLoopbackDelivery();
    testSharedService();
    testFailedLookupIsRetried();

    if (g_failures) {
        lumen::logError("Tests failed: ", g_failures, "\n");
        return 1;
    }
    lumen::logInfo("All UDP transport tests passed.\n");
    return 0;
}
