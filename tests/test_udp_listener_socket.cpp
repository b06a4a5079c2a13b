#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstring>
#include <sstream>
#include <string>

#include "../src/core/reactor.hpp"
#include "../src/core/router.hpp"
#include "../src/listener/udp_listener.hpp"
#include "../src/sinks/console_sink.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::ManualClock;

static void send_datagram(int port, const std::string& payload) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    assert(fd >= 0);
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(static_cast<uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &dst.sin_addr);
    ssize_t n = ::sendto(fd, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst));
    assert(n == static_cast<ssize_t>(payload.size()));
    ::close(fd);
}

int main() {
    ManualClock clock;
    std::ostringstream out;
    ConsoleSink sink(out, SinkOptions(), clock);
    Router router({&sink});
    Reactor reactor;
    if (!reactor.valid()) return 1;
    UdpListener listener(router);
    if (!listener.bind("127.0.0.1", 0)) return 2;
    if (!listener.attach(reactor)) return 3;
    int port = listener.local_port();
    if (port <= 0) return 4;

    send_datagram(port, "first: {\"n\": 1, \"timestamp\": 1.0}");
    send_datagram(port, "not valid");
    send_datagram(port, "second: {\"n\": 2, \"timestamp\": 2.0}");

    for (int i = 0; i < 50 && listener.stats().received < 3; ++i) reactor.loop_once(100);
    if (listener.stats().received != 3) return 5;
    if (listener.stats().accepted != 2) return 6;
    if (listener.stats().invalid_category != 1) return 7;
    if (out.str() != "first: {\"n\":1,\"timestamp\":1.0}\nsecond: {\"n\":2,\"timestamp\":2.0}\n") return 8;

    listener.stop();
    return 0;
}
