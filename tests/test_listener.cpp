#include <cassert>
#include <sstream>
#include <string>

#include "../src/core/router.hpp"
#include "../src/listener/udp_listener.hpp"
#include "../src/sinks/console_sink.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::ManualClock;

int main() {
    ManualClock clock;
    std::ostringstream out;
    ConsoleSink sink(out, SinkOptions(), clock);
    Router router({&sink});
    UdpListener listener(router, []() { return 1500000000.25; });

    listener.handle_datagram("metrics: {\"value\": 1}");
    assert(listener.stats().accepted == 1);
    assert(router.stats().accepted == 1);
    assert(out.str() == "metrics: {\"timestamp\":1500000000.25,\"value\":1}\n");

    // A provided timestamp is left exactly as sent.
    out.str("");
    listener.handle_datagram("metrics: {\"timestamp\": \"1379002018.000\"}\n");
    assert(out.str() == "metrics: {\"timestamp\":\"1379002018.000\"}\n");

    out.str("");
    listener.handle_datagram("bad-cat: {}");
    assert(listener.stats().invalid_category == 1);
    listener.handle_datagram("metrics: [1]");
    listener.handle_datagram("metrics: {");
    assert(listener.stats().invalid_payload == 2);
    assert(out.str().empty());
    assert(router.stats().accepted == 2);
    assert(listener.stats().received == 5);
    return 0;
}
