#include <cassert>
#include <sstream>

#include "../src/sinks/console_sink.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::ManualClock;

int main() {
    ManualClock clock;
    std::ostringstream out;
    ConsoleSink sink(out, SinkOptions(), clock);
    assert(sink.state() == SinkState::Connected);

    sink.offer(std::make_shared<const Event>("metrics", nlohmann::json{{"value", 1}}));
    sink.offer(std::make_shared<const Event>("other", nlohmann::json{{"a", "b"}}));
    assert(out.str() == "metrics: {\"value\":1}\nother: {\"a\":\"b\"}\n");
    assert(sink.stats().sent == 2);
    assert(sink.backlog().empty());
    assert(sink.backoff_level() == 0);

    sink.disconnect();
    sink.connect();
    assert(sink.state() == SinkState::Connected);
    return 0;
}
