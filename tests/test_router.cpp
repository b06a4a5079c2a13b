#include <cassert>
#include <memory>
#include <stdexcept>

#include "../src/core/router.hpp"
#include "../src/sinks/broker_sink.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::FakeBrokerClient;
using udplogd_test::make_event;
using udplogd_test::ManualClock;

namespace {
class ThrowingSink : public Sink {
   public:
    explicit ThrowingSink(const Clock& clock) : Sink("throwing", SinkOptions(), clock) {}

   protected:
    void start_connect(uint64_t) override {}
    void start_send(uint64_t, size_t) override {}
    void close_connection() override {}
    bool accepts(const Event&) const override { throw std::runtime_error("boom"); }
};
}  // namespace

int main() {
    ManualClock clock;
    auto up_client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* up = up_client.get();
    auto down_client = std::make_unique<FakeBrokerClient>();
    down_client->open_ok = false;

    BrokerSink connected("up", SinkOptions(), 5, std::move(up_client), clock);
    BrokerSink backing_off("down", SinkOptions(), 5, std::move(down_client), clock);
    ThrowingSink throwing(clock);
    connected.connect();
    backing_off.connect();
    assert(backing_off.state() == SinkState::Backoff);

    Router router({&throwing, &connected, &backing_off});
    EventPtr ev = make_event("metrics", 1);
    router.accept(ev);

    // Every sink saw the event once, whatever the others did.
    assert(router.stats().accepted == 1);
    assert(router.stats().sink_errors == 1);
    assert(throwing.stats().offered == 1);
    assert(connected.stats().offered == 1);
    assert(up->published.size() == 1);
    assert(up->published[0] == *ev);
    assert(backing_off.stats().offered == 1);
    assert(backing_off.backlog().size() == 1);
    assert(backing_off.backlog().front().event == ev);

    router.poll();
    assert(router.stats().sink_errors == 1);
    return 0;
}
