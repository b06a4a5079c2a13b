#include <cassert>
#include <memory>

#include "../src/sinks/broker_sink.hpp"
#include "../src/supervisor/supervisor.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::FakeBrokerClient;
using udplogd_test::make_event;
using udplogd_test::ManualClock;

static void reconnect_schedule() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->open_ok = false;
    SinkOptions opts;
    opts.backoff.initial_ms = 1000;
    opts.backoff.max_ms = 4000;
    BrokerSink sink("broker", opts, 5, std::move(client), clock);
    Supervisor sup({&sink}, clock);

    // Disconnected sinks are connected right away.
    sup.check();
    assert(fake->opens == 1);
    assert(sink.state() == SinkState::Backoff && sink.backoff_level() == 1);

    // Nothing happens until the retry time.
    clock.advance_ms(999);
    sup.check();
    assert(fake->opens == 1);
    clock.advance_ms(1);
    sup.check();
    assert(fake->opens == 2);
    assert(sink.backoff_level() == 2);

    clock.advance_ms(2000);
    fake->open_ok = true;
    sup.check();
    assert(fake->opens == 3);
    assert(sink.state() == SinkState::Connected);

    // Connected sinks are left alone.
    sup.check();
    assert(fake->opens == 3);
    assert(sup.connect_attempts() == 3);
}

// A sink backing off at shutdown gets one connect attempt and flushes.
static void drain_reconnects_backed_off_sink() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->open_ok = false;
    BrokerSink sink("broker", SinkOptions(), 5, std::move(client), clock);
    Supervisor sup({&sink}, clock);
    sup.check();
    assert(sink.state() == SinkState::Backoff);
    sink.offer(make_event("c", 1));
    sink.offer(make_event("c", 2));

    fake->open_ok = true;
    int steps = 0;
    assert(sup.drain(2000, [&]() { ++steps; }));
    assert(steps == 0);
    assert(fake->published.size() == 2);
    assert(sink.backlog().empty());
    assert(sink.state() == SinkState::Disconnected);
}

// A connect that never finishes is waited for until the deadline, then the
// sink is forced down with its events still queued.
static void drain_waits_for_connecting_sink_until_deadline() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->open_answers = false;
    BrokerSink sink("broker", SinkOptions(), 5, std::move(client), clock);
    Supervisor sup({&sink}, clock);
    sink.offer(make_event("c", 1));
    sink.offer(make_event("c", 2));
    sup.check();
    assert(sink.state() == SinkState::Connecting);
    assert(!sink.drained());

    int steps = 0;
    bool clean = sup.drain(2000, [&]() {
        ++steps;
        sup.check();
        clock.advance_ms(100);
    });
    assert(!clean);
    assert(steps == 20);
    assert(fake->opens == 1);
    assert(sink.state() == SinkState::Disconnected);
    assert(sink.backlog().size() == 2);
}

// A failed drain attempt ends the wait at once; no further reconnects.
static void failed_drain_attempt_is_final() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->open_ok = false;
    BrokerSink sink("broker", SinkOptions(), 5, std::move(client), clock);
    Supervisor sup({&sink}, clock);
    sink.offer(make_event("c", 1));

    int steps = 0;
    assert(!sup.drain(2000, [&]() { ++steps; }));
    assert(steps == 0);
    assert(fake->opens == 1);
    assert(sink.state() == SinkState::Disconnected);
    clock.advance_ms(60000);
    sup.check();
    assert(fake->opens == 1);
}

int main() {
    reconnect_schedule();
    drain_reconnects_backed_off_sink();
    drain_waits_for_connecting_sink_until_deadline();
    failed_drain_attempt_is_final();
    return 0;
}
