#include <cassert>
#include <memory>

#include "../src/sinks/broker_sink.hpp"
#include "fakes.hpp"

using namespace udplogd;
using udplogd_test::FakeBrokerClient;
using udplogd_test::make_event;
using udplogd_test::ManualClock;

static SinkOptions small_options(size_t capacity) {
    SinkOptions o;
    o.backlog_capacity = capacity;
    o.backoff.initial_ms = 1000;
    o.backoff.max_ms = 8000;
    o.request_timeout_ms = 5000;
    return o;
}

// Disconnected with capacity 3: of five offers the last three survive and go
// out in order once connected.
static void overflow_then_reconnect() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    BrokerSink sink("broker", small_options(3), 5, std::move(client), clock);

    for (int i = 1; i <= 5; ++i) sink.offer(make_event("c", i));
    assert(sink.state() == SinkState::Disconnected);
    assert(sink.backlog().size() == 3);
    assert(sink.stats().evicted == 2);
    assert(fake->published.empty());

    sink.connect();
    assert(sink.state() == SinkState::Connected);
    assert(fake->published.size() == 3);
    assert(fake->published[0].fields()["value"] == 3);
    assert(fake->published[1].fields()["value"] == 4);
    assert(fake->published[2].fields()["value"] == 5);
    assert(sink.backlog().empty());
    assert(sink.stats().sent == 3);
}

static void connect_failure_backs_off() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->open_ok = false;
    BrokerSink sink("broker", small_options(10), 5, std::move(client), clock);

    sink.connect();
    assert(sink.state() == SinkState::Backoff);
    assert(sink.backoff_level() == 1);
    assert(sink.retry_at_ns() == clock.now_ns() + ms_to_ns(1000));
    sink.connect();
    assert(sink.backoff_level() == 2);
    assert(sink.retry_at_ns() == clock.now_ns() + ms_to_ns(2000));
    assert(sink.stats().connect_failures == 2);

    // A successful connect resets the level, so the first send failure on
    // the new connection waits the minimum delay again.
    fake->open_ok = true;
    sink.connect();
    assert(sink.state() == SinkState::Connected);
    assert(sink.backoff_level() == 0);
    fake->auto_ack = false;
    sink.offer(make_event("c", 1));
    fake->fail();
    assert(sink.state() == SinkState::Backoff);
    assert(sink.backoff_level() == 1);
    assert(sink.retry_at_ns() == clock.now_ns() + ms_to_ns(1000));
}

// Unacknowledged publishes stay queued and are retried in order after the
// connection drops.
static void lost_connection_retries_in_order() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->auto_ack = false;
    BrokerSink sink("broker", small_options(10), 5, std::move(client), clock);
    sink.connect();

    sink.offer(make_event("c", 1));
    sink.offer(make_event("c", 2));
    assert(sink.in_flight());
    assert(fake->published.size() == 1);
    fake->ack();
    assert(fake->published.size() == 2);

    fake->drop("socket closed");
    assert(sink.state() == SinkState::Backoff);
    assert(sink.backlog().size() == 1);
    assert(sink.backlog().front().attempts == 1);
    assert(sink.stats().send_failures == 1);

    fake->auto_ack = true;
    clock.advance_ms(1000);
    sink.connect();
    assert(fake->published.size() == 3);
    assert(fake->published[2].fields()["value"] == 2);
    assert(sink.backlog().empty());
    assert(sink.stats().sent == 2);
}

static void retry_ceiling_expires_events() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->auto_ack = false;
    BrokerSink sink("broker", small_options(10), 2, std::move(client), clock);
    sink.offer(make_event("c", 1));
    sink.offer(make_event("c", 2));

    sink.connect();
    fake->fail();
    assert(sink.state() == SinkState::Backoff);
    assert(sink.backlog().size() == 2);
    sink.connect();
    fake->fail();
    // The first event hit the ceiling; the second was never tried.
    assert(sink.stats().expired == 1);
    assert(sink.backlog().size() == 1);
    assert(sink.backlog().front().event->fields()["value"] == 2);
}

static void request_timeout_counts_as_failure() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->auto_ack = false;
    BrokerSink sink("broker", small_options(10), 5, std::move(client), clock);
    sink.connect();
    sink.offer(make_event("c", 1));
    clock.advance_ms(4999);
    sink.poll();
    assert(sink.state() == SinkState::Connected);
    clock.advance_ms(1);
    sink.poll();
    assert(sink.state() == SinkState::Backoff);
    assert(sink.stats().send_failures == 1);
    assert(fake->pending.empty());
}

static void disconnect_drops_late_completion() {
    ManualClock clock;
    auto client = std::make_unique<FakeBrokerClient>();
    FakeBrokerClient* fake = client.get();
    fake->auto_ack = false;
    BrokerSink sink("broker", small_options(10), 5, std::move(client), clock);
    sink.connect();
    sink.offer(make_event("c", 1));
    BrokerClient::Completion late = fake->pending.front();
    sink.disconnect();
    assert(sink.state() == SinkState::Disconnected);
    late(true, "");
    assert(sink.stats().sent == 0);
    assert(sink.backlog().size() == 1);
}

int main() {
    overflow_then_reconnect();
    connect_failure_backs_off();
    lost_connection_retries_in_order();
    retry_ceiling_expires_events();
    request_timeout_counts_as_failure();
    disconnect_drops_late_completion();
    return 0;
}
