#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "../src/core/event.hpp"
#include "../src/core/time_utils.hpp"
#include "../src/net/broker_client.hpp"
#include "../src/net/collector_client.hpp"

namespace udplogd_test {
class ManualClock : public udplogd::Clock {
   public:
    uint64_t now_ns() const override { return now_; }
    void advance_ms(int64_t ms) { now_ += udplogd::ms_to_ns(ms); }

   private:
    uint64_t now_{1000000000ULL};
};

// Broker that records publishes. With auto_ack it completes them at once,
// otherwise they wait in pending until ack()/fail().
class FakeBrokerClient : public udplogd::BrokerClient {
   public:
    bool open_ok{true};
    // When false, open() never completes, like a broker that does not answer.
    bool open_answers{true};
    bool auto_ack{true};
    bool is_open{false};
    int opens{0};
    std::vector<udplogd::Event> published;
    std::deque<Completion> pending;

    void open(Completion done) override {
        ++opens;
        if (!open_answers) return;
        is_open = open_ok;
        done(open_ok, open_ok ? "" : "connection refused");
    }
    void publish(const udplogd::Event& ev, Completion done) override {
        published.push_back(ev);
        if (auto_ack)
            done(true, "");
        else
            pending.push_back(std::move(done));
    }
    void close() override {
        is_open = false;
        pending.clear();
    }
    std::string describe() const override { return "fake broker"; }

    void ack() { complete(true, ""); }
    void fail() { complete(false, "nack"); }
    void drop(const std::string& reason) {
        pending.clear();
        is_open = false;
        if (on_lost_) on_lost_(reason);
    }

   private:
    void complete(bool ok, const std::string& err) {
        Completion c = std::move(pending.front());
        pending.pop_front();
        c(ok, err);
    }
};

class FakeCollectorClient : public udplogd::CollectorClient {
   public:
    bool open_ok{true};
    bool auto_ack{true};
    bool accept_calls{true};
    std::vector<std::vector<udplogd::LogEntry>> calls;

    void open(Completion done) override { done(open_ok, open_ok ? "" : "connection refused"); }
    void log(const std::vector<udplogd::LogEntry>& entries, Completion done) override {
        calls.push_back(entries);
        if (auto_ack) done(accept_calls, accept_calls ? "" : "TRY_LATER");
    }
    void close() override {}
    std::string describe() const override { return "fake collector"; }
};

inline udplogd::EventPtr make_event(const std::string& category, int value) {
    nlohmann::json fields = {{"value", value}, {"timestamp", 1379002018.0}};
    return std::make_shared<const udplogd::Event>(category, fields);
}
}  // namespace udplogd_test
