#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "../core/event.hpp"
#include "../core/time_utils.hpp"
#include "backlog.hpp"
#include "backoff.hpp"

namespace udplogd {
enum class SinkState { Disconnected, Connecting, Connected, Backoff };

const char* sink_state_name(SinkState s);

struct SinkOptions {
    size_t backlog_capacity{2500};
    OverflowPolicy overflow{OverflowPolicy::DropOldest};
    BackoffOptions backoff;
    int request_timeout_ms{10000};
};

struct SinkStats {
    uint64_t offered{0};
    uint64_t filtered{0};
    uint64_t evicted{0};
    uint64_t sent{0};
    uint64_t send_failures{0};
    uint64_t connect_failures{0};
    uint64_t expired{0};
};

// A downstream destination with its own backlog, connection lifecycle and
// backoff. Subclasses implement the backend specific connect/send/close and
// report completion asynchronously through connect_done()/send_done(),
// tagged with the epoch they were started under. A completion from an
// earlier epoch (a connection that was since closed) is ignored.
//
// At most one delivery is in flight. Entries leave the backlog only once the
// backend acknowledged them.
class Sink {
   public:
    Sink(std::string name, const SinkOptions& opts, const Clock& clock);
    virtual ~Sink() = default;
    Sink(const Sink&) = delete;
    Sink& operator=(const Sink&) = delete;

    // Never blocks: queues the event and starts a delivery if one can go out.
    void offer(const EventPtr& ev);

    void connect();
    void disconnect();

    // Housekeeping: request timeouts and time based flushing.
    void poll();

    // Shutdown: deliver what is buffered regardless of batching thresholds.
    // A sink that is not connected but holds events gets one connect attempt.
    void begin_drain();
    // Nothing left to deliver, or the drain attempt failed.
    bool drained() const;

    const std::string& name() const { return name_; }
    SinkState state() const { return state_; }
    int backoff_level() const { return backoff_.level(); }
    uint64_t retry_at_ns() const { return retry_at_ns_; }
    bool in_flight() const { return in_flight_; }
    const Backlog& backlog() const { return backlog_; }
    const SinkStats& stats() const { return stats_; }

   protected:
    virtual void start_connect(uint64_t epoch) = 0;
    // Deliver the first `count` backlog entries.
    virtual void start_send(uint64_t epoch, size_t count) = 0;
    virtual void close_connection() = 0;

    virtual bool accepts(const Event&) const { return true; }
    virtual size_t max_batch() const { return 1; }
    virtual bool ready_to_send() const { return !backlog_.empty(); }
    virtual void after_failed_send() {}

    void connect_done(uint64_t epoch, bool ok, const std::string& error);
    void send_done(uint64_t epoch, bool ok, const std::string& error);
    void connection_lost(uint64_t epoch, const std::string& reason);
    void mark_connected();

    const Clock& clock_;
    const SinkOptions opts_;
    Backlog backlog_;
    SinkStats stats_;

   private:
    std::string name_;
    SinkState state_{SinkState::Disconnected};
    BackoffSchedule backoff_;
    uint64_t epoch_{0};
    uint64_t retry_at_ns_{0};
    uint64_t op_started_ns_{0};
    uint64_t inflight_seq_{0};
    bool in_flight_{false};
    bool draining_{false};
    bool pumping_{false};
    bool repump_{false};

    void fail_in_flight();
    void enter_backoff(const std::string& why);
    void pump();
};
}  // namespace udplogd
