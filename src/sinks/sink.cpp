#include "sink.hpp"

#include <algorithm>
#include <utility>

#include "../core/logger.hpp"

namespace udplogd {
const char* sink_state_name(SinkState s) {
    switch (s) {
        case SinkState::Disconnected: return "disconnected";
        case SinkState::Connecting: return "connecting";
        case SinkState::Connected: return "connected";
        case SinkState::Backoff: return "backoff";
    }
    return "?";
}

Sink::Sink(std::string name, const SinkOptions& opts, const Clock& clock)
    : clock_(clock),
      opts_(opts),
      backlog_(opts.backlog_capacity, opts.overflow),
      name_(std::move(name)),
      backoff_(opts.backoff) {}

void Sink::offer(const EventPtr& ev) {
    ++stats_.offered;
    if (!accepts(*ev)) {
        ++stats_.filtered;
        return;
    }
    if (!backlog_.push(ev, clock_.now_ns())) ++stats_.evicted;
    pump();
}

void Sink::connect() {
    if (state_ == SinkState::Connected || state_ == SinkState::Connecting) return;
    ++epoch_;
    state_ = SinkState::Connecting;
    op_started_ns_ = clock_.now_ns();
    log(LogLevel::DEBUG, name_ + ": connecting");
    start_connect(epoch_);
}

void Sink::disconnect() {
    ++epoch_;
    in_flight_ = false;
    close_connection();
    state_ = SinkState::Disconnected;
}

void Sink::poll() {
    uint64_t now = clock_.now_ns();
    uint64_t timeout = ms_to_ns(opts_.request_timeout_ms);
    if (state_ == SinkState::Connecting && now - op_started_ns_ >= timeout) {
        connect_done(epoch_, false, "connect timed out");
    } else if (in_flight_ && now - op_started_ns_ >= timeout) {
        send_done(epoch_, false, "request timed out");
    }
    pump();
}

void Sink::begin_drain() {
    draining_ = true;
    if (!backlog_.empty() && (state_ == SinkState::Disconnected || state_ == SinkState::Backoff)) {
        connect();
    }
    pump();
}

bool Sink::drained() const {
    if (backlog_.empty() && !in_flight_) return true;
    switch (state_) {
        case SinkState::Connecting:
        case SinkState::Connected: return false;
        case SinkState::Disconnected:
        case SinkState::Backoff: return draining_;
    }
    return true;
}

void Sink::connect_done(uint64_t epoch, bool ok, const std::string& error) {
    if (epoch != epoch_ || state_ != SinkState::Connecting) return;
    if (!ok) {
        ++stats_.connect_failures;
        close_connection();
        enter_backoff("connect failed: " + error);
        return;
    }
    state_ = SinkState::Connected;
    backoff_.reset();
    log(LogLevel::INFO, name_ + ": connected, " + std::to_string(backlog_.size()) + " event(s) buffered");
    pump();
}

void Sink::send_done(uint64_t epoch, bool ok, const std::string& error) {
    if (epoch != epoch_ || !in_flight_) return;
    in_flight_ = false;
    if (!ok) {
        fail_in_flight();
        close_connection();
        enter_backoff("send failed: " + error);
        return;
    }
    stats_.sent += backlog_.ack_through(inflight_seq_);
    backoff_.reset();
    pump();
}

void Sink::connection_lost(uint64_t epoch, const std::string& reason) {
    if (epoch != epoch_) return;
    if (state_ == SinkState::Connecting) {
        connect_done(epoch, false, reason);
        return;
    }
    if (state_ != SinkState::Connected) return;
    if (in_flight_) {
        in_flight_ = false;
        fail_in_flight();
    }
    close_connection();
    enter_backoff("connection lost: " + reason);
}

void Sink::mark_connected() {
    state_ = SinkState::Connected;
}

void Sink::fail_in_flight() {
    ++stats_.send_failures;
    backlog_.fail_through(inflight_seq_);
    after_failed_send();
}

void Sink::enter_backoff(const std::string& why) {
    ++epoch_;
    in_flight_ = false;
    backoff_.advance();
    state_ = SinkState::Backoff;
    uint64_t delay = backoff_.delay_ms();
    retry_at_ns_ = clock_.now_ns() + ms_to_ns(static_cast<int64_t>(delay));
    log(LogLevel::WARN, name_ + ": " + why + "; retrying in " + std::to_string(delay) + " ms (attempt " +
                            std::to_string(backoff_.level()) + ")");
}

void Sink::pump() {
    if (pumping_) {
        repump_ = true;
        return;
    }
    pumping_ = true;
    do {
        repump_ = false;
        if (state_ != SinkState::Connected || in_flight_ || backlog_.empty()) break;
        if (!draining_ && !ready_to_send()) break;
        size_t count = std::min(std::max<size_t>(max_batch(), 1), backlog_.size());
        inflight_seq_ = backlog_.at(count - 1).seq;
        in_flight_ = true;
        op_started_ns_ = clock_.now_ns();
        start_send(epoch_, count);
    } while (repump_);
    pumping_ = false;
}
}  // namespace udplogd
