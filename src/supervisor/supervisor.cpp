#include "supervisor.hpp"

#include <utility>

#include "../core/logger.hpp"

namespace udplogd {
Supervisor::Supervisor(std::vector<Sink*> sinks, const Clock& clock) : sinks_(std::move(sinks)), clock_(clock) {
    for (auto* s : sinks_) last_states_.push_back(s->state());
}

void Supervisor::check() {
    report_transitions();
    // Each sink gets exactly one drain attempt; no reconnects after that.
    if (draining_) return;
    uint64_t now = clock_.now_ns();
    for (auto* s : sinks_) {
        bool due = s->state() == SinkState::Disconnected ||
                   (s->state() == SinkState::Backoff && now >= s->retry_at_ns());
        if (!due) continue;
        ++connect_attempts_;
        s->connect();
    }
    report_transitions();
}

bool Supervisor::drain(int timeout_ms, const std::function<void()>& step) {
    draining_ = true;
    for (auto* s : sinks_) s->begin_drain();
    uint64_t deadline = clock_.now_ns() + ms_to_ns(timeout_ms);
    while (!all_drained() && clock_.now_ns() < deadline) step();
    report_transitions();
    bool clean = true;
    for (auto* s : sinks_) {
        size_t left = s->backlog().size();
        if (left > 0) {
            clean = false;
            log(LogLevel::WARN, s->name() + ": shutting down with " + std::to_string(left) +
                                    " undelivered event(s) (" + sink_state_name(s->state()) + ")");
        }
        s->disconnect();
    }
    report_transitions();
    return clean;
}

bool Supervisor::all_drained() const {
    for (auto* s : sinks_) {
        if (!s->drained()) return false;
    }
    return true;
}

void Supervisor::report_transitions() {
    for (size_t i = 0; i < sinks_.size(); ++i) {
        SinkState st = sinks_[i]->state();
        if (st == last_states_[i]) continue;
        std::string msg = sinks_[i]->name() + ": " + sink_state_name(last_states_[i]) + " -> " + sink_state_name(st);
        if (st == SinkState::Backoff) msg += "(" + std::to_string(sinks_[i]->backoff_level()) + ")";
        log(LogLevel::DEBUG, msg);
        last_states_[i] = st;
    }
}
}  // namespace udplogd
