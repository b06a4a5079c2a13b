#pragma once
#include <cstdint>
#include <functional>
#include <vector>

#include "../core/time_utils.hpp"
#include "../sinks/sink.hpp"

namespace udplogd {
// Decides when each sink (re)connects: immediately when disconnected, once
// the backoff delay has elapsed when backing off.
class Supervisor {
   public:
    Supervisor(std::vector<Sink*> sinks, const Clock& clock);

    void check();

    // Shutdown: lets every sink make its drain attempt, calling step (one
    // event loop turn) until all are drained or timeout_ms has passed, then
    // disconnects every sink. True when nothing had to be dropped.
    bool drain(int timeout_ms, const std::function<void()>& step);

    uint64_t connect_attempts() const { return connect_attempts_; }

   private:
    std::vector<Sink*> sinks_;
    std::vector<SinkState> last_states_;
    const Clock& clock_;
    uint64_t connect_attempts_{0};
    bool draining_{false};

    void report_transitions();
    bool all_drained() const;
};
}  // namespace udplogd
