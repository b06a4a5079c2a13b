#pragma once
#include <memory>
#include <vector>

#include "core/config.hpp"
#include "core/reactor.hpp"
#include "core/router.hpp"
#include "core/scheduler_timerfd.hpp"
#include "core/signal_watcher.hpp"
#include "core/time_utils.hpp"
#include "listener/udp_listener.hpp"
#include "sinks/sink.hpp"
#include "supervisor/supervisor.hpp"

namespace udplogd {
// Owns and wires every component: reactor, sinks, router, supervisor,
// listener, timers and signal handling.
class Daemon {
   public:
    explicit Daemon(const DaemonConfig& cfg);
    ~Daemon();
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Builds and starts everything. False, with an ERROR logged, on any
    // fatal startup condition.
    bool start();
    // Runs until SIGINT/SIGTERM or request_stop(), then drains and
    // disconnects the sinks.
    void run();
    void request_stop() { stop_requested_ = true; }

    void log_stats() const;

   private:
    DaemonConfig cfg_;
    SteadyClock clock_;
    Reactor reactor_;
    std::vector<std::unique_ptr<Sink>> sinks_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<Supervisor> supervisor_;
    std::unique_ptr<UdpListener> listener_;
    TimerScheduler housekeeping_;
    TimerScheduler stats_timer_;
    SignalWatcher signals_;
    bool stop_requested_{false};

    SinkOptions sink_options(size_t capacity) const;
    void build_sinks();
    void shutdown();
};
}  // namespace udplogd
