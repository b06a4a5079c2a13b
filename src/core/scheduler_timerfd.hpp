#pragma once
#include <functional>

#include "fd.hpp"
#include "reactor.hpp"

namespace udplogd {
// Periodic timer backed by a timerfd registered on the reactor.
class TimerScheduler {
   public:
    TimerScheduler() = default;
    ~TimerScheduler();
    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    bool start(Reactor& r, int interval_ms, const std::function<void()>& cb);
    void stop();
    bool running() const { return static_cast<bool>(tfd_); }

   private:
    Reactor* reactor_{nullptr};
    Fd tfd_;
    std::function<void()> cb_;
};
}  // namespace udplogd
