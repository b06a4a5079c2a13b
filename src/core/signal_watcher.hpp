#pragma once
#include <functional>
#include <initializer_list>

#include "fd.hpp"
#include "reactor.hpp"

namespace udplogd {
// Delivers the given signals through a signalfd on the reactor instead of
// an asynchronous handler. The signals are blocked for the calling thread.
class SignalWatcher {
   public:
    SignalWatcher() = default;
    ~SignalWatcher();
    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start(Reactor& r, std::initializer_list<int> signals, const std::function<void(int)>& cb);
    void stop();

   private:
    Reactor* reactor_{nullptr};
    Fd sfd_;
    std::function<void(int)> cb_;
    void handle();
};
}  // namespace udplogd
