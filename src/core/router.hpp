#pragma once
#include <cstdint>
#include <vector>

#include "event.hpp"

namespace udplogd {
class Sink;

struct RouterStats {
    uint64_t accepted{0};
    uint64_t sink_errors{0};
};

// Fans every accepted event out to all configured sinks. The sinks are
// owned elsewhere and fixed once the router is built.
class Router {
   public:
    explicit Router(std::vector<Sink*> sinks);

    void accept(const EventPtr& ev);
    void poll();

    const std::vector<Sink*>& sinks() const { return sinks_; }
    const RouterStats& stats() const { return stats_; }

   private:
    std::vector<Sink*> sinks_;
    RouterStats stats_;
};
}  // namespace udplogd
