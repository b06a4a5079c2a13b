#include "router.hpp"

#include <exception>
#include <utility>

#include "../sinks/sink.hpp"
#include "logger.hpp"

namespace udplogd {
Router::Router(std::vector<Sink*> sinks) : sinks_(std::move(sinks)) {}

void Router::accept(const EventPtr& ev) {
    ++stats_.accepted;
    for (auto* s : sinks_) {
        try {
            s->offer(ev);
        } catch (const std::exception& e) {
            ++stats_.sink_errors;
            log(LogLevel::ERROR, s->name() + ": offer failed: " + e.what());
        }
    }
}

void Router::poll() {
    for (auto* s : sinks_) {
        try {
            s->poll();
        } catch (const std::exception& e) {
            ++stats_.sink_errors;
            log(LogLevel::ERROR, s->name() + ": poll failed: " + e.what());
        }
    }
}
}  // namespace udplogd
