#pragma once
#include <functional>
#include <string>
#include <utility>

#include "../core/event.hpp"

namespace udplogd {
// Publishes single events to a message broker. Completions run from the
// reactor, possibly before the initiating call returns. After close() no
// completion or lost notification fires for that connection.
class BrokerClient {
   public:
    using Completion = std::function<void(bool ok, const std::string& error)>;
    using LostHandler = std::function<void(const std::string& reason)>;

    virtual ~BrokerClient() = default;

    virtual void open(Completion done) = 0;
    // Completes once the broker accepted the message.
    virtual void publish(const Event& ev, Completion done) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;

    // Fires when an open connection goes away. Publishes still pending at
    // that point are dropped without their completion.
    void set_lost_handler(LostHandler h) { on_lost_ = std::move(h); }

   protected:
    LostHandler on_lost_;
};
}  // namespace udplogd
