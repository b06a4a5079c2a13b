#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace udplogd {
struct LogEntry {
    std::string category;
    std::string message;
};

// Batched log collection RPC: one call carries many entries. Same
// completion rules as BrokerClient.
class CollectorClient {
   public:
    using Completion = std::function<void(bool ok, const std::string& error)>;
    using LostHandler = std::function<void(const std::string& reason)>;

    virtual ~CollectorClient() = default;

    virtual void open(Completion done) = 0;
    virtual void log(const std::vector<LogEntry>& entries, Completion done) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;

    void set_lost_handler(LostHandler h) { on_lost_ = std::move(h); }

   protected:
    LostHandler on_lost_;
};
}  // namespace udplogd
