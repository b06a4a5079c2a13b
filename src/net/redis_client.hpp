#pragma once
#include <deque>
#include <string>

#include "../core/reactor.hpp"
#include "broker_client.hpp"
#include "tcp_stream.hpp"

namespace udplogd {
struct RedisOptions {
    std::string host;
    int port{6379};
    std::string key;
};

// Pushes each event record onto a Redis list with LPUSH. Replies arrive in
// command order, so pending completions are kept in a FIFO.
class RedisClient : public BrokerClient {
   public:
    RedisClient(Reactor& r, const RedisOptions& opts);
    ~RedisClient() override;

    void open(Completion done) override;
    void publish(const Event& ev, Completion done) override;
    void close() override;
    std::string describe() const override;

   private:
    RedisOptions opts_;
    TcpStream stream_;
    bool open_{false};
    std::string in_;
    std::deque<Completion> pending_;

    void on_data(const char* data, size_t len);
    void lose(const std::string& reason);
};
}  // namespace udplogd
