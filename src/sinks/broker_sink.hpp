#pragma once
#include <memory>
#include <string>

#include "../net/broker_client.hpp"
#include "sink.hpp"

namespace udplogd {
// Publishes events one at a time, in backlog order, through a BrokerClient.
// An event that failed max_attempts deliveries is dropped instead of being
// retried again.
class BrokerSink : public Sink {
   public:
    BrokerSink(std::string name, const SinkOptions& opts, int max_attempts, std::unique_ptr<BrokerClient> client,
               const Clock& clock);
    ~BrokerSink() override;

    BrokerClient& client() { return *client_; }

   protected:
    void start_connect(uint64_t epoch) override;
    void start_send(uint64_t epoch, size_t count) override;
    void close_connection() override;
    void after_failed_send() override;

   private:
    int max_attempts_;
    std::unique_ptr<BrokerClient> client_;
    uint64_t conn_epoch_{0};
};
}  // namespace udplogd
