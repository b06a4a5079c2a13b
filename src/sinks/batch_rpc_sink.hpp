#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "../net/collector_client.hpp"
#include "sink.hpp"

namespace udplogd {
struct BatchOptions {
    size_t batch_size{100};
    int flush_interval_ms{2000};
    // Events with a lower logLevel are not shipped. Empty ships everything.
    std::string min_level{"INFO"};
};

// Python logging style rank of a level name, -1 when unknown.
int log_level_rank(const std::string& level);

// Ships the backlog as Log calls of up to batch_size entries. A call goes
// out once batch_size entries are waiting or the oldest one has waited
// flush_interval_ms.
class BatchRpcSink : public Sink {
   public:
    BatchRpcSink(std::string name, const SinkOptions& opts, const BatchOptions& batch,
                 std::unique_ptr<CollectorClient> client, const Clock& clock);
    ~BatchRpcSink() override;

    CollectorClient& client() { return *client_; }

   protected:
    void start_connect(uint64_t epoch) override;
    void start_send(uint64_t epoch, size_t count) override;
    void close_connection() override;
    bool accepts(const Event& ev) const override;
    size_t max_batch() const override { return batch_.batch_size; }
    bool ready_to_send() const override;

   private:
    BatchOptions batch_;
    int min_rank_;
    std::unique_ptr<CollectorClient> client_;
    uint64_t conn_epoch_{0};
};
}  // namespace udplogd
