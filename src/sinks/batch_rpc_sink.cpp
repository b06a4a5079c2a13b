#include "batch_rpc_sink.hpp"

#include <utility>
#include <vector>

namespace udplogd {
int log_level_rank(const std::string& level) {
    if (level == "DEBUG") return 10;
    if (level == "INFO") return 20;
    if (level == "WARNING" || level == "WARN") return 30;
    if (level == "ERROR") return 40;
    if (level == "CRITICAL" || level == "FATAL") return 50;
    return -1;
}

BatchRpcSink::BatchRpcSink(std::string name, const SinkOptions& opts, const BatchOptions& batch,
                           std::unique_ptr<CollectorClient> client, const Clock& clock)
    : Sink(std::move(name), opts, clock),
      batch_(batch),
      min_rank_(log_level_rank(batch.min_level)),
      client_(std::move(client)) {
    client_->set_lost_handler([this](const std::string& reason) { connection_lost(conn_epoch_, reason); });
}

BatchRpcSink::~BatchRpcSink() {
    client_->set_lost_handler(nullptr);
    client_->close();
}

bool BatchRpcSink::accepts(const Event& ev) const {
    if (min_rank_ < 0) return true;
    auto it = ev.fields().find("logLevel");
    if (it == ev.fields().end() || !it->is_string()) return true;
    int rank = log_level_rank(it->get<std::string>());
    return rank < 0 || rank >= min_rank_;
}

bool BatchRpcSink::ready_to_send() const {
    if (backlog_.empty()) return false;
    if (backlog_.size() >= batch_.batch_size) return true;
    return clock_.now_ns() - backlog_.front().enqueued_ns >= ms_to_ns(batch_.flush_interval_ms);
}

void BatchRpcSink::start_connect(uint64_t epoch) {
    conn_epoch_ = epoch;
    client_->open([this, epoch](bool ok, const std::string& error) { connect_done(epoch, ok, error); });
}

void BatchRpcSink::start_send(uint64_t epoch, size_t count) {
    std::vector<LogEntry> entries;
    entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const Event& ev = *backlog_.at(i).event;
        entries.push_back(LogEntry{ev.category(), ev.fields().dump()});
    }
    client_->log(entries, [this, epoch](bool ok, const std::string& error) { send_done(epoch, ok, error); });
}

void BatchRpcSink::close_connection() {
    client_->close();
}
}  // namespace udplogd
