#include "broker_sink.hpp"

#include <utility>

#include "../core/logger.hpp"

namespace udplogd {
BrokerSink::BrokerSink(std::string name, const SinkOptions& opts, int max_attempts,
                       std::unique_ptr<BrokerClient> client, const Clock& clock)
    : Sink(std::move(name), opts, clock), max_attempts_(max_attempts), client_(std::move(client)) {
    client_->set_lost_handler([this](const std::string& reason) { connection_lost(conn_epoch_, reason); });
}

BrokerSink::~BrokerSink() {
    client_->set_lost_handler(nullptr);
    client_->close();
}

void BrokerSink::start_connect(uint64_t epoch) {
    conn_epoch_ = epoch;
    client_->open([this, epoch](bool ok, const std::string& error) { connect_done(epoch, ok, error); });
}

void BrokerSink::start_send(uint64_t epoch, size_t) {
    client_->publish(*backlog_.front().event,
                     [this, epoch](bool ok, const std::string& error) { send_done(epoch, ok, error); });
}

void BrokerSink::close_connection() {
    client_->close();
}

void BrokerSink::after_failed_send() {
    if (max_attempts_ <= 0) return;
    size_t n = backlog_.expire(max_attempts_);
    if (n == 0) return;
    stats_.expired += n;
    log(LogLevel::WARN, name() + ": dropped " + std::to_string(n) + " event(s) after " +
                            std::to_string(max_attempts_) + " failed attempts");
}
}  // namespace udplogd
