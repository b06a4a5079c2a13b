#include "daemon.hpp"

#include <csignal>
#include <iostream>
#include <string>

#include "core/logger.hpp"
#include "net/amqp_client.hpp"
#include "net/redis_client.hpp"
#include "net/scribe_client.hpp"
#include "sinks/batch_rpc_sink.hpp"
#include "sinks/broker_sink.hpp"
#include "sinks/console_sink.hpp"

namespace udplogd {
namespace {
constexpr int kHousekeepingMs = 100;
constexpr int kLoopTimeoutMs = 200;
// Upper bound for closed connections to finish writing after shutdown.
constexpr int kLingerMs = 1000;
}  // namespace

Daemon::Daemon(const DaemonConfig& cfg) : cfg_(cfg) {}

Daemon::~Daemon() {
    signals_.stop();
    stats_timer_.stop();
    housekeeping_.stop();
    if (listener_) listener_->stop();
    for (auto& s : sinks_) s->disconnect();
}

SinkOptions Daemon::sink_options(size_t capacity) const {
    SinkOptions o;
    o.backlog_capacity = capacity;
    o.overflow = cfg_.overflow;
    o.backoff = cfg_.backoff;
    o.request_timeout_ms = cfg_.request_timeout_ms;
    return o;
}

void Daemon::build_sinks() {
    if (cfg_.verbose) {
        sinks_.push_back(std::make_unique<ConsoleSink>(std::cout, sink_options(SinkOptions().backlog_capacity), clock_));
    }
    if (cfg_.rabbitmq_enabled()) {
        sinks_.push_back(std::make_unique<BrokerSink>("rabbitmq", sink_options(cfg_.rabbitmq_queue_size),
                                                      cfg_.rabbitmq_max_attempts,
                                                      std::make_unique<AmqpClient>(reactor_, cfg_.rabbitmq), clock_));
    }
    if (cfg_.redis_enabled()) {
        sinks_.push_back(std::make_unique<BrokerSink>("redis", sink_options(cfg_.redis_queue_size),
                                                      cfg_.redis_max_attempts,
                                                      std::make_unique<RedisClient>(reactor_, cfg_.redis), clock_));
    }
    if (cfg_.scribe_enabled()) {
        sinks_.push_back(std::make_unique<BatchRpcSink>("scribe", sink_options(cfg_.scribe_queue_size),
                                                        cfg_.scribe_batch,
                                                        std::make_unique<ScribeClient>(reactor_, cfg_.scribe), clock_));
    }
}

bool Daemon::start() {
    std::string err;
    if (!cfg_.validate(err)) {
        log(LogLevel::ERROR, "invalid configuration: " + err);
        return false;
    }
    if (!reactor_.valid()) {
        log(LogLevel::ERROR, "cannot create event loop");
        return false;
    }
    build_sinks();
    if (sinks_.empty()) log(LogLevel::WARN, "no backends configured; events will be discarded");

    std::vector<Sink*> raw;
    for (auto& s : sinks_) raw.push_back(s.get());
    router_ = std::make_unique<Router>(raw);
    supervisor_ = std::make_unique<Supervisor>(raw, clock_);
    listener_ = std::make_unique<UdpListener>(*router_);

    if (!listener_->bind(cfg_.listen_interface, cfg_.listen_port) || !listener_->attach(reactor_)) {
        log(LogLevel::ERROR, "cannot start udplog listener");
        return false;
    }
    if (!housekeeping_.start(reactor_, kHousekeepingMs, [this]() {
            supervisor_->check();
            router_->poll();
        })) {
        log(LogLevel::ERROR, "cannot start housekeeping timer");
        return false;
    }
    if (cfg_.stats_interval_ms > 0 &&
        !stats_timer_.start(reactor_, cfg_.stats_interval_ms, [this]() { log_stats(); })) {
        log(LogLevel::ERROR, "cannot start stats timer");
        return false;
    }
    if (!signals_.start(reactor_, {SIGINT, SIGTERM}, [this](int sig) {
            log(LogLevel::INFO, std::string("received signal ") + std::to_string(sig) + ", shutting down");
            stop_requested_ = true;
        })) {
        log(LogLevel::ERROR, "cannot install signal handling");
        return false;
    }
    for (auto* s : raw) log(LogLevel::INFO, "sink " + s->name() + " configured");
    supervisor_->check();
    return true;
}

void Daemon::run() {
    while (!stop_requested_) reactor_.loop_once(kLoopTimeoutMs);
    shutdown();
}

void Daemon::shutdown() {
    listener_->stop();
    supervisor_->drain(cfg_.drain_timeout_ms, [this]() { reactor_.loop_once(50); });
    housekeeping_.stop();
    stats_timer_.stop();
    signals_.stop();
    // What is left on the loop are closed connections still writing out.
    uint64_t deadline = clock_.now_ns() + ms_to_ns(kLingerMs);
    while (reactor_.watched() > 0 && clock_.now_ns() < deadline) reactor_.loop_once(50);
    log_stats();
}

void Daemon::log_stats() const {
    if (listener_) {
        const auto& ls = listener_->stats();
        log(LogLevel::INFO, "listener received=" + std::to_string(ls.received) +
                                " accepted=" + std::to_string(ls.accepted) +
                                " invalid_category=" + std::to_string(ls.invalid_category) +
                                " invalid_payload=" + std::to_string(ls.invalid_payload) +
                                " receive_errors=" + std::to_string(ls.receive_errors));
    }
    if (router_) {
        log(LogLevel::INFO, "router accepted=" + std::to_string(router_->stats().accepted) +
                                " sink_errors=" + std::to_string(router_->stats().sink_errors));
    }
    for (const auto& s : sinks_) {
        const auto& st = s->stats();
        log(LogLevel::INFO, "sink " + s->name() + " state=" + sink_state_name(s->state()) +
                                " backlog=" + std::to_string(s->backlog().size()) +
                                " offered=" + std::to_string(st.offered) +
                                " filtered=" + std::to_string(st.filtered) +
                                " evicted=" + std::to_string(st.evicted) + " sent=" + std::to_string(st.sent) +
                                " send_failures=" + std::to_string(st.send_failures) +
                                " connect_failures=" + std::to_string(st.connect_failures) +
                                " expired=" + std::to_string(st.expired));
    }
}
}  // namespace udplogd
