#pragma once
#include <cstddef>
#include <string>

#include "../net/amqp_client.hpp"
#include "../net/redis_client.hpp"
#include "../net/scribe_client.hpp"
#include "../sinks/backlog.hpp"
#include "../sinks/backoff.hpp"
#include "../sinks/batch_rpc_sink.hpp"

namespace udplogd {
// Everything the daemon needs to start. A backend is enabled by giving it a
// host.
struct DaemonConfig {
    std::string listen_interface{"127.0.0.1"};
    int listen_port{55647};

    AmqpOptions rabbitmq;
    size_t rabbitmq_queue_size{2500};
    int rabbitmq_max_attempts{5};

    ScribeOptions scribe;
    BatchOptions scribe_batch;
    size_t scribe_queue_size{2500};

    RedisOptions redis;
    size_t redis_queue_size{2500};
    int redis_max_attempts{5};

    OverflowPolicy overflow{OverflowPolicy::DropOldest};
    BackoffOptions backoff;
    int request_timeout_ms{10000};
    int drain_timeout_ms{2000};
    int stats_interval_ms{60000};

    bool verbose{false};

    bool rabbitmq_enabled() const { return !rabbitmq.host.empty(); }
    bool scribe_enabled() const { return !scribe.host.empty(); }
    bool redis_enabled() const { return !redis.host.empty(); }

    // False with a description in err when the configuration cannot work.
    bool validate(std::string& err) const;
};

bool parse_overflow_policy(const std::string& s, OverflowPolicy& out);
}  // namespace udplogd
