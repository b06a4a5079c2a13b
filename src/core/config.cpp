#include "config.hpp"

namespace udplogd {
namespace {
bool valid_port(int port) { return port >= 1 && port <= 65535; }

bool check_port(const char* what, int port, std::string& err) {
    if (valid_port(port)) return true;
    err = std::string(what) + " port out of range: " + std::to_string(port);
    return false;
}
}  // namespace

bool parse_overflow_policy(const std::string& s, OverflowPolicy& out) {
    if (s == "drop-oldest") {
        out = OverflowPolicy::DropOldest;
        return true;
    }
    if (s == "drop-newest") {
        out = OverflowPolicy::DropNewest;
        return true;
    }
    return false;
}

bool DaemonConfig::validate(std::string& err) const {
    if (listen_interface.empty()) {
        err = "no listen interface";
        return false;
    }
    if (!check_port("udplog", listen_port, err)) return false;
    if (rabbitmq_enabled()) {
        if (!check_port("rabbitmq", rabbitmq.port, err)) return false;
        if (rabbitmq_queue_size == 0) {
            err = "rabbitmq queue size must be positive";
            return false;
        }
        if (rabbitmq_max_attempts <= 0) {
            err = "rabbitmq max attempts must be positive";
            return false;
        }
    }
    if (scribe_enabled()) {
        if (!check_port("scribe", scribe.port, err)) return false;
        if (scribe_queue_size == 0) {
            err = "scribe queue size must be positive";
            return false;
        }
        if (scribe_batch.batch_size == 0) {
            err = "scribe batch size must be positive";
            return false;
        }
        if (scribe_batch.flush_interval_ms <= 0) {
            err = "scribe flush interval must be positive";
            return false;
        }
        if (!scribe_batch.min_level.empty() && log_level_rank(scribe_batch.min_level) < 0) {
            err = "unknown scribe minimum level: " + scribe_batch.min_level;
            return false;
        }
    }
    if (redis_enabled()) {
        if (!check_port("redis", redis.port, err)) return false;
        if (redis.key.empty()) {
            err = "redis host given without a key";
            return false;
        }
        if (redis_queue_size == 0) {
            err = "redis queue size must be positive";
            return false;
        }
        if (redis_max_attempts <= 0) {
            err = "redis max attempts must be positive";
            return false;
        }
    }
    if (backoff.initial_ms <= 0) {
        err = "backoff minimum delay must be positive";
        return false;
    }
    if (backoff.max_ms < backoff.initial_ms) {
        err = "backoff maximum delay below the minimum";
        return false;
    }
    if (backoff.factor < 1.0) {
        err = "backoff factor must be at least 1";
        return false;
    }
    if (backoff.max_level <= 0) {
        err = "backoff level cap must be positive";
        return false;
    }
    if (request_timeout_ms <= 0 || drain_timeout_ms < 0 || stats_interval_ms < 0) {
        err = "timeouts must not be negative";
        return false;
    }
    return true;
}
}  // namespace udplogd
