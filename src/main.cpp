#include <exception>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "daemon.hpp"

using namespace udplogd;

static void print_usage() {
    std::cerr << "Usage: udplogd [options]\n"
              << "  --udplog-interface <addr>   --udplog-port <port>\n"
              << "  --rabbitmq-host <host>      --rabbitmq-port <port>\n"
              << "  --rabbitmq-vhost <vhost>    --rabbitmq-exchange <name>\n"
              << "  --rabbitmq-user <user>      --rabbitmq-password <password>\n"
              << "  --rabbitmq-queue-size <n>   --rabbitmq-max-attempts <n>   [--rabbitmq-no-confirm]\n"
              << "  --scribe-host <host>        --scribe-port <port>\n"
              << "  --scribe-batch-size <n>     --scribe-flush-ms <ms>\n"
              << "  --scribe-queue-size <n>     --scribe-min-level <level>\n"
              << "  --redis-host <host>         --redis-port <port>   --redis-key <key>\n"
              << "  --redis-queue-size <n>      --redis-max-attempts <n>\n"
              << "  --overflow <drop-oldest|drop-newest>\n"
              << "  --backoff-min-ms <ms>       --backoff-max-ms <ms>\n"
              << "  --backoff-factor <f>        --backoff-max-level <n>\n"
              << "  --request-timeout-ms <ms>   --drain-timeout-ms <ms>   --stats-interval-ms <ms>\n"
              << "  -v, --verbose               echo events to stdout and log at DEBUG\n";
}

// Maps argv onto cfg. Returns false on an unknown flag or a bad value.
static bool parse_args(int argc, char** argv, DaemonConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        if (a == "-v" || a == "--verbose") {
            cfg.verbose = true;
        } else if (a == "--rabbitmq-no-confirm") {
            cfg.rabbitmq.confirm = false;
        } else if (!has_value) {
            std::cerr << "missing value or unknown option: " << a << "\n";
            return false;
        } else if (a == "--udplog-interface") {
            cfg.listen_interface = argv[++i];
        } else if (a == "--udplog-port") {
            cfg.listen_port = std::stoi(argv[++i]);
        } else if (a == "--rabbitmq-host") {
            cfg.rabbitmq.host = argv[++i];
        } else if (a == "--rabbitmq-port") {
            cfg.rabbitmq.port = std::stoi(argv[++i]);
        } else if (a == "--rabbitmq-vhost") {
            cfg.rabbitmq.vhost = argv[++i];
        } else if (a == "--rabbitmq-exchange") {
            cfg.rabbitmq.exchange = argv[++i];
        } else if (a == "--rabbitmq-user") {
            cfg.rabbitmq.username = argv[++i];
        } else if (a == "--rabbitmq-password") {
            cfg.rabbitmq.password = argv[++i];
        } else if (a == "--rabbitmq-queue-size") {
            cfg.rabbitmq_queue_size = std::stoul(argv[++i]);
        } else if (a == "--rabbitmq-max-attempts") {
            cfg.rabbitmq_max_attempts = std::stoi(argv[++i]);
        } else if (a == "--scribe-host") {
            cfg.scribe.host = argv[++i];
        } else if (a == "--scribe-port") {
            cfg.scribe.port = std::stoi(argv[++i]);
        } else if (a == "--scribe-batch-size") {
            cfg.scribe_batch.batch_size = std::stoul(argv[++i]);
        } else if (a == "--scribe-flush-ms") {
            cfg.scribe_batch.flush_interval_ms = std::stoi(argv[++i]);
        } else if (a == "--scribe-queue-size") {
            cfg.scribe_queue_size = std::stoul(argv[++i]);
        } else if (a == "--scribe-min-level") {
            cfg.scribe_batch.min_level = argv[++i];
        } else if (a == "--redis-host") {
            cfg.redis.host = argv[++i];
        } else if (a == "--redis-port") {
            cfg.redis.port = std::stoi(argv[++i]);
        } else if (a == "--redis-key") {
            cfg.redis.key = argv[++i];
        } else if (a == "--redis-queue-size") {
            cfg.redis_queue_size = std::stoul(argv[++i]);
        } else if (a == "--redis-max-attempts") {
            cfg.redis_max_attempts = std::stoi(argv[++i]);
        } else if (a == "--overflow") {
            if (!parse_overflow_policy(argv[++i], cfg.overflow)) {
                std::cerr << "unknown overflow policy: " << argv[i] << "\n";
                return false;
            }
        } else if (a == "--backoff-min-ms") {
            cfg.backoff.initial_ms = std::stoi(argv[++i]);
        } else if (a == "--backoff-max-ms") {
            cfg.backoff.max_ms = std::stoi(argv[++i]);
        } else if (a == "--backoff-factor") {
            cfg.backoff.factor = std::stod(argv[++i]);
        } else if (a == "--backoff-max-level") {
            cfg.backoff.max_level = std::stoi(argv[++i]);
        } else if (a == "--request-timeout-ms") {
            cfg.request_timeout_ms = std::stoi(argv[++i]);
        } else if (a == "--drain-timeout-ms") {
            cfg.drain_timeout_ms = std::stoi(argv[++i]);
        } else if (a == "--stats-interval-ms") {
            cfg.stats_interval_ms = std::stoi(argv[++i]);
        } else {
            std::cerr << "unknown option: " << a << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            print_usage();
            return 0;
        }
    }
    DaemonConfig cfg;
    try {
        if (!parse_args(argc, argv, cfg)) {
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "bad option value: " << e.what() << "\n";
        print_usage();
        return 1;
    }
    if (cfg.verbose) set_log_threshold(LogLevel::DEBUG);

    Daemon daemon(cfg);
    if (!daemon.start()) return 1;
    daemon.run();
    return 0;
}
