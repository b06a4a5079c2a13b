#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "../src/core/reactor.hpp"
#include "../src/net/redis_client.hpp"
#include "../src/sinks/broker_sink.hpp"

using namespace udplogd;

namespace {
// Accepts one connection and answers every LPUSH with an integer reply.
struct ListServer {
    Reactor& reactor;
    Fd listen_fd;
    Fd conn_fd;
    std::string received;
    int pushes{0};

    explicit ListServer(Reactor& r) : reactor(r) {}

    int start() {
        listen_fd.reset(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0));
        if (!listen_fd) return -1;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::bind(listen_fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) return -1;
        if (::listen(listen_fd.get(), 4) < 0) return -1;
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd.get(), reinterpret_cast<sockaddr*>(&addr), &len);
        reactor.add_fd(listen_fd.get(), EPOLLIN, [this](uint32_t) { on_accept(); });
        return ntohs(addr.sin_port);
    }

    void on_accept() {
        int fd = ::accept4(listen_fd.get(), nullptr, nullptr, SOCK_NONBLOCK);
        if (fd < 0) return;
        conn_fd.reset(fd);
        reactor.add_fd(fd, EPOLLIN, [this](uint32_t) { on_data(); });
    }

    void on_data() {
        char buf[4096];
        ssize_t n = ::recv(conn_fd.get(), buf, sizeof(buf), 0);
        if (n <= 0) return;
        received.append(buf, static_cast<size_t>(n));
        const std::string marker = "$5\r\nLPUSH\r\n";
        size_t pos = 0;
        std::string replies;
        while ((pos = received.find(marker)) != std::string::npos) {
            received.erase(0, pos + marker.size());
            ++pushes;
            replies += ":" + std::to_string(pushes) + "\r\n";
        }
        if (!replies.empty()) ::send(conn_fd.get(), replies.data(), replies.size(), MSG_NOSIGNAL);
    }

    void drop_client() {
        reactor.del_fd(conn_fd.get());
        conn_fd.reset();
    }
};

template <typename Pred>
bool run_until(Reactor& r, Pred done) {
    for (int i = 0; i < 100 && !done(); ++i) r.loop_once(50);
    return done();
}
}  // namespace

int main() {
    Reactor reactor;
    if (!reactor.valid()) return 1;
    ListServer server(reactor);
    int port = server.start();
    if (port <= 0) return 2;

    SteadyClock clock;
    RedisOptions opts;
    opts.host = "127.0.0.1";
    opts.port = port;
    opts.key = "logs";
    BrokerSink sink("redis", SinkOptions(), 5, std::make_unique<RedisClient>(reactor, opts), clock);

    sink.connect();
    if (!run_until(reactor, [&]() { return sink.state() == SinkState::Connected; })) return 3;

    for (int i = 0; i < 3; ++i) {
        nlohmann::json fields = {{"n", i}, {"timestamp", 1.0}};
        sink.offer(std::make_shared<const Event>("app", fields));
    }
    if (!run_until(reactor, [&]() { return sink.stats().sent == 3; })) return 4;
    if (server.pushes != 3) return 5;
    if (!sink.backlog().empty()) return 6;

    // The server going away puts the sink into backoff.
    server.drop_client();
    if (!run_until(reactor, [&]() { return sink.state() == SinkState::Backoff; })) return 7;
    if (sink.backoff_level() != 1) return 8;
    return 0;
}
