#include "udp_listener.hpp"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <utility>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"
#include "../protocol/codec.hpp"

namespace udplogd {
namespace {
constexpr size_t kMaxDatagram = 65536;
// Bounds the work done per wakeup so timers and other sockets get a turn.
constexpr int kMaxDatagramsPerWakeup = 256;
}  // namespace

UdpListener::UdpListener(Router& router, WallClock wall_clock)
    : router_(router), wall_clock_(std::move(wall_clock)) {
    if (!wall_clock_) wall_clock_ = wall_time_seconds;
}

UdpListener::~UdpListener() { stop(); }

bool UdpListener::bind(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        log(LogLevel::ERROR, "cannot resolve listen address " + host + ": " + ::gai_strerror(rc));
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, ::freeaddrinfo);
    Fd fd(::socket(res->ai_family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) {
        log(LogLevel::ERROR, std::string("udp socket failed: ") + std::strerror(errno));
        return false;
    }
    int one = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd.get(), res->ai_addr, res->ai_addrlen) < 0) {
        log(LogLevel::ERROR, "cannot bind " + host + ":" + service + ": " + std::strerror(errno));
        return false;
    }
    fd_ = std::move(fd);
    log(LogLevel::INFO, "listening for udplog events on " + host + ":" + std::to_string(local_port()));
    return true;
}

bool UdpListener::attach(Reactor& r) {
    if (!fd_) return false;
    if (!r.add_fd(fd_.get(), EPOLLIN, [this](uint32_t) { read_ready(); })) return false;
    reactor_ = &r;
    return true;
}

void UdpListener::stop() {
    if (reactor_ && fd_) reactor_->del_fd(fd_.get());
    reactor_ = nullptr;
    fd_.reset();
}

int UdpListener::local_port() const {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (!fd_ || ::getsockname(fd_.get(), reinterpret_cast<sockaddr*>(&ss), &len) < 0) return -1;
    char serv[NI_MAXSERV];
    if (::getnameinfo(reinterpret_cast<sockaddr*>(&ss), len, nullptr, 0, serv, sizeof(serv), NI_NUMERICSERV) != 0)
        return -1;
    return std::atoi(serv);
}

void UdpListener::read_ready() {
    static thread_local char buf[kMaxDatagram];
    for (int i = 0; i < kMaxDatagramsPerWakeup && fd_; ++i) {
        ssize_t n = ::recv(fd_.get(), buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EINTR) continue;
            ++stats_.receive_errors;
            log(LogLevel::WARN, std::string("udp recv failed: ") + std::strerror(errno));
            return;
        }
        handle_datagram(std::string_view(buf, static_cast<size_t>(n)));
    }
}

void UdpListener::handle_datagram(std::string_view data) {
    ++stats_.received;
    Event decoded;
    DecodeStatus st = decode(data, decoded);
    if (st != DecodeStatus::Ok) {
        if (st == DecodeStatus::InvalidCategory)
            ++stats_.invalid_category;
        else
            ++stats_.invalid_payload;
        if (log_enabled(LogLevel::DEBUG))
            log(LogLevel::DEBUG, std::string("dropped datagram (") + decode_status_name(st) +
                                     "): " + std::string(data.substr(0, 200)));
        return;
    }
    EventPtr ev;
    if (decoded.has_timestamp()) {
        ev = std::make_shared<const Event>(std::move(decoded));
    } else {
        nlohmann::json fields = decoded.fields();
        fields["timestamp"] = wall_clock_();
        ev = std::make_shared<const Event>(decoded.category(), std::move(fields));
    }
    ++stats_.accepted;
    router_.accept(ev);
}
}  // namespace udplogd
