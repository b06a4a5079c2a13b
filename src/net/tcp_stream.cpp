#include "tcp_stream.hpp"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "../core/logger.hpp"

namespace udplogd {
TcpStream::TcpStream(Reactor& r) : reactor_(r) {}

TcpStream::~TcpStream() {
    abort();
    drop_linger();
}

void TcpStream::connect(const std::string& host, int port, ConnectHandler done) {
    close();
    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_NUMERICSERV;
    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        done(false, "cannot resolve " + host + ": " + ::gai_strerror(rc));
        return;
    }
    int fd = ::socket(res->ai_family, res->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, res->ai_protocol);
    if (fd < 0) {
        ::freeaddrinfo(res);
        done(false, std::string("socket: ") + std::strerror(errno));
        return;
    }
    fd_.reset(fd);
    rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    int err = errno;
    ::freeaddrinfo(res);
    if (rc < 0 && err != EINPROGRESS) {
        fd_.reset();
        done(false, std::string("connect: ") + std::strerror(err));
        return;
    }
    connecting_ = true;
    on_connect_ = std::move(done);
    if (!reactor_.add_fd(fd, EPOLLOUT | EPOLLERR | EPOLLHUP, [this](uint32_t ev) { handle(ev); })) {
        auto cb = std::move(on_connect_);
        close();
        cb(false, "cannot watch socket");
    }
}

bool TcpStream::send(const std::string& bytes) {
    if (!connected_) return false;
    out_ += bytes;
    return flush();
}

void TcpStream::close() {
    if (connected_ && !out_.empty()) start_linger();
    abort();
}

void TcpStream::abort() {
    if (fd_) {
        reactor_.del_fd(fd_.get());
        fd_.reset();
    }
    connecting_ = false;
    connected_ = false;
    out_.clear();
    on_connect_ = nullptr;
}

void TcpStream::handle(uint32_t events) {
    if (connecting_) {
        finish_connect();
        return;
    }
    if (events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
        read_ready();
        if (!fd_) return;
    }
    if (events & EPOLLOUT) flush();
}

void TcpStream::finish_connect() {
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) err = errno;
    auto cb = std::move(on_connect_);
    on_connect_ = nullptr;
    connecting_ = false;
    if (err != 0) {
        close();
        if (cb) cb(false, std::string("connect: ") + std::strerror(err));
        return;
    }
    connected_ = true;
    update_interest();
    if (cb) cb(true, "");
}

void TcpStream::read_ready() {
    char buf[65536];
    while (fd_) {
        ssize_t n = ::recv(fd_.get(), buf, sizeof(buf), 0);
        if (n > 0) {
            if (on_data_) on_data_(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            fail("connection closed by peer");
            return;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) fail(std::string("recv: ") + std::strerror(errno));
        return;
    }
}

bool TcpStream::flush() {
    while (!out_.empty()) {
        ssize_t n = ::send(fd_.get(), out_.data(), out_.size(), MSG_NOSIGNAL);
        if (n > 0) {
            out_.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        fail(std::string("send: ") + std::strerror(errno));
        return false;
    }
    update_interest();
    return true;
}

void TcpStream::update_interest() {
    if (!fd_) return;
    uint32_t events = EPOLLIN | EPOLLERR | EPOLLHUP;
    if (!out_.empty()) events |= EPOLLOUT;
    reactor_.mod_fd(fd_.get(), events);
}

void TcpStream::fail(const std::string& reason) {
    log(LogLevel::DEBUG, "tcp stream failed: " + reason);
    auto cb = on_close_;
    abort();
    if (cb) cb(reason);
}

// Hands the socket and its unsent output to linger_. Only one closed
// connection lingers at a time; an older one is dropped.
void TcpStream::start_linger() {
    drop_linger();
    reactor_.del_fd(fd_.get());
    auto l = std::make_unique<Linger>();
    l->fd = std::move(fd_);
    l->out = std::move(out_);
    out_.clear();
    int fd = l->fd.get();
    linger_ = std::move(l);
    if (!reactor_.add_fd(fd, EPOLLOUT | EPOLLERR | EPOLLHUP, [this](uint32_t ev) { linger_ready(ev); })) {
        linger_.reset();
    }
}

void TcpStream::linger_ready(uint32_t events) {
    if (!linger_) return;
    if (events & (EPOLLERR | EPOLLHUP)) {
        drop_linger();
        return;
    }
    std::string& out = linger_->out;
    while (!out.empty()) {
        ssize_t n = ::send(linger_->fd.get(), out.data(), out.size(), MSG_NOSIGNAL);
        if (n > 0) {
            out.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        log(LogLevel::DEBUG, std::string("tcp stream: dropping unsent output: ") + std::strerror(errno));
        break;
    }
    drop_linger();
}

void TcpStream::drop_linger() {
    if (!linger_) return;
    reactor_.del_fd(linger_->fd.get());
    linger_.reset();
}
}  // namespace udplogd
