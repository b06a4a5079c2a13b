#include "reactor.hpp"

#include <sys/epoll.h>

#include <cerrno>
#include <cstring>

#include "logger.hpp"

namespace udplogd {
Reactor::Reactor() : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)) {
    if (!epoll_fd_) log(LogLevel::ERROR, std::string("epoll_create1 failed: ") + std::strerror(errno));
}

bool Reactor::add_fd(int fd, uint32_t events, const FdHandler& cb) {
    struct epoll_event ev {};
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
        log(LogLevel::ERROR, std::string("epoll_ctl add failed: ") + std::strerror(errno));
        return false;
    }
    handlers_[fd] = cb;
    return true;
}

bool Reactor::mod_fd(int fd, uint32_t events) {
    struct epoll_event ev {};
    ev.events = events;
    ev.data.fd = fd;
    return ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_MOD, fd, &ev) == 0;
}

void Reactor::del_fd(int fd) {
    if (handlers_.erase(fd) == 0) return;
    ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
}

int Reactor::loop_once(int timeout_ms) {
    struct epoll_event evs[64];
    int n = ::epoll_wait(epoll_fd_.get(), evs, 64, timeout_ms);
    if (n < 0) {
        if (errno != EINTR) log(LogLevel::WARN, std::string("epoll_wait failed: ") + std::strerror(errno));
        return 0;
    }
    for (int i = 0; i < n; ++i) {
        auto it = handlers_.find(evs[i].data.fd);
        if (it == handlers_.end()) continue;
        // The handler may unregister itself; keep the callable alive for the call.
        FdHandler cb = it->second;
        cb(evs[i].events);
    }
    return n;
}
}  // namespace udplogd
