#include "signal_watcher.hpp"

#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>

#include <cerrno>
#include <cstring>

#include "logger.hpp"

namespace udplogd {
SignalWatcher::~SignalWatcher() { stop(); }

bool SignalWatcher::start(Reactor& r, std::initializer_list<int> signals,
                          const std::function<void(int)>& cb) {
    stop();
    sigset_t mask;
    sigemptyset(&mask);
    for (int s : signals) sigaddset(&mask, s);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        log(LogLevel::ERROR, std::string("sigprocmask failed: ") + std::strerror(errno));
        return false;
    }
    int fd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        log(LogLevel::ERROR, std::string("signalfd failed: ") + std::strerror(errno));
        return false;
    }
    sfd_.reset(fd);
    cb_ = cb;
    if (!r.add_fd(fd, EPOLLIN, [this](uint32_t) { handle(); })) {
        sfd_.reset();
        return false;
    }
    reactor_ = &r;
    return true;
}

void SignalWatcher::stop() {
    if (!sfd_) return;
    if (reactor_) reactor_->del_fd(sfd_.get());
    reactor_ = nullptr;
    sfd_.reset();
}

void SignalWatcher::handle() {
    signalfd_siginfo info{};
    while (::read(sfd_.get(), &info, sizeof(info)) == sizeof(info)) {
        if (cb_) cb_(static_cast<int>(info.ssi_signo));
        if (!sfd_) break;
    }
}
}  // namespace udplogd
