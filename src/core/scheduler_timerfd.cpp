#include "scheduler_timerfd.hpp"

#include <sys/epoll.h>
#include <sys/timerfd.h>

#include <cerrno>
#include <cstring>

#include "logger.hpp"

namespace udplogd {
TimerScheduler::~TimerScheduler() { stop(); }

bool TimerScheduler::start(Reactor& r, int interval_ms, const std::function<void()>& cb) {
    stop();
    if (interval_ms <= 0) {
        log(LogLevel::ERROR, "timer interval must be positive");
        return false;
    }
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        log(LogLevel::ERROR, std::string("timerfd_create failed: ") + std::strerror(errno));
        return false;
    }
    tfd_.reset(fd);
    itimerspec its{};
    its.it_interval.tv_sec = interval_ms / 1000;
    its.it_interval.tv_nsec = (interval_ms % 1000) * 1000000L;
    its.it_value = its.it_interval;
    if (::timerfd_settime(fd, 0, &its, nullptr) < 0) {
        log(LogLevel::ERROR, std::string("timerfd_settime failed: ") + std::strerror(errno));
        tfd_.reset();
        return false;
    }
    cb_ = cb;
    if (!r.add_fd(fd, EPOLLIN, [this](uint32_t) {
            uint64_t expirations = 0;
            if (::read(tfd_.get(), &expirations, sizeof(expirations)) != sizeof(expirations)) return;
            if (cb_) cb_();
        })) {
        tfd_.reset();
        return false;
    }
    reactor_ = &r;
    return true;
}

void TimerScheduler::stop() {
    if (!tfd_) return;
    if (reactor_) reactor_->del_fd(tfd_.get());
    reactor_ = nullptr;
    tfd_.reset();
}
}  // namespace udplogd
