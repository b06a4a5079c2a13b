#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fd.hpp"

namespace udplogd {
using FdHandler = std::function<void(uint32_t)>;

// epoll based readiness loop. Handlers may add or remove descriptors,
// including their own, while being invoked.
class Reactor {
   public:
    Reactor();
    ~Reactor() = default;
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool valid() const { return static_cast<bool>(epoll_fd_); }
    bool add_fd(int fd, uint32_t events, const FdHandler& cb);
    bool mod_fd(int fd, uint32_t events);
    void del_fd(int fd);
    bool watching(int fd) const { return handlers_.count(fd) != 0; }
    size_t watched() const { return handlers_.size(); }
    int loop_once(int timeout_ms);
    int fd() const { return epoll_fd_.get(); }

   private:
    Fd epoll_fd_;
    std::unordered_map<int, FdHandler> handlers_;
};
}  // namespace udplogd
