#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "../core/fd.hpp"
#include "../core/reactor.hpp"
#include "../core/router.hpp"

namespace udplogd {
struct ListenerStats {
    uint64_t received{0};
    uint64_t accepted{0};
    uint64_t invalid_category{0};
    uint64_t invalid_payload{0};
    uint64_t receive_errors{0};
};

// Receives udplog datagrams and hands decoded events to the router.
// Malformed datagrams are counted and dropped.
class UdpListener {
   public:
    using WallClock = std::function<double()>;

    explicit UdpListener(Router& router, WallClock wall_clock = WallClock());
    ~UdpListener();
    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    bool bind(const std::string& host, int port);
    bool attach(Reactor& r);
    void stop();

    // Bound port, useful after binding port 0.
    int local_port() const;

    void handle_datagram(std::string_view data);

    const ListenerStats& stats() const { return stats_; }

   private:
    Router& router_;
    WallClock wall_clock_;
    Fd fd_;
    Reactor* reactor_{nullptr};
    ListenerStats stats_;

    void read_ready();
};
}  // namespace udplogd
