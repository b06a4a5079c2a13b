#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace udplogd {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Seconds since the epoch with sub-second precision, as carried in event timestamps.
inline double wall_time_seconds() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count() / 1e6;
}

inline uint64_t ms_to_ns(int64_t ms) {
    return static_cast<uint64_t>(ms) * 1000000ULL;
}

// Monotonic time source for timers and backoff. Tests substitute a manual clock.
class Clock {
   public:
    virtual ~Clock() = default;
    virtual uint64_t now_ns() const = 0;
};

class SteadyClock : public Clock {
   public:
    uint64_t now_ns() const override {
        return monotonic_ns();
    }
};
}  // namespace udplogd
