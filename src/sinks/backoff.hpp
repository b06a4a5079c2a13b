#pragma once
#include <cstdint>

namespace udplogd {
struct BackoffOptions {
    int initial_ms{1000};
    int max_ms{30000};
    double factor{2.0};
    int max_level{16};
};

// Capped exponential delay: initial * factor^(level-1), never above max_ms.
class BackoffSchedule {
   public:
    explicit BackoffSchedule(const BackoffOptions& opts) : opts_(opts) {}

    int level() const { return level_; }
    void advance() {
        if (level_ < opts_.max_level) ++level_;
    }
    void reset() { level_ = 0; }

    // Delay for the current level; 0 at level 0.
    uint64_t delay_ms() const { return delay_ms_at(level_); }
    uint64_t delay_ms_at(int level) const;

   private:
    BackoffOptions opts_;
    int level_{0};
};
}  // namespace udplogd
