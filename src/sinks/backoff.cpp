#include "backoff.hpp"

#include <algorithm>

namespace udplogd {
uint64_t BackoffSchedule::delay_ms_at(int level) const {
    if (level <= 0) return 0;
    level = std::min(level, opts_.max_level);
    double delay = opts_.initial_ms;
    for (int i = 1; i < level && delay < opts_.max_ms; ++i) delay *= opts_.factor;
    return static_cast<uint64_t>(std::min(delay, static_cast<double>(opts_.max_ms)));
}
}  // namespace udplogd
