#include "backlog.hpp"

#include <utility>

namespace udplogd {
const char* overflow_policy_name(OverflowPolicy p) {
    switch (p) {
        case OverflowPolicy::DropOldest: return "drop-oldest";
        case OverflowPolicy::DropNewest: return "drop-newest";
    }
    return "?";
}

Backlog::Backlog(size_t capacity, OverflowPolicy policy) : capacity_(capacity), policy_(policy) {}

bool Backlog::push(EventPtr ev, uint64_t now_ns) {
    bool dropped = false;
    if (entries_.size() >= capacity_) {
        if (policy_ == OverflowPolicy::DropNewest || capacity_ == 0) return false;
        entries_.pop_front();
        dropped = true;
    }
    entries_.push_back(BacklogEntry{next_seq_++, now_ns, 0, std::move(ev)});
    return !dropped;
}

size_t Backlog::ack_through(uint64_t seq) {
    size_t n = 0;
    while (!entries_.empty() && entries_.front().seq <= seq) {
        entries_.pop_front();
        ++n;
    }
    return n;
}

void Backlog::fail_through(uint64_t seq) {
    for (auto& e : entries_) {
        if (e.seq > seq) break;
        ++e.attempts;
    }
}

size_t Backlog::expire(int max_attempts) {
    size_t n = 0;
    while (!entries_.empty() && entries_.front().attempts >= max_attempts) {
        entries_.pop_front();
        ++n;
    }
    return n;
}
}  // namespace udplogd
