#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>

#include "../core/event.hpp"

namespace udplogd {
enum class OverflowPolicy { DropOldest, DropNewest };

const char* overflow_policy_name(OverflowPolicy p);

struct BacklogEntry {
    uint64_t seq;
    uint64_t enqueued_ns;
    int attempts;
    EventPtr event;
};

// Bounded FIFO of events waiting for one sink. Entries stay in place while a
// delivery is in flight and are only removed once acknowledged, so a failed
// delivery is retried from the same position.
class Backlog {
   public:
    Backlog(size_t capacity, OverflowPolicy policy);

    // Returns false when an entry had to be dropped to respect the capacity:
    // the oldest one under DropOldest, the incoming one under DropNewest.
    bool push(EventPtr ev, uint64_t now_ns);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }

    const BacklogEntry& front() const { return entries_.front(); }
    const BacklogEntry& at(size_t i) const { return entries_[i]; }

    // Drops every entry up to and including seq. Entries evicted meanwhile
    // are simply no longer there.
    size_t ack_through(uint64_t seq);

    // Counts one failed delivery for every entry up to and including seq.
    void fail_through(uint64_t seq);

    // Removes leading entries that reached max_attempts. Returns the number removed.
    size_t expire(int max_attempts);

    void clear() { entries_.clear(); }

   private:
    size_t capacity_;
    OverflowPolicy policy_;
    uint64_t next_seq_{1};
    std::deque<BacklogEntry> entries_;
};
}  // namespace udplogd
