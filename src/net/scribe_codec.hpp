#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "collector_client.hpp"

namespace udplogd {
// Scribe's Log call over Thrift's framed transport and binary protocol.
enum class ScribeResult : int32_t { Ok = 0, TryLater = 1 };

struct ScribeReply {
    int32_t seqid{0};
    bool exception{false};
    bool has_result{false};
    ScribeResult result{ScribeResult::Ok};
    std::string error;
};

enum class ScribeParse { Ok, NeedMore, Malformed };

// Complete frame, length prefix included.
std::string scribe_encode_log(const std::vector<LogEntry>& entries, int32_t seqid);

// Removes one reply frame from the front of buf.
ScribeParse scribe_next_reply(std::string& buf, ScribeReply& out);
}  // namespace udplogd
