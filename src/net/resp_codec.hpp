#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace udplogd {
// Redis serialization protocol, the subset needed to push to a list.
struct RespReply {
    char type{0};  // '+', '-', ':', '$' or '*'
    std::string text;
    int64_t integer{0};
};

enum class RespParse { Ok, NeedMore, Malformed };

std::string resp_command(const std::vector<std::string>& args);

// Removes one reply from the front of buf. Array replies are skipped over
// as a whole and reported with type '*' and their element count.
RespParse resp_next_reply(std::string& buf, RespReply& out);
}  // namespace udplogd
