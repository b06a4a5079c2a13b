#include "resp_codec.hpp"

#include <cstdlib>

namespace udplogd {
namespace {
// Parses the reply starting at pos; on success pos points past it.
RespParse parse_at(const std::string& buf, size_t& pos, RespReply& out, int depth) {
    if (depth > 8) return RespParse::Malformed;
    if (pos >= buf.size()) return RespParse::NeedMore;
    auto eol = buf.find("\r\n", pos);
    if (eol == std::string::npos) return RespParse::NeedMore;
    char type = buf[pos];
    std::string line = buf.substr(pos + 1, eol - pos - 1);
    size_t next = eol + 2;
    out = RespReply{};
    out.type = type;
    switch (type) {
        case '+':
        case '-':
            out.text = line;
            pos = next;
            return RespParse::Ok;
        case ':': {
            char* end = nullptr;
            out.integer = std::strtoll(line.c_str(), &end, 10);
            if (line.empty() || *end != '\0') return RespParse::Malformed;
            pos = next;
            return RespParse::Ok;
        }
        case '$': {
            long long len = std::strtoll(line.c_str(), nullptr, 10);
            if (len < 0) {
                pos = next;
                return RespParse::Ok;
            }
            size_t need = next + static_cast<size_t>(len) + 2;
            if (buf.size() < need) return RespParse::NeedMore;
            out.text = buf.substr(next, static_cast<size_t>(len));
            pos = need;
            return RespParse::Ok;
        }
        case '*': {
            long long count = std::strtoll(line.c_str(), nullptr, 10);
            out.integer = count;
            size_t cur = next;
            for (long long i = 0; i < count; ++i) {
                RespReply elem;
                RespParse rc = parse_at(buf, cur, elem, depth + 1);
                if (rc != RespParse::Ok) return rc;
            }
            pos = cur;
            return RespParse::Ok;
        }
        default:
            return RespParse::Malformed;
    }
}
}  // namespace

std::string resp_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a;
        out += "\r\n";
    }
    return out;
}

RespParse resp_next_reply(std::string& buf, RespReply& out) {
    size_t pos = 0;
    RespParse rc = parse_at(buf, pos, out, 0);
    if (rc == RespParse::Ok) buf.erase(0, pos);
    return rc;
}
}  // namespace udplogd
