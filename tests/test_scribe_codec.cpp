#include <cassert>
#include <string>

#include "../src/net/scribe_codec.hpp"

using namespace udplogd;

static std::string be32(uint32_t v) {
    std::string s;
    for (int shift = 24; shift >= 0; shift -= 8) s.push_back(static_cast<char>((v >> shift) & 0xff));
    return s;
}

static std::string framed(const std::string& body) {
    return be32(static_cast<uint32_t>(body.size())) + body;
}

// Strict header, REPLY, Log_result { 0: i32 code }.
static std::string reply(int32_t seqid, int32_t code) {
    std::string b = be32(0x80010002) + be32(3) + "Log" + be32(static_cast<uint32_t>(seqid));
    b += std::string("\x08\x00\x00", 3) + be32(static_cast<uint32_t>(code));
    b.push_back('\0');
    return framed(b);
}

int main() {
    std::string call = scribe_encode_log({{"app", "{\"a\":1}"}}, 7);
    std::string expected;
    expected += be32(3) + "Log";
    expected.push_back('\x01');                               // CALL
    expected += be32(7);                                      // seqid
    expected += std::string("\x0f\x00\x01\x0c", 4) + be32(1);  // list<struct> field 1, one element
    expected += std::string("\x0b\x00\x01", 3) + be32(3) + "app";
    expected += std::string("\x0b\x00\x02", 3) + be32(7) + "{\"a\":1}";
    expected.push_back('\0');  // end of LogEntry
    expected.push_back('\0');  // end of Log_args
    assert(call == framed(expected));

    std::string buf = reply(7, 0) + reply(8, 1);
    ScribeReply r;
    assert(scribe_next_reply(buf, r) == ScribeParse::Ok);
    assert(r.seqid == 7 && r.has_result && r.result == ScribeResult::Ok && !r.exception);
    assert(scribe_next_reply(buf, r) == ScribeParse::Ok);
    assert(r.seqid == 8 && r.result == ScribeResult::TryLater);
    assert(buf.empty());

    // Partial frames wait for more bytes.
    std::string part = reply(9, 0);
    std::string tail = part.substr(10);
    part.resize(10);
    assert(scribe_next_reply(part, r) == ScribeParse::NeedMore);
    part += tail;
    assert(scribe_next_reply(part, r) == ScribeParse::Ok && r.seqid == 9);

    // Application exception: non-strict header, message in field 1.
    std::string ex = be32(3) + "Log";
    ex.push_back('\x03');
    ex += be32(4);
    ex += std::string("\x0b\x00\x01", 3) + be32(4) + "oops";
    ex += std::string("\x08\x00\x02", 3) + be32(6);
    ex.push_back('\0');
    std::string exbuf = framed(ex);
    assert(scribe_next_reply(exbuf, r) == ScribeParse::Ok);
    assert(r.exception && r.seqid == 4 && r.error == "oops" && !r.has_result);

    std::string bad = framed(be32(0x80020002));
    assert(scribe_next_reply(bad, r) == ScribeParse::Malformed);
    return 0;
}
