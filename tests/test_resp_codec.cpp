#include <cassert>
#include <string>

#include "../src/net/resp_codec.hpp"

using namespace udplogd;

int main() {
    assert(resp_command({"LPUSH", "logs", "{\"a\":1}"}) == "*3\r\n$5\r\nLPUSH\r\n$4\r\nlogs\r\n$7\r\n{\"a\":1}\r\n");

    std::string buf = ":12\r\n-ERR wrong type\r\n+OK\r\n$3\r\nabc\r\n*2\r\n:1\r\n$-1\r\n:";
    RespReply r;
    assert(resp_next_reply(buf, r) == RespParse::Ok);
    assert(r.type == ':' && r.integer == 12);
    assert(resp_next_reply(buf, r) == RespParse::Ok);
    assert(r.type == '-' && r.text == "ERR wrong type");
    assert(resp_next_reply(buf, r) == RespParse::Ok);
    assert(r.type == '+' && r.text == "OK");
    assert(resp_next_reply(buf, r) == RespParse::Ok);
    assert(r.type == '$' && r.text == "abc");
    assert(resp_next_reply(buf, r) == RespParse::Ok);
    assert(r.type == '*' && r.integer == 2);
    assert(resp_next_reply(buf, r) == RespParse::NeedMore);
    buf += "5\r\n";
    assert(resp_next_reply(buf, r) == RespParse::Ok && r.integer == 5);
    assert(buf.empty());

    std::string partial = "$5\r\nab";
    assert(resp_next_reply(partial, r) == RespParse::NeedMore);
    std::string garbage = "?what\r\n";
    assert(resp_next_reply(garbage, r) == RespParse::Malformed);
    return 0;
}
