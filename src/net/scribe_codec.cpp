#include "scribe_codec.hpp"

namespace udplogd {
namespace {
enum TType : uint8_t {
    T_STOP = 0,
    T_BOOL = 2,
    T_BYTE = 3,
    T_DOUBLE = 4,
    T_I16 = 6,
    T_I32 = 8,
    T_I64 = 10,
    T_STRING = 11,
    T_STRUCT = 12,
    T_MAP = 13,
    T_SET = 14,
    T_LIST = 15,
};

enum MessageType : uint8_t { T_CALL = 1, T_REPLY = 2, T_EXCEPTION = 3 };

constexpr uint32_t kVersion1 = 0x80010000;
constexpr uint32_t kVersionMask = 0xffff0000;
constexpr size_t kMaxFrame = 16u << 20;

class Writer {
   public:
    void byte(uint8_t v) { buf_.push_back(static_cast<char>(v)); }
    void i16(int16_t v) {
        byte(static_cast<uint8_t>(static_cast<uint16_t>(v) >> 8));
        byte(static_cast<uint8_t>(v));
    }
    void i32(int32_t v) {
        uint32_t u = static_cast<uint32_t>(v);
        for (int shift = 24; shift >= 0; shift -= 8) byte(static_cast<uint8_t>(u >> shift));
    }
    void string(const std::string& s) {
        i32(static_cast<int32_t>(s.size()));
        buf_ += s;
    }
    void field(uint8_t type, int16_t id) {
        byte(type);
        i16(id);
    }
    std::string& bytes() { return buf_; }

   private:
    std::string buf_;
};

class Reader {
   public:
    Reader(const std::string& data, size_t pos, size_t end) : data_(data), pos_(pos), end_(end) {}
    bool byte(uint8_t& v) {
        if (pos_ + 1 > end_) return false;
        v = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }
    bool i16(int16_t& v) {
        uint8_t a = 0, b = 0;
        if (!byte(a) || !byte(b)) return false;
        v = static_cast<int16_t>((a << 8) | b);
        return true;
    }
    bool i32(int32_t& v) {
        uint32_t u = 0;
        for (int i = 0; i < 4; ++i) {
            uint8_t b = 0;
            if (!byte(b)) return false;
            u = (u << 8) | b;
        }
        v = static_cast<int32_t>(u);
        return true;
    }
    bool string(std::string& s) {
        int32_t n = 0;
        if (!i32(n) || n < 0 || pos_ + static_cast<size_t>(n) > end_) return false;
        s.assign(data_, pos_, static_cast<size_t>(n));
        pos_ += static_cast<size_t>(n);
        return true;
    }
    bool skip_bytes(size_t n) {
        if (pos_ + n > end_) return false;
        pos_ += n;
        return true;
    }
    bool skip(uint8_t type, int depth = 0);

   private:
    const std::string& data_;
    size_t pos_;
    size_t end_;
};

bool Reader::skip(uint8_t type, int depth) {
    if (depth > 16) return false;
    switch (type) {
        case T_BOOL:
        case T_BYTE: return skip_bytes(1);
        case T_I16: return skip_bytes(2);
        case T_I32: return skip_bytes(4);
        case T_DOUBLE:
        case T_I64: return skip_bytes(8);
        case T_STRING: {
            std::string ignored;
            return string(ignored);
        }
        case T_STRUCT:
            while (true) {
                uint8_t ft = 0;
                int16_t id = 0;
                if (!byte(ft)) return false;
                if (ft == T_STOP) return true;
                if (!i16(id) || !skip(ft, depth + 1)) return false;
            }
        case T_MAP: {
            uint8_t kt = 0, vt = 0;
            int32_t n = 0;
            if (!byte(kt) || !byte(vt) || !i32(n) || n < 0) return false;
            for (int32_t i = 0; i < n; ++i) {
                if (!skip(kt, depth + 1) || !skip(vt, depth + 1)) return false;
            }
            return true;
        }
        case T_SET:
        case T_LIST: {
            uint8_t et = 0;
            int32_t n = 0;
            if (!byte(et) || !i32(n) || n < 0) return false;
            for (int32_t i = 0; i < n; ++i) {
                if (!skip(et, depth + 1)) return false;
            }
            return true;
        }
        default: return false;
    }
}

// Log_result { 0: ResultCode success }
bool read_result(Reader& r, ScribeReply& out) {
    while (true) {
        uint8_t ft = 0;
        int16_t id = 0;
        if (!r.byte(ft)) return false;
        if (ft == T_STOP) return true;
        if (!r.i16(id)) return false;
        if (id == 0 && ft == T_I32) {
            int32_t code = 0;
            if (!r.i32(code)) return false;
            out.has_result = true;
            out.result = static_cast<ScribeResult>(code);
        } else if (!r.skip(ft)) {
            return false;
        }
    }
}

// TApplicationException { 1: string message, 2: i32 type }
bool read_exception(Reader& r, ScribeReply& out) {
    out.exception = true;
    while (true) {
        uint8_t ft = 0;
        int16_t id = 0;
        if (!r.byte(ft)) return false;
        if (ft == T_STOP) return true;
        if (!r.i16(id)) return false;
        if (id == 1 && ft == T_STRING) {
            if (!r.string(out.error)) return false;
        } else if (!r.skip(ft)) {
            return false;
        }
    }
}
}  // namespace

std::string scribe_encode_log(const std::vector<LogEntry>& entries, int32_t seqid) {
    Writer w;
    // Non-strict message header: name, type, seqid.
    w.string("Log");
    w.byte(T_CALL);
    w.i32(seqid);
    // Log_args { 1: list<LogEntry> messages }
    w.field(T_LIST, 1);
    w.byte(T_STRUCT);
    w.i32(static_cast<int32_t>(entries.size()));
    for (const auto& e : entries) {
        w.field(T_STRING, 1);
        w.string(e.category);
        w.field(T_STRING, 2);
        w.string(e.message);
        w.byte(T_STOP);
    }
    w.byte(T_STOP);

    Writer framed;
    framed.i32(static_cast<int32_t>(w.bytes().size()));
    framed.bytes() += w.bytes();
    return framed.bytes();
}

ScribeParse scribe_next_reply(std::string& buf, ScribeReply& out) {
    if (buf.size() < 4) return ScribeParse::NeedMore;
    int32_t frame_len = 0;
    Reader len_reader(buf, 0, 4);
    len_reader.i32(frame_len);
    if (frame_len < 0 || static_cast<size_t>(frame_len) > kMaxFrame) return ScribeParse::Malformed;
    size_t end = 4 + static_cast<size_t>(frame_len);
    if (buf.size() < end) return ScribeParse::NeedMore;

    Reader r(buf, 4, end);
    out = ScribeReply{};
    int32_t first = 0;
    if (!r.i32(first)) return ScribeParse::Malformed;
    uint8_t type = 0;
    std::string name;
    if (first < 0) {
        if ((static_cast<uint32_t>(first) & kVersionMask) != kVersion1) return ScribeParse::Malformed;
        type = static_cast<uint8_t>(first & 0xff);
        if (!r.string(name)) return ScribeParse::Malformed;
    } else {
        if (!r.skip_bytes(static_cast<size_t>(first)) || !r.byte(type)) return ScribeParse::Malformed;
    }
    if (!r.i32(out.seqid)) return ScribeParse::Malformed;

    bool ok = false;
    if (type == T_REPLY) {
        ok = read_result(r, out);
    } else if (type == T_EXCEPTION) {
        ok = read_exception(r, out);
    }
    if (!ok) return ScribeParse::Malformed;
    buf.erase(0, end);
    return ScribeParse::Ok;
}
}  // namespace udplogd
