#include "amqp_codec.hpp"

#include <algorithm>

namespace udplogd {
namespace {
constexpr size_t kFrameOverhead = 8;  // type, channel, size, frame-end

std::string frame(uint8_t type, uint16_t channel, const std::string& payload) {
    AmqpWriter w;
    w.octet(type).u16(channel).u32(static_cast<uint32_t>(payload.size()));
    std::string out = w.bytes();
    out += payload;
    out.push_back(static_cast<char>(kAmqpFrameEnd));
    return out;
}
}  // namespace

AmqpWriter& AmqpWriter::octet(uint8_t v) {
    buf_.push_back(static_cast<char>(v));
    return *this;
}

AmqpWriter& AmqpWriter::u16(uint16_t v) {
    return octet(static_cast<uint8_t>(v >> 8)).octet(static_cast<uint8_t>(v));
}

AmqpWriter& AmqpWriter::u32(uint32_t v) {
    return u16(static_cast<uint16_t>(v >> 16)).u16(static_cast<uint16_t>(v));
}

AmqpWriter& AmqpWriter::u64(uint64_t v) {
    return u32(static_cast<uint32_t>(v >> 32)).u32(static_cast<uint32_t>(v));
}

AmqpWriter& AmqpWriter::shortstr(const std::string& s) {
    size_t n = std::min<size_t>(s.size(), 255);
    octet(static_cast<uint8_t>(n));
    buf_.append(s, 0, n);
    return *this;
}

AmqpWriter& AmqpWriter::longstr(const std::string& s) {
    u32(static_cast<uint32_t>(s.size()));
    buf_ += s;
    return *this;
}

AmqpWriter& AmqpWriter::table(const std::vector<std::pair<std::string, std::string>>& entries) {
    AmqpWriter body;
    for (const auto& kv : entries) body.shortstr(kv.first).octet('S').longstr(kv.second);
    return longstr(body.bytes());
}

bool AmqpReader::octet(uint8_t& v) {
    if (pos_ + 1 > data_.size()) return false;
    v = static_cast<uint8_t>(data_[pos_++]);
    return true;
}

bool AmqpReader::u16(uint16_t& v) {
    uint8_t hi = 0, lo = 0;
    if (!octet(hi) || !octet(lo)) return false;
    v = static_cast<uint16_t>((hi << 8) | lo);
    return true;
}

bool AmqpReader::u32(uint32_t& v) {
    uint16_t hi = 0, lo = 0;
    if (!u16(hi) || !u16(lo)) return false;
    v = (static_cast<uint32_t>(hi) << 16) | lo;
    return true;
}

bool AmqpReader::u64(uint64_t& v) {
    uint32_t hi = 0, lo = 0;
    if (!u32(hi) || !u32(lo)) return false;
    v = (static_cast<uint64_t>(hi) << 32) | lo;
    return true;
}

bool AmqpReader::shortstr(std::string& s) {
    uint8_t n = 0;
    if (!octet(n) || pos_ + n > data_.size()) return false;
    s.assign(data_, pos_, n);
    pos_ += n;
    return true;
}

bool AmqpReader::longstr(std::string& s) {
    uint32_t n = 0;
    if (!u32(n) || pos_ + n > data_.size()) return false;
    s.assign(data_, pos_, n);
    pos_ += n;
    return true;
}

bool AmqpReader::skip_table() {
    uint32_t n = 0;
    if (!u32(n) || pos_ + n > data_.size()) return false;
    pos_ += n;
    return true;
}

std::string amqp_protocol_header() {
    return std::string("AMQP\x00\x00\x09\x01", 8);
}

std::string amqp_method_frame(uint16_t channel, uint16_t class_id, uint16_t method_id,
                              const std::string& args) {
    AmqpWriter w;
    w.u16(class_id).u16(method_id);
    return frame(kAmqpFrameMethod, channel, w.bytes() + args);
}

std::string amqp_header_frame(uint16_t channel, uint64_t body_size, const std::string& content_type,
                              uint8_t delivery_mode) {
    constexpr uint16_t kContentType = 1 << 15;
    constexpr uint16_t kDeliveryMode = 1 << 12;
    AmqpWriter w;
    w.u16(kAmqpBasic).u16(0).u64(body_size);
    w.u16(kContentType | kDeliveryMode).shortstr(content_type).octet(delivery_mode);
    return frame(kAmqpFrameHeader, channel, w.bytes());
}

std::string amqp_body_frames(uint16_t channel, const std::string& body, uint32_t frame_max) {
    size_t chunk = frame_max > kFrameOverhead ? frame_max - kFrameOverhead : body.size();
    if (chunk == 0) chunk = 1;
    std::string out;
    for (size_t pos = 0; pos < body.size(); pos += chunk) {
        out += frame(kAmqpFrameBody, channel, body.substr(pos, chunk));
    }
    return out;
}

AmqpParse amqp_next_frame(std::string& buf, AmqpFrame& out) {
    if (buf.size() < 7) return AmqpParse::NeedMore;
    AmqpReader r(buf);
    uint8_t type = 0;
    uint16_t channel = 0;
    uint32_t size = 0;
    r.octet(type);
    r.u16(channel);
    r.u32(size);
    if (size > (64u << 20)) return AmqpParse::Malformed;
    size_t total = 7 + static_cast<size_t>(size) + 1;
    if (buf.size() < total) return AmqpParse::NeedMore;
    if (static_cast<uint8_t>(buf[total - 1]) != kAmqpFrameEnd) return AmqpParse::Malformed;
    out.type = type;
    out.channel = channel;
    out.payload.assign(buf, 7, size);
    buf.erase(0, total);
    return AmqpParse::Ok;
}
}  // namespace udplogd
