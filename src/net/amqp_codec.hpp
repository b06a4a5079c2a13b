#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace udplogd {
// AMQP 0-9-1 framing.
constexpr uint8_t kAmqpFrameMethod = 1;
constexpr uint8_t kAmqpFrameHeader = 2;
constexpr uint8_t kAmqpFrameBody = 3;
constexpr uint8_t kAmqpFrameHeartbeat = 8;
constexpr uint8_t kAmqpFrameEnd = 0xCE;
constexpr uint32_t kAmqpDefaultFrameMax = 131072;

// class ids
constexpr uint16_t kAmqpConnection = 10;
constexpr uint16_t kAmqpChannel = 20;
constexpr uint16_t kAmqpExchange = 40;
constexpr uint16_t kAmqpBasic = 60;
constexpr uint16_t kAmqpConfirm = 85;

struct AmqpFrame {
    uint8_t type{0};
    uint16_t channel{0};
    std::string payload;
};

enum class AmqpParse { Ok, NeedMore, Malformed };

// Big-endian field encoder for method arguments.
class AmqpWriter {
   public:
    AmqpWriter& octet(uint8_t v);
    AmqpWriter& u16(uint16_t v);
    AmqpWriter& u32(uint32_t v);
    AmqpWriter& u64(uint64_t v);
    AmqpWriter& shortstr(const std::string& s);
    AmqpWriter& longstr(const std::string& s);
    // Field table holding only long string values.
    AmqpWriter& table(const std::vector<std::pair<std::string, std::string>>& entries);
    const std::string& bytes() const { return buf_; }

   private:
    std::string buf_;
};

class AmqpReader {
   public:
    explicit AmqpReader(const std::string& data, size_t pos = 0) : data_(data), pos_(pos) {}
    bool octet(uint8_t& v);
    bool u16(uint16_t& v);
    bool u32(uint32_t& v);
    bool u64(uint64_t& v);
    bool shortstr(std::string& s);
    bool longstr(std::string& s);
    bool skip_table();
    size_t pos() const { return pos_; }

   private:
    const std::string& data_;
    size_t pos_;
};

std::string amqp_protocol_header();
std::string amqp_method_frame(uint16_t channel, uint16_t class_id, uint16_t method_id,
                              const std::string& args = std::string());
// Content header carrying content-type and delivery-mode properties.
std::string amqp_header_frame(uint16_t channel, uint64_t body_size, const std::string& content_type,
                              uint8_t delivery_mode);
// Body split so no frame exceeds frame_max.
std::string amqp_body_frames(uint16_t channel, const std::string& body, uint32_t frame_max);

// Removes one complete frame from the front of buf.
AmqpParse amqp_next_frame(std::string& buf, AmqpFrame& out);
}  // namespace udplogd
