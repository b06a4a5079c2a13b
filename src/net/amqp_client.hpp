#pragma once
#include <cstdint>
#include <deque>
#include <string>

#include "../core/reactor.hpp"
#include "amqp_codec.hpp"
#include "broker_client.hpp"
#include "tcp_stream.hpp"

namespace udplogd {
struct AmqpOptions {
    std::string host;
    int port{5672};
    std::string vhost{"/"};
    std::string username{"guest"};
    std::string password{"guest"};
    std::string exchange{"logs"};
    std::string exchange_type{"topic"};
    // Wait for publisher confirms. Without them a publish counts as done
    // once handed to the socket; a graceful close still writes out what is
    // buffered, but a lost connection drops it.
    bool confirm{true};
};

// JSON message body: the event record with the timestamp as a string and
// isError forced to a boolean.
std::string amqp_message_body(const Event& ev);

// Minimal AMQP 0-9-1 publisher: one connection, channel 1, a declared
// exchange and optional publisher confirms.
class AmqpClient : public BrokerClient {
   public:
    AmqpClient(Reactor& r, const AmqpOptions& opts);
    ~AmqpClient() override;

    void open(Completion done) override;
    void publish(const Event& ev, Completion done) override;
    void close() override;
    std::string describe() const override;

   private:
    enum class Phase { Closed, Handshake, Ready };

    struct Pending {
        uint64_t tag;
        Completion done;
    };

    AmqpOptions opts_;
    TcpStream stream_;
    Phase phase_{Phase::Closed};
    Completion open_done_;
    std::string in_;
    uint32_t frame_max_{kAmqpDefaultFrameMax};
    uint64_t next_tag_{1};
    std::deque<Pending> pending_;

    void on_data(const char* data, size_t len);
    void handle_frame(const AmqpFrame& f);
    void handle_method(uint16_t class_id, uint16_t method_id, AmqpReader& r);
    void handle_ack(uint64_t tag, bool multiple, bool ok);
    void send_method(uint16_t channel, uint16_t class_id, uint16_t method_id,
                     const std::string& args = std::string());
    void ready();
    void lose(const std::string& reason);
};
}  // namespace udplogd
