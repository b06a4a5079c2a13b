#include "amqp_client.hpp"

#include <utility>

#include "../core/logger.hpp"

namespace udplogd {
namespace {
constexpr uint16_t kChannel = 1;

// Connection methods
constexpr uint16_t kStart = 10, kStartOk = 11, kTune = 30, kTuneOk = 31, kOpen = 40, kOpenOk = 41,
                   kClose = 50, kCloseOk = 51, kBlocked = 60, kUnblocked = 61;
// Channel methods
constexpr uint16_t kChannelOpen = 10, kChannelOpenOk = 11, kChannelClose = 40, kChannelCloseOk = 41;
constexpr uint16_t kDeclare = 10, kDeclareOk = 11;
constexpr uint16_t kPublish = 40, kAck = 80, kNack = 120;
constexpr uint16_t kSelect = 10, kSelectOk = 11;

constexpr uint8_t kDurable = 0x02;
constexpr uint8_t kNonPersistent = 1;

bool truthy(const nlohmann::json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_null()) return false;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.empty();
}
}  // namespace

std::string amqp_message_body(const Event& ev) {
    nlohmann::json body = ev.record();
    auto ts = body.find("timestamp");
    if (ts != body.end() && !ts->is_string()) *ts = ts->dump();
    auto is_error = body.find("isError");
    if (is_error != body.end()) *is_error = truthy(*is_error);
    return body.dump();
}

AmqpClient::AmqpClient(Reactor& r, const AmqpOptions& opts) : opts_(opts), stream_(r) {
    stream_.set_data_handler([this](const char* data, size_t len) { on_data(data, len); });
    stream_.set_close_handler([this](const std::string& reason) { lose(reason); });
}

AmqpClient::~AmqpClient() {
    stream_.set_close_handler(nullptr);
    stream_.abort();
}

std::string AmqpClient::describe() const {
    return "amqp://" + opts_.host + ":" + std::to_string(opts_.port) + opts_.vhost + " exchange=" + opts_.exchange;
}

void AmqpClient::open(Completion done) {
    close();
    phase_ = Phase::Handshake;
    open_done_ = std::move(done);
    next_tag_ = 1;
    frame_max_ = kAmqpDefaultFrameMax;
    stream_.connect(opts_.host, opts_.port, [this](bool ok, const std::string& error) {
        if (!ok) {
            lose(error);
            return;
        }
        stream_.send(amqp_protocol_header());
    });
}

void AmqpClient::publish(const Event& ev, Completion done) {
    if (phase_ != Phase::Ready) {
        done(false, "channel not open");
        return;
    }
    std::string body = amqp_message_body(ev);
    AmqpWriter args;
    args.u16(0).shortstr(opts_.exchange).shortstr(ev.category()).octet(0);
    std::string out = amqp_method_frame(kChannel, kAmqpBasic, kPublish, args.bytes());
    out += amqp_header_frame(kChannel, body.size(), "application/json", kNonPersistent);
    out += amqp_body_frames(kChannel, body, frame_max_);

    if (opts_.confirm) {
        pending_.push_back(Pending{next_tag_++, std::move(done)});
        stream_.send(out);
        return;
    }
    if (stream_.send(out)) done(true, "");
}

void AmqpClient::close() {
    bool clean = phase_ == Phase::Ready;
    if (clean) {
        AmqpWriter args;
        args.u16(200).shortstr("shutdown").u16(0).u16(0);
        stream_.send(amqp_method_frame(0, kAmqpConnection, kClose, args.bytes()));
    }
    phase_ = Phase::Closed;
    open_done_ = nullptr;
    pending_.clear();
    in_.clear();
    // From an open channel, buffered publishes and Connection.Close are still
    // written out after the stream is released.
    if (clean)
        stream_.close();
    else
        stream_.abort();
}

void AmqpClient::on_data(const char* data, size_t len) {
    in_.append(data, len);
    while (phase_ != Phase::Closed) {
        AmqpFrame f;
        AmqpParse rc = amqp_next_frame(in_, f);
        if (rc == AmqpParse::NeedMore) return;
        if (rc == AmqpParse::Malformed) {
            lose("malformed frame from broker");
            return;
        }
        handle_frame(f);
    }
}

void AmqpClient::handle_frame(const AmqpFrame& f) {
    if (f.type != kAmqpFrameMethod) return;  // heartbeats, returned content
    AmqpReader r(f.payload);
    uint16_t class_id = 0, method_id = 0;
    if (!r.u16(class_id) || !r.u16(method_id)) {
        lose("truncated method frame");
        return;
    }
    handle_method(class_id, method_id, r);
}

void AmqpClient::handle_method(uint16_t class_id, uint16_t method_id, AmqpReader& r) {
    if (class_id == kAmqpConnection) {
        switch (method_id) {
            case kStart: {
                AmqpWriter args;
                args.table({{"product", "udplogd"}, {"platform", "C++"}})
                    .shortstr("PLAIN")
                    .longstr(std::string(1, '\0') + opts_.username + std::string(1, '\0') + opts_.password)
                    .shortstr("en_US");
                send_method(0, kAmqpConnection, kStartOk, args.bytes());
                return;
            }
            case kTune: {
                uint16_t channel_max = 0, heartbeat = 0;
                uint32_t frame_max = 0;
                if (!r.u16(channel_max) || !r.u32(frame_max) || !r.u16(heartbeat)) {
                    lose("truncated connection.tune");
                    return;
                }
                if (frame_max != 0 && frame_max < frame_max_) frame_max_ = frame_max;
                AmqpWriter tune_ok;
                tune_ok.u16(channel_max).u32(frame_max_).u16(0);
                send_method(0, kAmqpConnection, kTuneOk, tune_ok.bytes());
                AmqpWriter open;
                open.shortstr(opts_.vhost).shortstr("").octet(0);
                send_method(0, kAmqpConnection, kOpen, open.bytes());
                return;
            }
            case kOpenOk: {
                AmqpWriter args;
                args.shortstr("");
                send_method(kChannel, kAmqpChannel, kChannelOpen, args.bytes());
                return;
            }
            case kClose: {
                uint16_t code = 0;
                std::string text;
                r.u16(code);
                r.shortstr(text);
                send_method(0, kAmqpConnection, kCloseOk);
                lose("broker closed connection: " + std::to_string(code) + " " + text);
                return;
            }
            case kBlocked:
                log(LogLevel::WARN, describe() + ": broker blocked publishing");
                return;
            case kUnblocked:
                log(LogLevel::INFO, describe() + ": broker unblocked publishing");
                return;
            default:
                return;
        }
    }
    if (class_id == kAmqpChannel) {
        if (method_id == kChannelOpenOk) {
            if (opts_.exchange.empty()) {
                // The default exchange cannot be declared.
                if (opts_.confirm) {
                    send_method(kChannel, kAmqpConfirm, kSelect, std::string(1, '\0'));
                } else {
                    ready();
                }
                return;
            }
            AmqpWriter args;
            args.u16(0).shortstr(opts_.exchange).shortstr(opts_.exchange_type).octet(kDurable).table({});
            send_method(kChannel, kAmqpExchange, kDeclare, args.bytes());
        } else if (method_id == kChannelClose) {
            uint16_t code = 0;
            std::string text;
            r.u16(code);
            r.shortstr(text);
            send_method(kChannel, kAmqpChannel, kChannelCloseOk);
            lose("broker closed channel: " + std::to_string(code) + " " + text);
        }
        return;
    }
    if (class_id == kAmqpExchange && method_id == kDeclareOk) {
        if (opts_.confirm) {
            send_method(kChannel, kAmqpConfirm, kSelect, std::string(1, '\0'));
        } else {
            ready();
        }
        return;
    }
    if (class_id == kAmqpConfirm && method_id == kSelectOk) {
        ready();
        return;
    }
    if (class_id == kAmqpBasic && (method_id == kAck || method_id == kNack)) {
        uint64_t tag = 0;
        uint8_t bits = 0;
        if (!r.u64(tag) || !r.octet(bits)) {
            lose("truncated basic.ack");
            return;
        }
        handle_ack(tag, (bits & 0x01) != 0, method_id == kAck);
    }
}

void AmqpClient::handle_ack(uint64_t tag, bool multiple, bool ok) {
    const char* error = ok ? "" : "publish rejected by broker";
    if (multiple) {
        while (!pending_.empty() && pending_.front().tag <= tag) {
            Pending p = std::move(pending_.front());
            pending_.pop_front();
            if (p.done) p.done(ok, error);
        }
        return;
    }
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->tag != tag) continue;
        Completion done = std::move(it->done);
        pending_.erase(it);
        if (done) done(ok, error);
        return;
    }
}

void AmqpClient::send_method(uint16_t channel, uint16_t class_id, uint16_t method_id, const std::string& args) {
    stream_.send(amqp_method_frame(channel, class_id, method_id, args));
}

void AmqpClient::ready() {
    phase_ = Phase::Ready;
    auto cb = std::move(open_done_);
    open_done_ = nullptr;
    if (cb) cb(true, "");
}

void AmqpClient::lose(const std::string& reason) {
    if (phase_ == Phase::Closed) return;
    bool opening = phase_ == Phase::Handshake;
    auto cb = std::move(open_done_);
    open_done_ = nullptr;
    pending_.clear();
    in_.clear();
    phase_ = Phase::Closed;
    stream_.abort();
    if (opening) {
        if (cb) cb(false, reason);
    } else if (on_lost_) {
        on_lost_(reason);
    }
}
}  // namespace udplogd
