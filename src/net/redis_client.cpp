#include "redis_client.hpp"

#include <utility>

#include "resp_codec.hpp"

namespace udplogd {
RedisClient::RedisClient(Reactor& r, const RedisOptions& opts) : opts_(opts), stream_(r) {
    stream_.set_data_handler([this](const char* data, size_t len) { on_data(data, len); });
    stream_.set_close_handler([this](const std::string& reason) { lose(reason); });
}

RedisClient::~RedisClient() {
    stream_.set_close_handler(nullptr);
    stream_.abort();
}

std::string RedisClient::describe() const {
    return "redis://" + opts_.host + ":" + std::to_string(opts_.port) + " key=" + opts_.key;
}

void RedisClient::open(Completion done) {
    close();
    stream_.connect(opts_.host, opts_.port, [this, done](bool ok, const std::string& error) {
        open_ = ok;
        done(ok, error);
    });
}

void RedisClient::publish(const Event& ev, Completion done) {
    if (!open_) {
        done(false, "not connected");
        return;
    }
    pending_.push_back(std::move(done));
    stream_.send(resp_command({"LPUSH", opts_.key, ev.record().dump()}));
}

void RedisClient::close() {
    open_ = false;
    pending_.clear();
    in_.clear();
    // Requests still buffered were given up on; they are retried on the
    // next connection, so they must not reach the server from this one.
    stream_.abort();
}

void RedisClient::on_data(const char* data, size_t len) {
    in_.append(data, len);
    while (open_) {
        RespReply reply;
        RespParse rc = resp_next_reply(in_, reply);
        if (rc == RespParse::NeedMore) return;
        if (rc == RespParse::Malformed || pending_.empty()) {
            lose(rc == RespParse::Malformed ? "malformed reply" : "unexpected reply");
            return;
        }
        Completion done = std::move(pending_.front());
        pending_.pop_front();
        if (reply.type == '-') {
            done(false, reply.text);
        } else {
            done(true, "");
        }
    }
}

void RedisClient::lose(const std::string& reason) {
    if (!open_) return;
    close();
    if (on_lost_) on_lost_(reason);
}
}  // namespace udplogd
