#include "scribe_client.hpp"

#include <utility>

#include "../core/logger.hpp"
#include "scribe_codec.hpp"

namespace udplogd {
ScribeClient::ScribeClient(Reactor& r, const ScribeOptions& opts) : opts_(opts), stream_(r) {
    stream_.set_data_handler([this](const char* data, size_t len) { on_data(data, len); });
    stream_.set_close_handler([this](const std::string& reason) { lose(reason); });
}

ScribeClient::~ScribeClient() {
    stream_.set_close_handler(nullptr);
    stream_.abort();
}

std::string ScribeClient::describe() const {
    return "scribe://" + opts_.host + ":" + std::to_string(opts_.port);
}

void ScribeClient::open(Completion done) {
    close();
    stream_.connect(opts_.host, opts_.port, [this, done](bool ok, const std::string& error) {
        open_ = ok;
        done(ok, error);
    });
}

void ScribeClient::log(const std::vector<LogEntry>& entries, Completion done) {
    if (!open_) {
        done(false, "not connected");
        return;
    }
    int32_t seqid = next_seqid_++;
    pending_[seqid] = std::move(done);
    stream_.send(scribe_encode_log(entries, seqid));
}

void ScribeClient::close() {
    open_ = false;
    pending_.clear();
    in_.clear();
    // Requests still buffered were given up on; they are retried on the
    // next connection, so they must not reach the server from this one.
    stream_.abort();
}

void ScribeClient::on_data(const char* data, size_t len) {
    in_.append(data, len);
    while (open_) {
        ScribeReply reply;
        ScribeParse rc = scribe_next_reply(in_, reply);
        if (rc == ScribeParse::NeedMore) return;
        if (rc == ScribeParse::Malformed) {
            lose("malformed reply");
            return;
        }
        auto it = pending_.find(reply.seqid);
        if (it == pending_.end()) {
            udplogd::log(LogLevel::WARN, describe() + ": unexpected reply seqid " + std::to_string(reply.seqid));
            continue;
        }
        Completion done = std::move(it->second);
        pending_.erase(it);
        if (reply.exception) {
            done(false, "application exception: " + reply.error);
        } else if (!reply.has_result) {
            done(false, "missing result");
        } else if (reply.result == ScribeResult::TryLater) {
            done(false, "TRY_LATER");
        } else {
            done(true, "");
        }
    }
}

void ScribeClient::lose(const std::string& reason) {
    if (!open_) return;
    close();
    if (on_lost_) on_lost_(reason);
}
}  // namespace udplogd
