#include "console_sink.hpp"

#include "../protocol/codec.hpp"

namespace udplogd {
ConsoleSink::ConsoleSink(std::ostream& out, const SinkOptions& opts, const Clock& clock)
    : Sink("console", opts, clock), out_(out) {
    mark_connected();
}

void ConsoleSink::start_connect(uint64_t epoch) {
    connect_done(epoch, true, "");
}

void ConsoleSink::start_send(uint64_t epoch, size_t) {
    out_ << encode(*backlog_.front().event) << '\n';
    out_.flush();
    send_done(epoch, true, "");
}
}  // namespace udplogd
