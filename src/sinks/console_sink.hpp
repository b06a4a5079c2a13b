#pragma once
#include <ostream>

#include "sink.hpp"

namespace udplogd {
// Writes every event in wire format to a stream. Always connected.
class ConsoleSink : public Sink {
   public:
    ConsoleSink(std::ostream& out, const SinkOptions& opts, const Clock& clock);

   protected:
    void start_connect(uint64_t epoch) override;
    void start_send(uint64_t epoch, size_t count) override;
    void close_connection() override {}

   private:
    std::ostream& out_;
};
}  // namespace udplogd
