#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../core/reactor.hpp"
#include "collector_client.hpp"
#include "tcp_stream.hpp"

namespace udplogd {
struct ScribeOptions {
    std::string host;
    int port{1463};
};

class ScribeClient : public CollectorClient {
   public:
    ScribeClient(Reactor& r, const ScribeOptions& opts);
    ~ScribeClient() override;

    void open(Completion done) override;
    void log(const std::vector<LogEntry>& entries, Completion done) override;
    void close() override;
    std::string describe() const override;

   private:
    ScribeOptions opts_;
    TcpStream stream_;
    bool open_{false};
    int32_t next_seqid_{0};
    std::string in_;
    std::map<int32_t, Completion> pending_;

    void on_data(const char* data, size_t len);
    void lose(const std::string& reason);
};
}  // namespace udplogd
