#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../core/fd.hpp"
#include "../core/reactor.hpp"

namespace udplogd {
// Non-blocking TCP client connection driven by the reactor. Output is
// buffered and flushed as the socket becomes writable. Handlers run from the
// reactor and may call close(); after close() no handler fires again.
class TcpStream {
   public:
    using ConnectHandler = std::function<void(bool ok, const std::string& error)>;
    using DataHandler = std::function<void(const char* data, size_t len)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    explicit TcpStream(Reactor& r);
    ~TcpStream();
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    // The handler may run before connect() returns when the outcome is
    // known immediately.
    void connect(const std::string& host, int port, ConnectHandler done);
    bool send(const std::string& bytes);
    // Output still buffered is flushed in the background on the old socket
    // before it is closed; the stream itself is free for a new connect().
    void close();
    // Closes without flushing.
    void abort();

    bool connected() const { return connected_; }
    size_t pending_output() const { return out_.size(); }
    // Bytes a closed connection still has to write.
    size_t lingering_output() const { return linger_ ? linger_->out.size() : 0; }

    void set_data_handler(DataHandler h) { on_data_ = std::move(h); }
    void set_close_handler(CloseHandler h) { on_close_ = std::move(h); }

   private:
    struct Linger {
        Fd fd;
        std::string out;
    };

    Reactor& reactor_;
    Fd fd_;
    bool connecting_{false};
    bool connected_{false};
    std::string out_;
    ConnectHandler on_connect_;
    DataHandler on_data_;
    CloseHandler on_close_;
    std::unique_ptr<Linger> linger_;

    void handle(uint32_t events);
    void finish_connect();
    void read_ready();
    bool flush();
    void update_interest();
    void fail(const std::string& reason);
    void start_linger();
    void linger_ready(uint32_t events);
    void drop_linger();
};
}  // namespace udplogd
